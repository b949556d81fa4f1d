#pragma once

#include <juce_core/juce_core.h>

#include <memory>
#include <string>

namespace jamroom {

/**
 * @brief Opens the encoded audio behind a track's audioRef
 */
class AudioSourceResolver {
  public:
    virtual ~AudioSourceResolver() = default;

    /**
     * @brief Open a stream positioned at the start of the encoded file
     * @return nullptr if the reference cannot be opened
     */
    virtual std::unique_ptr<juce::InputStream> openAudioSource(const std::string& audioRef) = 0;
};

/**
 * @brief Resolves audio refs as paths relative to a root directory
 *
 * Absolute refs are used as they are. Relative refs that would leave the
 * root ("../") are refused.
 */
class FileAudioSourceResolver : public AudioSourceResolver {
  public:
    explicit FileAudioSourceResolver(juce::File root);

    std::unique_ptr<juce::InputStream> openAudioSource(const std::string& audioRef) override;

    juce::File resolve(const std::string& audioRef) const;

    const juce::File& getRoot() const {
        return root_;
    }

  private:
    juce::File root_;
};

}  // namespace jamroom
