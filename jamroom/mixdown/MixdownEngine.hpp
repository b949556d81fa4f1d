#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_formats/juce_audio_formats.h>

#include <cstdint>
#include <vector>

#include "AudioSourceResolver.hpp"
#include "MixdownTypes.hpp"

namespace jamroom {

/**
 * @brief Renders a set of track snapshots into one stereo buffer
 *
 * Rendering is deterministic: the same request and the same source audio
 * always give bit-identical output. Muted tracks, tracks without audio and
 * zero-length tracks take no part in the signal or the duration. Any track
 * that fails to decode fails the whole mixdown.
 *
 * Signal path per track: decode -> resample to the target rate (4-point
 * Lagrange) -> linear gain -> equal-power stereo pan -> place at
 * startOffsetSeconds. The sum is peak-normalised when it exceeds the
 * limiter ceiling.
 */
class MixdownEngine {
  public:
    // Samples processed between two cancellation checks
    static constexpr int CANCEL_POLL_BLOCK = 32768;

    explicit MixdownEngine(AudioSourceResolver& resolver);

    /**
     * @brief Render a mixdown
     * @throws MixdownError on empty input, undecodable audio, bad parameters
     *         or cancellation
     */
    MixdownResult render(const MixdownRequest& request, const CancelCheck& shouldCancel = {});

    /**
     * @brief Encode a result as a PCM WAV file at its bit depth
     * @throws MixdownError{UnsupportedFormat} if the writer cannot be created
     */
    static std::vector<std::uint8_t> encodeWav(const MixdownResult& result);

    /**
     * @brief Whether a track contributes to a mixdown
     */
    static bool isEligible(const TrackRecord& track);

    /**
     * @brief Stereo balance of Web Audio's StereoPannerNode, in place
     */
    static void applyPan(float& left, float& right, double pan);

  private:
    void validate(const MixdownRequest& request) const;
    juce::AudioBuffer<float> decodeTrack(const TrackRecord& track, double targetRate,
                                         int numSamples, const CancelCheck& shouldCancel);
    static void checkCancelled(const CancelCheck& shouldCancel);

    AudioSourceResolver& resolver_;
    juce::AudioFormatManager formatManager_;
};

}  // namespace jamroom
