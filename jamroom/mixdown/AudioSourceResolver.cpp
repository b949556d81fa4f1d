#include "AudioSourceResolver.hpp"

namespace jamroom {

FileAudioSourceResolver::FileAudioSourceResolver(juce::File root) : root_(std::move(root)) {}

juce::File FileAudioSourceResolver::resolve(const std::string& audioRef) const {
    const juce::String ref(audioRef);
    if (ref.isEmpty())
        return {};

    if (juce::File::isAbsolutePath(ref))
        return juce::File(ref);

    auto file = root_.getChildFile(ref);
    if (!file.isAChildOf(root_))
        return {};
    return file;
}

std::unique_ptr<juce::InputStream> FileAudioSourceResolver::openAudioSource(
    const std::string& audioRef) {
    auto file = resolve(audioRef);
    if (file == juce::File() || !file.existsAsFile())
        return nullptr;

    auto stream = file.createInputStream();
    if (stream == nullptr || !stream->openedOk())
        return nullptr;
    return stream;
}

}  // namespace jamroom
