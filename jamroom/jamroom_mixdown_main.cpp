/**
 * @file jamroom_mixdown_main.cpp
 * @brief Offline mixdown tool
 *
 * Renders a JSON array of track records to a WAV file, the same way the
 * publish flow does.
 *
 *   jamroom_mixdown --tracks=<tracks.json> --out=<mix.wav>
 *                   [--root=<audio dir>] [--rate=<hz>] [--bits=<16|24|32>]
 *                   [--config=<file>]
 */

#include <juce_core/juce_core.h>

#include <iostream>
#include <nlohmann/json.hpp>
#include <vector>

#include "jamroom/core/Config.hpp"
#include "jamroom/jamroom.hpp"
#include "jamroom/mixdown/AudioSourceResolver.hpp"
#include "jamroom/mixdown/MixdownEngine.hpp"
#include "jamroom/session/PayloadCodec.hpp"

namespace {

std::vector<jamroom::TrackRecord> loadTracks(const juce::File& file) {
    if (!file.existsAsFile())
        throw std::runtime_error("Tracks file not found: " +
                                 file.getFullPathName().toStdString());

    auto json = nlohmann::json::parse(file.loadFileAsString().toStdString());
    if (!json.is_array())
        throw std::runtime_error("Tracks file must hold a JSON array");

    std::vector<jamroom::TrackRecord> tracks;
    for (const auto& item : json)
        tracks.push_back(jamroom::codec::decodeTrackRecord(item));
    return tracks;
}

void printUsage() {
    std::cerr << "Usage: jamroom_mixdown --tracks=<file> --out=<file> [--root=<dir>]"
                 " [--rate=<hz>] [--bits=<16|24|32>] [--config=<file>]"
              << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    juce::ArgumentList args(argc, argv);

    if (!args.containsOption("--tracks") || !args.containsOption("--out")) {
        printUsage();
        return 2;
    }

    if (!jamroom_initialize(args.getValueForOption("--config").toStdString()))
        return 1;

    auto& config = jamroom::Config::getInstance();
    if (args.containsOption("--root"))
        config.setAudioRoot(args.getValueForOption("--root").toStdString());
    if (args.containsOption("--rate"))
        config.setMixdownSampleRate(args.getValueForOption("--rate").getDoubleValue());
    if (args.containsOption("--bits"))
        config.setMixdownBitDepth(args.getValueForOption("--bits").getIntValue());

    auto root = config.getAudioRoot().empty()
                    ? juce::File::getCurrentWorkingDirectory()
                    : juce::File::getCurrentWorkingDirectory().getChildFile(config.getAudioRoot());

    int exitCode = 0;
    try {
        const auto cwd = juce::File::getCurrentWorkingDirectory();
        auto tracksFile = cwd.getChildFile(args.getValueForOption("--tracks"));
        auto outFile = cwd.getChildFile(args.getValueForOption("--out"));

        jamroom::FileAudioSourceResolver resolver(root);
        jamroom::MixdownEngine engine(resolver);

        auto result = engine.render(jamroom::MixdownRequest::fromConfig(loadTracks(tracksFile)));
        auto bytes = jamroom::MixdownEngine::encodeWav(result);

        if (!outFile.replaceWithData(bytes.data(), bytes.size()))
            throw std::runtime_error("Cannot write " + outFile.getFullPathName().toStdString());

        std::cout << "Mixed " << result.numTracksMixed << " tracks, " << result.durationSeconds
                  << "s at " << result.sampleRate << " Hz -> "
                  << outFile.getFullPathName().toStdString() << std::endl;
    } catch (const jamroom::MixdownError& e) {
        std::cerr << "Mixdown failed (" << jamroom::getMixdownErrorKindName(e.getKind())
                  << "): " << e.what() << std::endl;
        exitCode = 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exitCode = 1;
    }

    jamroom_shutdown();
    return exitCode;
}
