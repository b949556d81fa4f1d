#pragma once

#include <juce_audio_basics/juce_audio_basics.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "jamroom/core/errors.hpp"
#include "jamroom/core/model.hpp"

namespace jamroom {

/**
 * @brief Polled during rendering; returning true abandons the mixdown
 */
using CancelCheck = std::function<bool()>;

/**
 * @brief Snapshot of a project's tracks plus the output format
 */
struct MixdownRequest {
    std::vector<TrackRecord> tracks;
    double sampleRate = 44100.0;
    int bitDepth = 16;  // 16, 24 or 32 (float)
    double limiterCeilingDb = -1.0;

    // With no eligible track, render silence instead of failing
    bool allowSilentPlaceholder = false;
    double placeholderSeconds = 1.0;

    /**
     * @brief Request using the mixdown settings of the Config singleton
     */
    static MixdownRequest fromConfig(std::vector<TrackRecord> tracks);
};

/**
 * @brief A complete stereo mixdown
 */
struct MixdownResult {
    juce::AudioBuffer<float> buffer;  // Always 2 channels
    double sampleRate = 44100.0;
    int bitDepth = 16;
    double durationSeconds = 0.0;
    int numTracksMixed = 0;
    float limiterGain = 1.0f;  // 1 when the limiter did not engage

    int getNumSamples() const {
        return buffer.getNumSamples();
    }
};

/**
 * @brief What a background mixdown ended with
 */
struct MixdownOutcome {
    std::optional<MixdownResult> result;
    std::optional<MixdownError::Kind> errorKind;
    std::string errorMessage;

    bool succeeded() const {
        return result.has_value();
    }
    bool wasCancelled() const {
        return errorKind == MixdownError::Kind::Cancelled;
    }
};

}  // namespace jamroom
