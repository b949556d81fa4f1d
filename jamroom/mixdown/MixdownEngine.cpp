#include "MixdownEngine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "jamroom/core/Config.hpp"

namespace jamroom {

namespace {

constexpr double kMinSampleRate = 8000.0;
constexpr double kMaxSampleRate = 384000.0;

// Extra source samples fed to the interpolator past the last needed one
constexpr int kInterpolatorTail = 8;

juce::int64 toSamples(double seconds, double sampleRate) {
    return static_cast<juce::int64>(std::llround(seconds * sampleRate));
}

}  // namespace

MixdownRequest MixdownRequest::fromConfig(std::vector<TrackRecord> tracks) {
    auto& config = Config::getInstance();
    MixdownRequest request;
    request.tracks = std::move(tracks);
    request.sampleRate = config.getMixdownSampleRate();
    request.bitDepth = config.getMixdownBitDepth();
    request.limiterCeilingDb = config.getLimiterCeilingDb();
    return request;
}

MixdownEngine::MixdownEngine(AudioSourceResolver& resolver) : resolver_(resolver) {
    formatManager_.registerBasicFormats();
}

bool MixdownEngine::isEligible(const TrackRecord& track) {
    return !track.muted && !track.audioRef.empty() && track.durationSeconds > 0.0;
}

void MixdownEngine::applyPan(float& left, float& right, double pan) {
    if (pan == 0.0)
        return;

    pan = juce::jlimit(-1.0, 1.0, pan);
    const float l = left;
    const float r = right;

    if (pan < 0.0) {
        const double theta = (pan + 1.0) * juce::MathConstants<double>::halfPi;
        left = static_cast<float>(l + r * std::cos(theta));
        right = static_cast<float>(r * std::sin(theta));
    } else {
        const double theta = pan * juce::MathConstants<double>::halfPi;
        left = static_cast<float>(l * std::cos(theta));
        right = static_cast<float>(r + l * std::sin(theta));
    }
}

void MixdownEngine::checkCancelled(const CancelCheck& shouldCancel) {
    if (shouldCancel && shouldCancel())
        throw MixdownError(MixdownError::Kind::Cancelled, "Mixdown cancelled");
}

void MixdownEngine::validate(const MixdownRequest& request) const {
    if (!std::isfinite(request.sampleRate) || request.sampleRate < kMinSampleRate ||
        request.sampleRate > kMaxSampleRate)
        throw MixdownError(MixdownError::Kind::InvalidRequest,
                           "Unsupported sample rate: " + std::to_string(request.sampleRate));

    if (request.bitDepth != 16 && request.bitDepth != 24 && request.bitDepth != 32)
        throw MixdownError(MixdownError::Kind::UnsupportedFormat,
                           "Unsupported bit depth: " + std::to_string(request.bitDepth));

    if (!std::isfinite(request.limiterCeilingDb) || request.limiterCeilingDb > 0.0)
        throw MixdownError(MixdownError::Kind::InvalidRequest,
                           "Limiter ceiling must be <= 0 dBFS");

    for (const auto& track : request.tracks) {
        if (!std::isfinite(track.durationSeconds) || track.durationSeconds < 0.0 ||
            !std::isfinite(track.startOffsetSeconds) || track.startOffsetSeconds < 0.0)
            throw MixdownError(MixdownError::Kind::InvalidRequest,
                               "Invalid timing on track " + track.trackId);
        if (!std::isfinite(track.gain) || !std::isfinite(track.pan))
            throw MixdownError(MixdownError::Kind::InvalidRequest,
                               "Invalid gain or pan on track " + track.trackId);
    }
}

MixdownResult MixdownEngine::render(const MixdownRequest& request,
                                    const CancelCheck& shouldCancel) {
    validate(request);

    std::vector<const TrackRecord*> eligible;
    double maxEnd = 0.0;
    for (const auto& track : request.tracks) {
        if (!isEligible(track))
            continue;
        eligible.push_back(&track);
        maxEnd = std::max(maxEnd, track.getEndSeconds());
    }

    MixdownResult result;
    result.sampleRate = request.sampleRate;
    result.bitDepth = request.bitDepth;

    if (eligible.empty()) {
        if (!request.allowSilentPlaceholder)
            throw MixdownError(MixdownError::Kind::EmptyInput, "No active tracks to mix");
        if (!(request.placeholderSeconds > 0.0))
            throw MixdownError(MixdownError::Kind::InvalidRequest,
                               "Placeholder length must be positive");

        const auto length = static_cast<int>(
            std::ceil(request.placeholderSeconds * request.sampleRate));
        result.buffer.setSize(2, length);
        result.buffer.clear();
        result.durationSeconds = request.placeholderSeconds;
        return result;
    }

    const double totalSamples = std::ceil(maxEnd * request.sampleRate);
    if (totalSamples > static_cast<double>(std::numeric_limits<int>::max()))
        throw MixdownError(MixdownError::Kind::InvalidRequest, "Mixdown too long");

    const int totalLength = static_cast<int>(totalSamples);
    result.buffer.setSize(2, totalLength);
    result.buffer.clear();
    result.durationSeconds = maxEnd;

    for (const auto* track : eligible) {
        checkCancelled(shouldCancel);

        const auto start = static_cast<int>(
            std::min<juce::int64>(toSamples(track->startOffsetSeconds, request.sampleRate),
                                  totalLength));
        const auto length = static_cast<int>(std::min<juce::int64>(
            toSamples(track->durationSeconds, request.sampleRate), totalLength - start));
        if (length <= 0)
            continue;

        auto source = decodeTrack(*track, request.sampleRate, length, shouldCancel);

        const auto gain = static_cast<float>(track->gain);
        auto* left = source.getWritePointer(0);
        auto* right = source.getWritePointer(1);
        for (int blockStart = 0; blockStart < length; blockStart += CANCEL_POLL_BLOCK) {
            checkCancelled(shouldCancel);
            const int blockEnd = std::min(length, blockStart + CANCEL_POLL_BLOCK);
            for (int i = blockStart; i < blockEnd; ++i) {
                float l = left[i] * gain;
                float r = right[i] * gain;
                applyPan(l, r, track->pan);
                left[i] = l;
                right[i] = r;
            }
        }

        result.buffer.addFrom(0, start, source, 0, 0, length);
        result.buffer.addFrom(1, start, source, 1, 0, length);
        ++result.numTracksMixed;
    }

    checkCancelled(shouldCancel);

    const float ceiling =
        juce::Decibels::decibelsToGain(static_cast<float>(request.limiterCeilingDb));
    const float peak = result.buffer.getMagnitude(0, totalLength);
    if (peak > ceiling) {
        result.limiterGain = ceiling / peak;
        result.buffer.applyGain(result.limiterGain);
    }

    return result;
}

juce::AudioBuffer<float> MixdownEngine::decodeTrack(const TrackRecord& track, double targetRate,
                                                    int numSamples,
                                                    const CancelCheck& shouldCancel) {
    auto stream = resolver_.openAudioSource(track.audioRef);
    if (stream == nullptr)
        throw MixdownError(MixdownError::Kind::DecodeFailure,
                           "Cannot open audio for track " + track.trackId + ": " +
                               track.audioRef);

    std::unique_ptr<juce::AudioFormatReader> reader(
        formatManager_.createReaderFor(std::move(stream)));
    if (reader == nullptr)
        throw MixdownError(MixdownError::Kind::DecodeFailure,
                           "Unreadable or corrupt audio for track " + track.trackId);

    if (reader->numChannels < 1)
        throw MixdownError(MixdownError::Kind::UnsupportedFormat,
                           "No audio channels in track " + track.trackId);
    if (!(reader->sampleRate > 0.0))
        throw MixdownError(MixdownError::Kind::DecodeFailure,
                           "Invalid sample rate in track " + track.trackId);

    // Source samples covering the track, plus the interpolator's look-ahead
    const double ratio = reader->sampleRate / targetRate;
    const bool resample = std::abs(ratio - 1.0) > 1.0e-9;
    const juce::int64 wanted = resample
                                   ? static_cast<juce::int64>(std::ceil(numSamples * ratio)) +
                                         kInterpolatorTail
                                   : numSamples;
    const auto sourceLength = static_cast<int>(
        std::min<juce::int64>(wanted, std::numeric_limits<int>::max()));
    const auto available =
        static_cast<int>(std::min<juce::int64>(reader->lengthInSamples, sourceLength));

    // Zero-filled, so short files come out padded
    juce::AudioBuffer<float> decoded(2, sourceLength);
    decoded.clear();

    const int sourceChannels = static_cast<int>(std::min<unsigned int>(reader->numChannels, 2));
    for (int pos = 0; pos < available; pos += CANCEL_POLL_BLOCK) {
        checkCancelled(shouldCancel);
        const int count = std::min(CANCEL_POLL_BLOCK, available - pos);
        float* destinations[2] = {decoded.getWritePointer(0, pos), decoded.getWritePointer(1, pos)};
        if (!reader->read(destinations, sourceChannels, pos, count))
            throw MixdownError(MixdownError::Kind::DecodeFailure,
                               "Read error in track " + track.trackId);
    }

    // Mono plays on both sides
    if (sourceChannels == 1)
        decoded.copyFrom(1, 0, decoded, 0, 0, sourceLength);

    if (!resample) {
        decoded.setSize(2, numSamples, true);
        return decoded;
    }

    juce::AudioBuffer<float> output(2, numSamples);
    for (int channel = 0; channel < 2; ++channel) {
        juce::LagrangeInterpolator interpolator;
        interpolator.reset();

        const float* in = decoded.getReadPointer(channel);
        float* out = output.getWritePointer(channel);
        for (int pos = 0; pos < numSamples; pos += CANCEL_POLL_BLOCK) {
            checkCancelled(shouldCancel);
            const int count = std::min(CANCEL_POLL_BLOCK, numSamples - pos);
            in += interpolator.process(ratio, in, out + pos, count);
        }
    }
    return output;
}

std::vector<std::uint8_t> MixdownEngine::encodeWav(const MixdownResult& result) {
    juce::MemoryBlock block;
    {
        auto stream = std::make_unique<juce::MemoryOutputStream>(block, false);
        juce::WavAudioFormat wavFormat;

        JUCE_BEGIN_IGNORE_WARNINGS_MSVC(4996)
        JUCE_BEGIN_IGNORE_WARNINGS_GCC_LIKE("-Wdeprecated-declarations")
        std::unique_ptr<juce::AudioFormatWriter> writer(
            wavFormat.createWriterFor(stream.get(), result.sampleRate,
                                      static_cast<unsigned int>(result.buffer.getNumChannels()),
                                      result.bitDepth, {}, 0));
        JUCE_END_IGNORE_WARNINGS_GCC_LIKE
        JUCE_END_IGNORE_WARNINGS_MSVC

        if (writer == nullptr)
            throw MixdownError(MixdownError::Kind::UnsupportedFormat,
                               "Cannot write WAV at " + std::to_string(result.bitDepth) + " bit");

        // The writer owns the stream from here
        stream.release();

        if (!writer->writeFromAudioSampleBuffer(result.buffer, 0, result.getNumSamples()))
            throw MixdownError(MixdownError::Kind::UnsupportedFormat, "WAV encoding failed");
    }

    auto* data = static_cast<const std::uint8_t*>(block.getData());
    return std::vector<std::uint8_t>(data, data + block.getSize());
}

}  // namespace jamroom
