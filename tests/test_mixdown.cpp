#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstring>

#include "../jamroom/mixdown/MixdownEngine.hpp"
#include "MockServices.hpp"

using namespace jamroom;
using namespace jamroom::test;

namespace {

constexpr double kRate = 8000.0;

MixdownRequest requestAt(double sampleRate, std::vector<TrackRecord> tracks) {
    MixdownRequest request;
    request.tracks = std::move(tracks);
    request.sampleRate = sampleRate;
    request.bitDepth = 16;
    return request;
}

MixdownError::Kind renderErrorKind(MixdownEngine& engine, const MixdownRequest& request,
                                   const CancelCheck& shouldCancel = {}) {
    try {
        engine.render(request, shouldCancel);
    } catch (const MixdownError& e) {
        return e.getKind();
    }
    FAIL("render did not throw");
    return MixdownError::Kind::InvalidRequest;
}

bool sameSamples(const juce::AudioBuffer<float>& a, const juce::AudioBuffer<float>& b) {
    if (a.getNumChannels() != b.getNumChannels() || a.getNumSamples() != b.getNumSamples())
        return false;
    for (int ch = 0; ch < a.getNumChannels(); ++ch) {
        if (std::memcmp(a.getReadPointer(ch), b.getReadPointer(ch),
                        sizeof(float) * static_cast<size_t>(a.getNumSamples())) != 0)
            return false;
    }
    return true;
}

}  // namespace

TEST_CASE("MixdownEngine - Timeline layout", "[mixdown]") {
    MemoryAudioResolver resolver;
    resolver.add("a.wav", makeWav(makeConstant(1, 80000, 0.25f), kRate, 16));
    resolver.add("b.wav", makeWav(makeConstant(2, 40000, 0.25f), kRate, 16));

    MixdownEngine engine(resolver);

    SECTION("Duration is the latest track end") {
        auto result = engine.render(
            requestAt(kRate, {makeTrack("a", "a.wav", 10.0), makeTrack("b", "b.wav", 5.0, 10.0)}));

        REQUIRE(result.durationSeconds == Catch::Approx(15.0));
        REQUIRE(result.getNumSamples() == 120000);
        REQUIRE(result.buffer.getNumChannels() == 2);
        REQUIRE(result.numTracksMixed == 2);
        REQUIRE(result.limiterGain == 1.0f);

        // Mono source plays on both sides
        REQUIRE(result.buffer.getSample(0, 100) == Catch::Approx(0.25f));
        REQUIRE(result.buffer.getSample(1, 100) == Catch::Approx(0.25f));
        REQUIRE(result.buffer.getSample(0, 100000) == Catch::Approx(0.25f));
    }

    SECTION("Start offset places the track") {
        auto result = engine.render(requestAt(kRate, {makeTrack("b", "b.wav", 1.0, 0.5)}));

        REQUIRE(result.getNumSamples() == 12000);
        REQUIRE(result.buffer.getSample(0, 3999) == 0.0f);
        REQUIRE(result.buffer.getSample(0, 4000) == Catch::Approx(0.25f));
        REQUIRE(result.buffer.getSample(1, 11999) == Catch::Approx(0.25f));
    }

    SECTION("Short source is padded with silence") {
        auto result = engine.render(requestAt(kRate, {makeTrack("b", "b.wav", 8.0)}));

        REQUIRE(result.getNumSamples() == 64000);
        REQUIRE(result.buffer.getSample(0, 39999) == Catch::Approx(0.25f));
        REQUIRE(result.buffer.getSample(0, 40000) == 0.0f);
        REQUIRE(result.buffer.getMagnitude(40000, 24000) == 0.0f);
    }

    SECTION("Gain scales linearly") {
        auto track = makeTrack("a", "a.wav", 1.0);
        track.gain = 0.5;
        auto result = engine.render(requestAt(kRate, {track}));
        REQUIRE(result.buffer.getSample(0, 10) == Catch::Approx(0.125f));
    }
}

TEST_CASE("MixdownEngine - Which tracks take part", "[mixdown]") {
    MemoryAudioResolver resolver;
    resolver.add("a.wav", makeWav(makeConstant(1, 16000, 0.25f), kRate, 16));
    MixdownEngine engine(resolver);

    auto audible = makeTrack("audible", "a.wav", 1.0);
    auto muted = makeTrack("muted", "a.wav", 9.0);
    muted.muted = true;
    auto noAudio = makeTrack("empty", "", 4.0);
    auto zeroLength = makeTrack("zero", "a.wav", 0.0, 20.0);

    REQUIRE(MixdownEngine::isEligible(audible));
    REQUIRE_FALSE(MixdownEngine::isEligible(muted));
    REQUIRE_FALSE(MixdownEngine::isEligible(noAudio));
    REQUIRE_FALSE(MixdownEngine::isEligible(zeroLength));

    SECTION("Excluded tracks do not stretch the mix") {
        auto result = engine.render(requestAt(kRate, {audible, muted, noAudio, zeroLength}));
        REQUIRE(result.durationSeconds == Catch::Approx(1.0));
        REQUIRE(result.numTracksMixed == 1);
        REQUIRE(resolver.opens == 1);
    }

    SECTION("Nothing audible is an error") {
        REQUIRE(renderErrorKind(engine, requestAt(kRate, {muted, noAudio})) ==
                MixdownError::Kind::EmptyInput);
        REQUIRE(renderErrorKind(engine, requestAt(kRate, {})) == MixdownError::Kind::EmptyInput);
    }

    SECTION("Silent placeholder on request") {
        auto request = requestAt(kRate, {muted});
        request.allowSilentPlaceholder = true;
        request.placeholderSeconds = 2.0;

        auto result = engine.render(request);
        REQUIRE(result.numTracksMixed == 0);
        REQUIRE(result.getNumSamples() == 16000);
        REQUIRE(result.buffer.getMagnitude(0, result.getNumSamples()) == 0.0f);
    }
}

TEST_CASE("MixdownEngine - Output is deterministic", "[mixdown]") {
    MemoryAudioResolver resolver;
    resolver.add("sine.wav", makeWav(makeSine(1, 24000, 48000.0, 440.0, 0.6f), 48000.0, 24));
    resolver.add("low.wav", makeWav(makeSine(2, 22050, 44100.0, 110.0, 0.7f), 44100.0, 16));
    MixdownEngine engine(resolver);

    auto sine = makeTrack("sine", "sine.wav", 0.5, 0.1);
    sine.pan = -0.3;
    sine.gain = 0.8;
    auto low = makeTrack("low", "low.wav", 0.5);
    low.pan = 0.6;

    auto request = requestAt(44100.0, {sine, low});
    auto first = engine.render(request);
    auto second = engine.render(request);

    REQUIRE(sameSamples(first.buffer, second.buffer));
    REQUIRE(MixdownEngine::encodeWav(first) == MixdownEngine::encodeWav(second));

    // A fresh engine gives the same bits too
    MixdownEngine other(resolver);
    REQUIRE(sameSamples(first.buffer, other.render(request).buffer));
}

TEST_CASE("MixdownEngine - Stereo pan", "[mixdown]") {
    SECTION("Centre is untouched") {
        float l = 0.3f, r = -0.7f;
        MixdownEngine::applyPan(l, r, 0.0);
        REQUIRE(l == 0.3f);
        REQUIRE(r == -0.7f);
    }

    SECTION("Hard right folds left into right") {
        float l = 1.0f, r = 1.0f;
        MixdownEngine::applyPan(l, r, 1.0);
        REQUIRE(l == Catch::Approx(0.0f).margin(1e-6));
        REQUIRE(r == Catch::Approx(2.0f));
    }

    SECTION("Hard left folds right into left") {
        float l = 1.0f, r = 1.0f;
        MixdownEngine::applyPan(l, r, -1.0);
        REQUIRE(l == Catch::Approx(2.0f));
        REQUIRE(r == Catch::Approx(0.0f).margin(1e-6));
    }

    SECTION("Half right") {
        float l = 1.0f, r = 1.0f;
        MixdownEngine::applyPan(l, r, 0.5);
        REQUIRE(l == Catch::Approx(0.70710678f));
        REQUIRE(r == Catch::Approx(1.70710678f));
    }

    SECTION("Out of range pan is clamped") {
        float l = 1.0f, r = 0.0f;
        MixdownEngine::applyPan(l, r, 3.0);
        REQUIRE(l == Catch::Approx(0.0f).margin(1e-6));
        REQUIRE(r == Catch::Approx(1.0f));
    }

    SECTION("Pan is applied per track") {
        MemoryAudioResolver resolver;
        resolver.add("a.wav", makeWav(makeConstant(1, 8000, 0.25f), kRate, 16));
        MixdownEngine engine(resolver);

        auto track = makeTrack("a", "a.wav", 1.0);
        track.pan = -1.0;
        auto result = engine.render(requestAt(kRate, {track}));
        REQUIRE(result.buffer.getSample(0, 50) == Catch::Approx(0.5f));
        REQUIRE(result.buffer.getSample(1, 50) == Catch::Approx(0.0f).margin(1e-6));
    }
}

TEST_CASE("MixdownEngine - Limiter", "[mixdown]") {
    MemoryAudioResolver resolver;
    resolver.add("half.wav", makeWav(makeConstant(2, 8000, 0.5f), kRate, 24));
    MixdownEngine engine(resolver);

    SECTION("Quiet mixes are left alone") {
        auto result = engine.render(requestAt(kRate, {makeTrack("a", "half.wav", 1.0)}));
        REQUIRE(result.limiterGain == 1.0f);
        REQUIRE(result.buffer.getSample(0, 0) == Catch::Approx(0.5f));
    }

    SECTION("Hot mixes are brought down to the ceiling") {
        auto request = requestAt(kRate, {makeTrack("a", "half.wav", 1.0),
                                         makeTrack("b", "half.wav", 1.0)});
        auto result = engine.render(request);

        const float ceiling = juce::Decibels::decibelsToGain(-1.0f);
        REQUIRE(result.limiterGain < 1.0f);
        REQUIRE(result.buffer.getMagnitude(0, result.getNumSamples()) ==
                Catch::Approx(ceiling));
    }

    SECTION("Custom ceiling") {
        auto request = requestAt(kRate, {makeTrack("a", "half.wav", 1.0)});
        request.limiterCeilingDb = -12.0;
        auto result = engine.render(request);
        REQUIRE(result.buffer.getMagnitude(0, result.getNumSamples()) ==
                Catch::Approx(juce::Decibels::decibelsToGain(-12.0f)));
    }
}

TEST_CASE("MixdownEngine - Resampling", "[mixdown]") {
    MemoryAudioResolver resolver;
    resolver.add("48k.wav", makeWav(makeConstant(2, 48000, 0.5f), 48000.0, 24));
    MixdownEngine engine(resolver);

    auto result = engine.render(requestAt(44100.0, {makeTrack("a", "48k.wav", 1.0)}));

    REQUIRE(result.sampleRate == 44100.0);
    REQUIRE(result.getNumSamples() == 44100);
    REQUIRE(result.buffer.getSample(0, 22050) == Catch::Approx(0.5f).margin(1e-3));
    REQUIRE(result.buffer.getSample(1, 40000) == Catch::Approx(0.5f).margin(1e-3));
}

TEST_CASE("MixdownEngine - Failures", "[mixdown][errors]") {
    MemoryAudioResolver resolver;
    resolver.add("good.wav", makeWav(makeConstant(1, 8000, 0.25f), kRate, 16));

    juce::MemoryBlock junk;
    for (int i = 0; i < 512; ++i)
        junk.append("not audio ", 10);
    resolver.add("junk.wav", junk);

    MixdownEngine engine(resolver);

    SECTION("Corrupt source fails the whole mixdown") {
        auto request = requestAt(kRate, {makeTrack("good", "good.wav", 1.0),
                                         makeTrack("bad", "junk.wav", 1.0)});
        REQUIRE(renderErrorKind(engine, request) == MixdownError::Kind::DecodeFailure);
    }

    SECTION("Missing source") {
        auto request = requestAt(kRate, {makeTrack("gone", "missing.wav", 1.0)});
        REQUIRE(renderErrorKind(engine, request) == MixdownError::Kind::DecodeFailure);
    }

    SECTION("Bad output parameters") {
        auto request = requestAt(kRate, {makeTrack("good", "good.wav", 1.0)});

        request.sampleRate = 1000.0;
        REQUIRE(renderErrorKind(engine, request) == MixdownError::Kind::InvalidRequest);

        request.sampleRate = kRate;
        request.bitDepth = 12;
        REQUIRE(renderErrorKind(engine, request) == MixdownError::Kind::UnsupportedFormat);

        request.bitDepth = 16;
        request.limiterCeilingDb = 3.0;
        REQUIRE(renderErrorKind(engine, request) == MixdownError::Kind::InvalidRequest);
    }

    SECTION("Bad track timing") {
        auto track = makeTrack("good", "good.wav", 1.0);
        track.startOffsetSeconds = -1.0;
        REQUIRE(renderErrorKind(engine, requestAt(kRate, {track})) ==
                MixdownError::Kind::InvalidRequest);
    }
}

TEST_CASE("MixdownEngine - Cancellation", "[mixdown]") {
    MemoryAudioResolver resolver;
    resolver.add("long.wav", makeWav(makeConstant(1, 160000, 0.25f), kRate, 16));
    MixdownEngine engine(resolver);
    auto request = requestAt(kRate, {makeTrack("a", "long.wav", 20.0)});

    SECTION("Cancelled before the first block") {
        REQUIRE(renderErrorKind(engine, request, [] { return true; }) ==
                MixdownError::Kind::Cancelled);
    }

    SECTION("Cancelled part way through") {
        int polls = 0;
        auto kind = renderErrorKind(engine, request, [&polls] { return ++polls > 3; });
        REQUIRE(kind == MixdownError::Kind::Cancelled);
        REQUIRE(polls == 4);
    }

    SECTION("A check that never fires changes nothing") {
        auto withCheck = engine.render(request, [] { return false; });
        auto without = engine.render(request);
        REQUIRE(sameSamples(withCheck.buffer, without.buffer));
    }
}

TEST_CASE("MixdownEngine - WAV encoding", "[mixdown]") {
    MemoryAudioResolver resolver;
    resolver.add("a.wav", makeWav(makeConstant(1, 8000, 0.25f), kRate, 16));
    MixdownEngine engine(resolver);

    for (int bits : {16, 24}) {
        auto request = requestAt(kRate, {makeTrack("a", "a.wav", 1.0)});
        request.bitDepth = bits;
        auto result = engine.render(request);
        auto bytes = MixdownEngine::encodeWav(result);
        REQUIRE(bytes.size() > 44);

        juce::WavAudioFormat wavFormat;
        std::unique_ptr<juce::AudioFormatReader> reader(wavFormat.createReaderFor(
            new juce::MemoryInputStream(bytes.data(), bytes.size(), false), true));
        REQUIRE(reader != nullptr);
        REQUIRE(reader->sampleRate == kRate);
        REQUIRE(static_cast<int>(reader->bitsPerSample) == bits);
        REQUIRE(reader->numChannels == 2);
        REQUIRE(reader->lengthInSamples == 8000);

        juce::AudioBuffer<float> decoded(2, 8000);
        reader->read(&decoded, 0, 8000, 0, true, true);
        REQUIRE(decoded.getSample(0, 1234) == Catch::Approx(0.25f));
        REQUIRE(decoded.getSample(1, 7999) == Catch::Approx(0.25f));
    }
}

TEST_CASE("FileAudioSourceResolver - Refs stay under the root", "[mixdown][resolver]") {
    auto root = juce::File::getSpecialLocation(juce::File::tempDirectory)
                    .getChildFile("jamroom_resolver_" + juce::String(juce::Random().nextInt64()));
    REQUIRE(root.createDirectory());

    auto wav = makeWav(makeConstant(1, 800, 0.25f), kRate, 16);
    REQUIRE(root.getChildFile("takes").createDirectory());
    REQUIRE(root.getChildFile("takes/a.wav").replaceWithData(wav.getData(), wav.getSize()));

    FileAudioSourceResolver resolver(root);

    REQUIRE(resolver.resolve("takes/a.wav") == root.getChildFile("takes/a.wav"));
    REQUIRE(resolver.openAudioSource("takes/a.wav") != nullptr);
    REQUIRE(resolver.resolve("../elsewhere.wav") == juce::File());
    REQUIRE(resolver.openAudioSource("../elsewhere.wav") == nullptr);
    REQUIRE(resolver.openAudioSource("takes/missing.wav") == nullptr);
    REQUIRE(resolver.openAudioSource("") == nullptr);

    MixdownEngine engine(resolver);
    auto result = engine.render(requestAt(kRate, {makeTrack("a", "takes/a.wav", 0.1)}));
    REQUIRE(result.getNumSamples() == 800);

    root.deleteRecursively();
}
