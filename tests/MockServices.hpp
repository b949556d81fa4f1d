#pragma once

#include <juce_audio_formats/juce_audio_formats.h>
#include <juce_core/juce_core.h>

#include <atomic>
#include <cmath>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../jamroom/mixdown/AudioSourceResolver.hpp"
#include "../jamroom/session/SessionTypes.hpp"
#include "jamroom/core/interfaces/chat_store_interface.hpp"
#include "jamroom/core/interfaces/identity_interface.hpp"
#include "jamroom/core/interfaces/object_storage_interface.hpp"
#include "jamroom/core/interfaces/profile_interface.hpp"
#include "jamroom/core/interfaces/publisher_interface.hpp"
#include "jamroom/core/interfaces/track_store_interface.hpp"

namespace jamroom {
namespace test {

// ============================================================================
// Time
// ============================================================================

/**
 * Clock the test advances by hand.
 */
class ManualClock {
  public:
    explicit ManualClock(Timestamp start = 1000000) : now_(start) {}

    Clock asClock() {
        return [this] { return now_.load(); };
    }

    void advance(Timestamp ms) {
        now_ += ms;
    }

    Timestamp now() const {
        return now_.load();
    }

  private:
    std::atomic<Timestamp> now_;
};

// ============================================================================
// External services
// ============================================================================

class MockIdentity : public IdentityInterface {
  public:
    void addToken(const std::string& token, const std::string& userId) {
        tokens_[token] = userId;
    }

    std::optional<std::string> resolveUserId(const std::string& session_token) override {
        auto it = tokens_.find(session_token);
        if (it == tokens_.end())
            return std::nullopt;
        return it->second;
    }

  private:
    std::map<std::string, std::string> tokens_;
};

class MockProfiles : public ProfileInterface {
  public:
    void addProfile(const std::string& userId, const std::string& name,
                    const std::string& avatar = {}) {
        std::lock_guard<std::mutex> lock(lock_);
        profiles_[userId] = Profile{name, avatar};
    }

    std::optional<Profile> getProfile(const std::string& user_id) override {
        std::lock_guard<std::mutex> lock(lock_);
        ++lookups;
        auto it = profiles_.find(user_id);
        if (it == profiles_.end())
            return std::nullopt;
        return it->second;
    }

    int lookups = 0;

  private:
    std::mutex lock_;
    std::map<std::string, Profile> profiles_;
};

class MockTrackStore : public TrackStoreInterface {
  public:
    std::vector<TrackRecord> listTracks(const std::string& project_id) override {
        std::lock_guard<std::mutex> lock(lock_);
        if (failReads)
            throw std::runtime_error("track store offline");

        std::vector<TrackRecord> result;
        for (const auto& [id, record] : records) {
            if (record.projectId == project_id)
                result.push_back(record);
        }
        return result;
    }

    void upsertTrack(const TrackRecord& record) override {
        std::lock_guard<std::mutex> lock(lock_);
        ++writes;
        if (failWrites)
            throw std::runtime_error("write rejected");
        records[record.trackId] = record;
    }

    void deleteTrack(const std::string& track_id) override {
        std::lock_guard<std::mutex> lock(lock_);
        ++writes;
        if (failWrites)
            throw std::runtime_error("write rejected");
        records.erase(track_id);
    }

    void put(const TrackRecord& record) {
        std::lock_guard<std::mutex> lock(lock_);
        records[record.trackId] = record;
    }

    bool failReads = false;
    bool failWrites = false;
    int writes = 0;
    std::map<std::string, TrackRecord> records;

  private:
    std::mutex lock_;
};

/**
 * Assigns "msg-<n>" ids; keeps the client's createdAt unless serverTime is set.
 */
class MockChatStore : public ChatStoreInterface {
  public:
    std::vector<ChatMessage> listMessages(const std::string& project_id) override {
        std::lock_guard<std::mutex> lock(lock_);
        if (failReads)
            throw std::runtime_error("chat store offline");

        std::vector<ChatMessage> result;
        for (const auto& message : messages) {
            if (message.projectId == project_id)
                result.push_back(message);
        }
        return result;
    }

    ChatMessage appendMessage(const ChatMessage& message) override {
        std::lock_guard<std::mutex> lock(lock_);
        if (failWrites)
            throw std::runtime_error("insert rejected");

        ChatMessage stored;
        stored.id = "msg-" + std::to_string(nextId_++);
        stored.projectId = message.projectId;
        stored.senderId = message.senderId;
        stored.content = message.content;
        stored.createdAt = serverTime > 0 ? serverTime : message.createdAt;
        messages.push_back(stored);
        return stored;
    }

    // Message written by someone else, bypassing this client
    ChatMessage insertDirect(const std::string& projectId, const std::string& senderId,
                             const std::string& content, Timestamp createdAt) {
        std::lock_guard<std::mutex> lock(lock_);
        ChatMessage stored;
        stored.id = "msg-" + std::to_string(nextId_++);
        stored.projectId = projectId;
        stored.senderId = senderId;
        stored.content = content;
        stored.createdAt = createdAt;
        messages.push_back(stored);
        return stored;
    }

    bool failReads = false;
    bool failWrites = false;
    Timestamp serverTime = 0;
    std::vector<ChatMessage> messages;

  private:
    std::mutex lock_;
    int nextId_ = 1;
};

class MockObjectStorage : public ObjectStorageInterface {
  public:
    std::string store(const std::vector<std::uint8_t>& bytes,
                      const std::string& content_type) override {
        std::lock_guard<std::mutex> lock(lock_);
        if (fail)
            throw std::runtime_error("bucket unavailable");
        objects.push_back(bytes);
        contentTypes.push_back(content_type);
        return "blob://" + std::to_string(objects.size());
    }

    bool fail = false;
    std::vector<std::vector<std::uint8_t>> objects;
    std::vector<std::string> contentTypes;

  private:
    std::mutex lock_;
};

class MockPublisher : public PublisherInterface {
  public:
    struct Call {
        std::string projectId;
        std::string storageRef;
        PublishMetadata metadata;
    };

    void markPublished(const std::string& project_id, const std::string& storage_ref,
                       const PublishMetadata& metadata) override {
        std::lock_guard<std::mutex> lock(lock_);
        if (fail)
            throw std::runtime_error("project row locked");
        calls.push_back({project_id, storage_ref, metadata});
    }

    bool fail = false;
    std::vector<Call> calls;

  private:
    std::mutex lock_;
};

// ============================================================================
// Audio
// ============================================================================

/**
 * Encode a buffer as WAV bytes in memory.
 */
inline juce::MemoryBlock makeWav(const juce::AudioBuffer<float>& buffer, double sampleRate,
                                 int bitsPerSample = 24) {
    juce::MemoryBlock block;
    {
        juce::WavAudioFormat wavFormat;
        JUCE_BEGIN_IGNORE_WARNINGS_MSVC(4996)
        JUCE_BEGIN_IGNORE_WARNINGS_GCC_LIKE("-Wdeprecated-declarations")
        std::unique_ptr<juce::AudioFormatWriter> writer(wavFormat.createWriterFor(
            new juce::MemoryOutputStream(block, false), sampleRate,
            static_cast<unsigned int>(buffer.getNumChannels()), bitsPerSample, {}, 0));
        JUCE_END_IGNORE_WARNINGS_GCC_LIKE
        JUCE_END_IGNORE_WARNINGS_MSVC
        if (writer)
            writer->writeFromAudioSampleBuffer(buffer, 0, buffer.getNumSamples());
    }
    return block;
}

/**
 * Constant-valued buffer; 0.5 is exact in 16 and 24 bit PCM.
 */
inline juce::AudioBuffer<float> makeConstant(int numChannels, int numSamples, float value) {
    juce::AudioBuffer<float> buffer(numChannels, numSamples);
    for (int ch = 0; ch < numChannels; ++ch)
        juce::FloatVectorOperations::fill(buffer.getWritePointer(ch), value, numSamples);
    return buffer;
}

inline juce::AudioBuffer<float> makeSine(int numChannels, int numSamples, double sampleRate,
                                         double frequency, float amplitude) {
    juce::AudioBuffer<float> buffer(numChannels, numSamples);
    for (int i = 0; i < numSamples; ++i) {
        const auto value = amplitude * static_cast<float>(std::sin(
                                           juce::MathConstants<double>::twoPi * frequency * i /
                                           sampleRate));
        for (int ch = 0; ch < numChannels; ++ch)
            buffer.setSample(ch, i, value);
    }
    return buffer;
}

/**
 * Audio refs served from memory.
 */
class MemoryAudioResolver : public AudioSourceResolver {
  public:
    void add(const std::string& ref, juce::MemoryBlock data) {
        std::lock_guard<std::mutex> lock(lock_);
        sources_[ref] = std::move(data);
    }

    std::unique_ptr<juce::InputStream> openAudioSource(const std::string& audioRef) override {
        std::lock_guard<std::mutex> lock(lock_);
        ++opens;
        auto it = sources_.find(audioRef);
        if (it == sources_.end())
            return nullptr;
        return std::make_unique<juce::MemoryInputStream>(it->second, true);
    }

    int opens = 0;

  private:
    std::mutex lock_;
    std::map<std::string, juce::MemoryBlock> sources_;
};

inline TrackRecord makeTrack(const std::string& trackId, const std::string& audioRef,
                             double durationSeconds, double startOffsetSeconds = 0.0) {
    TrackRecord track;
    track.trackId = trackId;
    track.projectId = "p1";
    track.name = trackId;
    track.audioRef = audioRef;
    track.durationSeconds = durationSeconds;
    track.startOffsetSeconds = startOffsetSeconds;
    return track;
}

}  // namespace test
}  // namespace jamroom
