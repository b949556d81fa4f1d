#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @file model.hpp
 * @brief Shared data model of a collaborative project
 *
 * These are the values exchanged between the session layer, the durable
 * stores and the mixdown engine. Timestamps are milliseconds since the epoch.
 */

namespace jamroom {

using Timestamp = std::int64_t;

/**
 * @brief One connected collaborator
 */
struct PresenceEntry {
    std::string userId;
    std::string displayName;
    std::string avatarRef;
    Timestamp joinedAt = 0;
    std::string clientId;  // Transport endpoint that announced this entry
};

/**
 * @brief One collaborator's pointer inside the workspace
 *
 * Negative coordinates are the "pointer left the workspace" sentinel.
 */
struct CursorState {
    std::string userId;
    double x = -1.0;
    double y = -1.0;
    std::string colorToken;
    std::string displayName;

    bool isVisible() const {
        return x >= 0.0 && y >= 0.0;
    }
};

/**
 * @brief One audio track of a project
 *
 * gain is a linear amplitude factor in [0, 1]; pan is in [-1, 1].
 */
struct TrackRecord {
    std::string trackId;
    std::string projectId;
    std::string name;
    int trackNumber = 0;
    std::string audioRef;
    double gain = 1.0;
    double pan = 0.0;
    bool muted = false;
    double durationSeconds = 0.0;
    double startOffsetSeconds = 0.0;
    Timestamp updatedAt = 0;
    std::string updatedBy;

    double getEndSeconds() const {
        return startOffsetSeconds + durationSeconds;
    }

    bool operator==(const TrackRecord& other) const {
        return trackId == other.trackId && projectId == other.projectId && name == other.name &&
               trackNumber == other.trackNumber && audioRef == other.audioRef &&
               gain == other.gain && pan == other.pan && muted == other.muted &&
               durationSeconds == other.durationSeconds &&
               startOffsetSeconds == other.startOffsetSeconds && updatedAt == other.updatedAt &&
               updatedBy == other.updatedBy;
    }
    bool operator!=(const TrackRecord& other) const {
        return !(*this == other);
    }
};

enum class MutationKind { Create, Update, Delete };

inline const char* getMutationKindName(MutationKind kind) {
    switch (kind) {
        case MutationKind::Create:
            return "create";
        case MutationKind::Update:
            return "update";
        case MutationKind::Delete:
            return "delete";
    }
    return "unknown";
}

/**
 * @brief Field values carried by a mutation; unset fields are not touched
 */
struct TrackFields {
    std::optional<std::string> name;
    std::optional<int> trackNumber;
    std::optional<std::string> audioRef;
    std::optional<double> gain;
    std::optional<double> pan;
    std::optional<bool> muted;
    std::optional<double> durationSeconds;
    std::optional<double> startOffsetSeconds;

    bool isEmpty() const {
        return !name && !trackNumber && !audioRef && !gain && !pan && !muted &&
               !durationSeconds && !startOffsetSeconds;
    }
};

/**
 * @brief Immutable fact describing one change to one track
 */
struct TrackMutationEvent {
    std::string trackId;
    std::string projectId;
    MutationKind kind = MutationKind::Update;
    TrackFields fields;
    Timestamp timestamp = 0;
    std::string actorId;
};

/**
 * @brief One project chat message
 */
struct ChatMessage {
    enum class Delivery { Pending, Delivered, Failed };

    std::string id;
    std::string projectId;
    std::string senderId;
    std::string content;
    Timestamp createdAt = 0;

    // Client-side decoration, never sent over the wire
    std::string senderName;
    Delivery delivery = Delivery::Delivered;
};

/**
 * @brief Display identity of a user
 */
struct Profile {
    std::string displayName;
    std::string avatarRef;
};

/**
 * @brief Final metadata attached to a published project
 */
struct PublishMetadata {
    std::string title;
    std::string description;
    std::vector<std::string> tags;
    std::string coverImageRef;
};

}  // namespace jamroom
