#pragma once

#include <juce_core/juce_core.h>

#include <functional>
#include <string>
#include <tuple>

#include "jamroom/core/model.hpp"

namespace jamroom {

/**
 * @brief Millisecond clock used by all time-based session logic
 *
 * Injected so tests can drive heartbeats, throttling and expiry deterministically.
 */
using Clock = std::function<Timestamp()>;

inline Clock systemClock() {
    return [] { return static_cast<Timestamp>(juce::Time::currentTimeMillis()); };
}

/**
 * @brief Concerns a session subscribes to, one topic each
 */
enum class SessionConcern { Presence, Cursor, Tracks, Chat };

inline const char* getSessionConcernName(SessionConcern concern) {
    switch (concern) {
        case SessionConcern::Presence:
            return "presence";
        case SessionConcern::Cursor:
            return "cursor";
        case SessionConcern::Tracks:
            return "tracks";
        case SessionConcern::Chat:
            return "chat";
    }
    return "unknown";
}

/**
 * @brief Topic name of one concern of a project, e.g. "project:42:tracks"
 */
inline std::string topicFor(const std::string& projectId, SessionConcern concern) {
    return "project:" + projectId + ":" + getSessionConcernName(concern);
}

/**
 * @brief Version stamp of a write: ordered by timestamp, then actor id
 */
struct Stamp {
    Timestamp timestamp = 0;
    std::string actorId;

    bool operator<(const Stamp& other) const {
        return std::tie(timestamp, actorId) < std::tie(other.timestamp, other.actorId);
    }
    bool operator==(const Stamp& other) const {
        return timestamp == other.timestamp && actorId == other.actorId;
    }
    bool operator!=(const Stamp& other) const {
        return !(*this == other);
    }
    bool operator>(const Stamp& other) const {
        return other < *this;
    }
    bool operator<=(const Stamp& other) const {
        return !(other < *this);
    }
};

}  // namespace jamroom
