#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ChannelTransport.hpp"
#include "SessionTypes.hpp"
#include "jamroom/core/interfaces/profile_interface.hpp"

namespace jamroom {

enum class PresenceState { Disconnected, Joining, Synced };

inline const char* getPresenceStateName(PresenceState state) {
    switch (state) {
        case PresenceState::Disconnected:
            return "Disconnected";
        case PresenceState::Joining:
            return "Joining";
        case PresenceState::Synced:
            return "Synced";
    }
    return "Unknown";
}

/**
 * @brief Listener interface for roster changes
 */
class PresenceListener {
  public:
    virtual ~PresenceListener() = default;

    // Roster of other collaborators after a change, ordered by joinedAt
    virtual void rosterChanged(const std::vector<PresenceEntry>& roster) = 0;

    // A collaborator left, disconnected or timed out
    virtual void collaboratorLeft(const std::string& userId) {
        (void)userId;
    }
};

/**
 * @brief Per-project roster of connected collaborators
 *
 * Built from presence.join / presence.leave / presence.heartbeat events on
 * the project's presence topic plus the transport's system.leave. Entries
 * not heard from within the timeout are expired by tick(). Accepting a join
 * depends only on joinedAt and the last leave seen for that user, so the
 * roster does not depend on arrival order.
 */
class PresenceRegistry {
  public:
    struct Settings {
        int heartbeatIntervalMs = 5000;
        int presenceTimeoutMs = 15000;
    };

    PresenceRegistry(ChannelTransport& transport, std::string projectId, PresenceEntry self,
                     ProfileInterface* profiles, Clock clock, Settings settings);
    PresenceRegistry(ChannelTransport& transport, std::string projectId, PresenceEntry self,
                     ProfileInterface* profiles = nullptr, Clock clock = systemClock());
    ~PresenceRegistry();

    PresenceRegistry(const PresenceRegistry&) = delete;
    PresenceRegistry& operator=(const PresenceRegistry&) = delete;

    /**
     * @brief Join the presence topic and announce ourselves with a fresh joinedAt
     *
     * Passes through Joining: announce, request the roster, then Synced.
     * @throws TransportError if the announcement cannot be published
     */
    void connect();

    /**
     * @brief The transport dropped: clear the roster and go Disconnected
     */
    void handleDisconnect();

    /**
     * @brief Announce our departure and leave the topic
     */
    void leave();

    /**
     * @brief Send a heartbeat when due and expire silent entries
     */
    void tick();

    /**
     * @brief Other collaborators, ordered by joinedAt then userId
     */
    std::vector<PresenceEntry> getRoster() const;

    bool isOnline(const std::string& userId) const;
    PresenceState getState() const;
    PresenceEntry getSelf() const;

    const std::string& getTopic() const {
        return topic_;
    }

    void addListener(PresenceListener* listener);
    void removeListener(PresenceListener* listener);

  private:
    struct TrackedEntry {
        PresenceEntry entry;
        Timestamp lastSeen = 0;
    };

    struct Changes {
        bool rosterChanged = false;
        std::vector<std::string> left;
    };

    void handleEvent(const ChannelEvent& event);
    void handleAnnouncement(const nlohmann::json& payload, Changes& changes);
    void handleLeave(const nlohmann::json& payload, Changes& changes);
    void handleClientGone(const std::string& clientId, Changes& changes);
    void announce(const char* type);

    std::vector<PresenceEntry> buildRosterLocked() const;
    void notify(const Changes& changes);

    ChannelTransport& transport_;
    const std::string projectId_;
    const std::string topic_;
    ProfileInterface* profiles_;
    Clock clock_;
    Settings settings_;

    mutable std::mutex lock_;
    PresenceEntry self_;
    PresenceState state_ = PresenceState::Disconnected;
    std::map<std::string, TrackedEntry> entries_;
    std::map<std::string, Timestamp> lastLeave_;
    Timestamp lastHeartbeat_ = 0;

    std::vector<PresenceListener*> listeners_;
    std::unique_ptr<ChannelSubscription> subscription_;
};

}  // namespace jamroom
