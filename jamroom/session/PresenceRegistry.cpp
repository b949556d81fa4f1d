#include "PresenceRegistry.hpp"

#include <juce_core/juce_core.h>

#include <algorithm>

#include "PayloadCodec.hpp"

namespace jamroom {

namespace {

bool sameEntry(const PresenceEntry& a, const PresenceEntry& b) {
    return a.userId == b.userId && a.displayName == b.displayName &&
           a.avatarRef == b.avatarRef && a.joinedAt == b.joinedAt && a.clientId == b.clientId;
}

}  // namespace

PresenceRegistry::PresenceRegistry(ChannelTransport& transport, std::string projectId,
                                   PresenceEntry self, ProfileInterface* profiles, Clock clock,
                                   Settings settings)
    : transport_(transport),
      projectId_(std::move(projectId)),
      topic_(topicFor(projectId_, SessionConcern::Presence)),
      profiles_(profiles),
      clock_(std::move(clock)),
      settings_(settings),
      self_(std::move(self)) {}

PresenceRegistry::PresenceRegistry(ChannelTransport& transport, std::string projectId,
                                   PresenceEntry self, ProfileInterface* profiles, Clock clock)
    : PresenceRegistry(transport, std::move(projectId), std::move(self), profiles,
                       std::move(clock), Settings{}) {}

PresenceRegistry::~PresenceRegistry() {
    if (subscription_)
        subscription_->close();
}

void PresenceRegistry::connect() {
    if (!subscription_ || !subscription_->isOpen()) {
        subscription_ = transport_.join(topic_);
        subscription_->onEvent([this](const ChannelEvent& event) { handleEvent(event); });
    }

    {
        std::lock_guard<std::mutex> lock(lock_);
        state_ = PresenceState::Joining;
        self_.joinedAt = clock_();
        self_.clientId = transport_.getClientId();
        lastHeartbeat_ = self_.joinedAt;
    }

    announce(events::PRESENCE_JOIN);

    ChannelEvent request;
    request.type = events::PRESENCE_SYNC_REQUEST;
    request.payload = {{"userId", getSelf().userId}};
    transport_.publish(topic_, request);

    {
        std::lock_guard<std::mutex> lock(lock_);
        state_ = PresenceState::Synced;
    }
    DBG("Presence synced on " << juce::String(topic_));
}

void PresenceRegistry::handleDisconnect() {
    Changes changes;
    {
        std::lock_guard<std::mutex> lock(lock_);
        state_ = PresenceState::Disconnected;
        if (!entries_.empty()) {
            for (const auto& [userId, tracked] : entries_)
                changes.left.push_back(userId);
            entries_.clear();
            changes.rosterChanged = true;
        }
    }
    notify(changes);
}

void PresenceRegistry::leave() {
    PresenceEntry self = getSelf();
    if (getState() != PresenceState::Disconnected) {
        ChannelEvent event;
        event.type = events::PRESENCE_LEAVE;
        event.payload = {{"userId", self.userId}, {"at", clock_()}};
        try {
            transport_.publish(topic_, event);
        } catch (const TransportError& e) {
            // Peers will see system.leave or time us out instead
            DBG("Presence leave not sent: " << e.what());
        }
    }

    if (subscription_)
        subscription_->close();

    handleDisconnect();
}

void PresenceRegistry::tick() {
    const Timestamp now = clock_();
    bool heartbeatDue = false;
    Changes changes;
    {
        std::lock_guard<std::mutex> lock(lock_);
        if (state_ != PresenceState::Synced)
            return;

        if (now - lastHeartbeat_ >= settings_.heartbeatIntervalMs) {
            heartbeatDue = true;
            lastHeartbeat_ = now;
        }

        for (auto it = entries_.begin(); it != entries_.end();) {
            if (now - it->second.lastSeen > settings_.presenceTimeoutMs) {
                DBG("Presence timeout: " << juce::String(it->first));
                changes.left.push_back(it->first);
                changes.rosterChanged = true;
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (heartbeatDue) {
        try {
            announce(events::PRESENCE_HEARTBEAT);
        } catch (const TransportError& e) {
            DBG("Presence heartbeat not sent: " << e.what());
        }
    }

    notify(changes);
}

std::vector<PresenceEntry> PresenceRegistry::getRoster() const {
    std::lock_guard<std::mutex> lock(lock_);
    return buildRosterLocked();
}

bool PresenceRegistry::isOnline(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(lock_);
    return entries_.count(userId) > 0;
}

PresenceState PresenceRegistry::getState() const {
    std::lock_guard<std::mutex> lock(lock_);
    return state_;
}

PresenceEntry PresenceRegistry::getSelf() const {
    std::lock_guard<std::mutex> lock(lock_);
    return self_;
}

void PresenceRegistry::addListener(PresenceListener* listener) {
    std::lock_guard<std::mutex> lock(lock_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
        listeners_.push_back(listener);
}

void PresenceRegistry::removeListener(PresenceListener* listener) {
    std::lock_guard<std::mutex> lock(lock_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

// ============================================================================
// Event handling
// ============================================================================

void PresenceRegistry::handleEvent(const ChannelEvent& event) {
    if (getState() == PresenceState::Disconnected)
        return;

    Changes changes;
    try {
        if (event.type == events::PRESENCE_JOIN || event.type == events::PRESENCE_HEARTBEAT) {
            handleAnnouncement(event.payload, changes);
        } else if (event.type == events::PRESENCE_LEAVE) {
            handleLeave(event.payload, changes);
        } else if (event.type == SYSTEM_LEAVE_EVENT) {
            handleClientGone(event.payload.value("clientId", std::string()), changes);
        } else if (event.type == events::PRESENCE_SYNC_REQUEST) {
            if (event.payload.value("userId", std::string()) != getSelf().userId)
                announce(events::PRESENCE_JOIN);
        }
    } catch (const JamRoomError& e) {
        DBG("Presence event '" << juce::String(event.type) << "' dropped: " << e.what());
        return;
    } catch (const nlohmann::json::exception& e) {
        DBG("Presence event '" << juce::String(event.type) << "' malformed: " << e.what());
        return;
    }

    notify(changes);
}

void PresenceRegistry::handleAnnouncement(const nlohmann::json& payload, Changes& changes) {
    PresenceEntry incoming = codec::decodePresenceEntry(payload);

    // Decorate outside the lock; the profile service may block
    if (incoming.displayName.empty() || incoming.avatarRef.empty()) {
        Profile profile = resolveProfile(profiles_, incoming.userId);
        if (incoming.displayName.empty())
            incoming.displayName = profile.displayName;
        if (incoming.avatarRef.empty())
            incoming.avatarRef = profile.avatarRef;
    }

    const Timestamp now = clock_();
    std::lock_guard<std::mutex> lock(lock_);
    if (incoming.userId == self_.userId)
        return;

    auto leftAt = lastLeave_.find(incoming.userId);
    if (leftAt != lastLeave_.end() && incoming.joinedAt <= leftAt->second)
        return;

    auto it = entries_.find(incoming.userId);
    if (it != entries_.end()) {
        if (incoming.joinedAt < it->second.entry.joinedAt)
            return;
        it->second.lastSeen = now;
        if (!sameEntry(it->second.entry, incoming)) {
            it->second.entry = incoming;
            changes.rosterChanged = true;
        }
        return;
    }

    DBG("Presence join: " << juce::String(incoming.userId));
    entries_[incoming.userId] = TrackedEntry{incoming, now};
    changes.rosterChanged = true;
}

void PresenceRegistry::handleLeave(const nlohmann::json& payload, Changes& changes) {
    if (!payload.is_object() || !payload.contains("userId") || !payload["userId"].is_string())
        throw ConflictApplyError("Presence leave without userId");

    const std::string userId = payload["userId"].get<std::string>();
    const Timestamp at = payload.contains("at") && payload["at"].is_number_integer()
                             ? payload["at"].get<Timestamp>()
                             : clock_();

    std::lock_guard<std::mutex> lock(lock_);
    if (userId == self_.userId)
        return;

    auto& leftAt = lastLeave_[userId];
    leftAt = std::max(leftAt, at);

    auto it = entries_.find(userId);
    if (it != entries_.end() && it->second.entry.joinedAt <= at) {
        DBG("Presence leave: " << juce::String(userId));
        entries_.erase(it);
        changes.left.push_back(userId);
        changes.rosterChanged = true;
    }
}

void PresenceRegistry::handleClientGone(const std::string& clientId, Changes& changes) {
    if (clientId.empty())
        return;

    std::lock_guard<std::mutex> lock(lock_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.entry.clientId == clientId) {
            DBG("Presence client gone: " << juce::String(clientId));
            changes.left.push_back(it->first);
            changes.rosterChanged = true;
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

void PresenceRegistry::announce(const char* type) {
    ChannelEvent event;
    event.type = type;
    event.payload = codec::encodePresenceEntry(getSelf());
    event.ephemeral = std::string(type) == events::PRESENCE_HEARTBEAT;
    transport_.publish(topic_, event);
}

std::vector<PresenceEntry> PresenceRegistry::buildRosterLocked() const {
    std::vector<PresenceEntry> roster;
    roster.reserve(entries_.size());
    for (const auto& [userId, tracked] : entries_)
        roster.push_back(tracked.entry);

    std::sort(roster.begin(), roster.end(), [](const PresenceEntry& a, const PresenceEntry& b) {
        if (a.joinedAt != b.joinedAt)
            return a.joinedAt < b.joinedAt;
        return a.userId < b.userId;
    });
    return roster;
}

void PresenceRegistry::notify(const Changes& changes) {
    if (!changes.rosterChanged && changes.left.empty())
        return;

    std::vector<PresenceListener*> listeners;
    std::vector<PresenceEntry> roster;
    {
        std::lock_guard<std::mutex> lock(lock_);
        listeners = listeners_;
        roster = buildRosterLocked();
    }

    for (auto* listener : listeners) {
        for (const auto& userId : changes.left)
            listener->collaboratorLeft(userId);
        if (changes.rosterChanged)
            listener->rosterChanged(roster);
    }
}

}  // namespace jamroom
