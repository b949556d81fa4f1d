#include "CollaborationSession.hpp"

#include <juce_core/juce_core.h>

#include <algorithm>
#include <stdexcept>

#include "jamroom/core/Config.hpp"

namespace jamroom {

SessionSettings SessionSettings::fromConfig() {
    auto& config = Config::getInstance();
    SessionSettings settings;
    settings.presence.heartbeatIntervalMs = config.getHeartbeatIntervalMs();
    settings.presence.presenceTimeoutMs = config.getPresenceTimeoutMs();
    settings.cursor.throttleMs = config.getCursorThrottleMs();
    return settings;
}

CollaborationSession::CollaborationSession(ChannelTransport& transport, SessionServices services,
                                           Clock clock, SessionSettings settings)
    : transport_(transport),
      services_(services),
      clock_(std::move(clock)),
      settings_(settings) {}

CollaborationSession::~CollaborationSession() {
    close();
}

void CollaborationSession::open(const std::string& projectId, const std::string& sessionToken) {
    if (isOpen())
        throw std::runtime_error("Session already open for project " + projectId_);
    if (services_.identity == nullptr)
        throw std::runtime_error("No identity provider configured");

    auto userId = services_.identity->resolveUserId(sessionToken);
    if (!userId || userId->empty())
        throw std::runtime_error("Unknown session token");

    projectId_ = projectId;
    localUserId_ = *userId;

    Profile profile = resolveProfile(services_.profiles, localUserId_);
    PresenceEntry self;
    self.userId = localUserId_;
    self.displayName = profile.displayName;
    self.avatarRef = profile.avatarRef;

    presence_ = std::make_unique<PresenceRegistry>(transport_, projectId_, self, services_.profiles,
                                                   clock_, settings_.presence);
    cursors_ = std::make_unique<CursorBroadcaster>(transport_, projectId_, localUserId_,
                                                   profile.displayName, clock_, settings_.cursor);
    tracks_ = std::make_unique<TrackReplicationLog>(transport_, projectId_, services_.trackStore,
                                                    localUserId_, clock_);
    chat_ = std::make_unique<ProjectChat>(transport_, projectId_, services_.chatStore,
                                          localUserId_, services_.profiles, clock_);

    cursors_->setUserFilter([registry = presence_.get()](const std::string& userId) {
        return registry->isOnline(userId);
    });

    presenceRegistration_.attach(*presence_);
    trackRegistration_.attach(*tracks_);
    transportRegistration_.attach(transport_);

    juce::Logger::writeToLog("Opening session on project " + juce::String(projectId_) + " as " +
                             juce::String(localUserId_));

    const bool connected = transport_.getConnectionState() == ConnectionState::Connected;
    setStatus(connected ? SessionStatus::Live : SessionStatus::Reconnecting);

    cursors_->attach();
    if (connected) {
        try {
            presence_->connect();
        } catch (const TransportError& e) {
            juce::Logger::writeToLog("Presence announce failed: " + juce::String(e.what()));
        }
    }

    // Both loads run even if the first fails; the first failure is reported
    std::string loadError;
    try {
        tracks_->hydrate();
    } catch (const PersistenceError& e) {
        loadError = e.what();
    }
    try {
        chat_->hydrate();
    } catch (const PersistenceError& e) {
        if (loadError.empty())
            loadError = e.what();
    }

    if (!loadError.empty())
        throw PersistenceError(loadError);
}

void CollaborationSession::tick() {
    if (!isOpen())
        return;

    presence_->tick();
    cursors_->tick();
}

void CollaborationSession::close() {
    if (!isOpen())
        return;

    transportRegistration_.detach();
    presenceRegistration_.detach();
    trackRegistration_.detach();

    presence_->leave();
    cursors_->detach();
    tracks_->close();
    chat_->close();

    chat_.reset();
    tracks_.reset();
    cursors_.reset();
    presence_.reset();

    juce::Logger::writeToLog("Closed session on project " + juce::String(projectId_));
    setStatus(SessionStatus::Closed);
}

bool CollaborationSession::isOpen() const {
    return presence_ != nullptr;
}

SessionStatus CollaborationSession::getStatus() const {
    std::lock_guard<std::mutex> lock(statusLock_);
    return status_;
}

void CollaborationSession::requireOpen() const {
    if (!isOpen())
        throw std::logic_error("Session is not open");
}

PresenceRegistry& CollaborationSession::getPresence() {
    requireOpen();
    return *presence_;
}

CursorBroadcaster& CollaborationSession::getCursors() {
    requireOpen();
    return *cursors_;
}

TrackReplicationLog& CollaborationSession::getTracks() {
    requireOpen();
    return *tracks_;
}

ProjectChat& CollaborationSession::getChat() {
    requireOpen();
    return *chat_;
}

void CollaborationSession::addListener(SessionListener* listener) {
    std::lock_guard<std::mutex> lock(statusLock_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
        listeners_.push_back(listener);
}

void CollaborationSession::removeListener(SessionListener* listener) {
    std::lock_guard<std::mutex> lock(statusLock_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

// ============================================================================
// Reconnect handling
// ============================================================================

void CollaborationSession::connectionStateChanged(ConnectionState state) {
    if (!isOpen())
        return;

    if (state == ConnectionState::Connected) {
        if (getStatus() != SessionStatus::Live)
            resync();
    } else {
        goOffline();
    }
}

void CollaborationSession::goOffline() {
    presence_->handleDisconnect();
    cursors_->clear();
    setStatus(SessionStatus::Reconnecting);
}

void CollaborationSession::resync() {
    juce::Logger::writeToLog("Re-syncing session on project " + juce::String(projectId_));

    try {
        presence_->connect();
        cursors_->reannounce();
    } catch (const TransportError& e) {
        // Dropped again; the next Connected retries
        juce::Logger::writeToLog("Re-sync interrupted: " + juce::String(e.what()));
        return;
    }

    try {
        tracks_->rehydrate();
    } catch (const PersistenceError& e) {
        juce::Logger::writeToLog("Track re-hydration failed: " + juce::String(e.what()));
    }
    try {
        chat_->resume();
    } catch (const PersistenceError& e) {
        juce::Logger::writeToLog("Chat resume failed: " + juce::String(e.what()));
    }

    setStatus(SessionStatus::Live);
}

void CollaborationSession::setStatus(SessionStatus status) {
    std::vector<SessionListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(statusLock_);
        if (status_ == status)
            return;
        status_ = status;
        listeners = listeners_;
    }

    DBG("Session " << juce::String(projectId_) << ": " << getSessionStatusName(status));
    for (auto* listener : listeners)
        listener->sessionStatusChanged(status);
}

// ============================================================================
// Component callbacks
// ============================================================================

void CollaborationSession::rosterChanged(const std::vector<PresenceEntry>& roster) {
    juce::ignoreUnused(roster);
    DBG("Roster of " << juce::String(projectId_) << ": " << static_cast<int>(roster.size())
                     << " collaborators");
}

void CollaborationSession::collaboratorLeft(const std::string& userId) {
    cursors_->removeUser(userId);
}

void CollaborationSession::tracksChanged(const std::vector<TrackRecord>& tracks) {
    juce::ignoreUnused(tracks);
}

void CollaborationSession::persistenceFailed(const std::string& trackId,
                                             const std::string& message) {
    std::vector<SessionListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(statusLock_);
        listeners = listeners_;
    }
    for (auto* listener : listeners)
        listener->persistenceFailed(trackId, message);
}

}  // namespace jamroom
