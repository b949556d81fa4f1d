#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ChannelTransport.hpp"
#include "CursorBroadcaster.hpp"
#include "PresenceRegistry.hpp"
#include "ProjectChat.hpp"
#include "TrackReplicationLog.hpp"
#include "jamroom/core/interfaces/chat_store_interface.hpp"
#include "jamroom/core/interfaces/identity_interface.hpp"
#include "jamroom/core/interfaces/profile_interface.hpp"
#include "jamroom/core/interfaces/track_store_interface.hpp"
#include "jamroom/utils/ScopedListener.hpp"

namespace jamroom {

enum class SessionStatus { Idle, Live, Reconnecting, Closed };

inline const char* getSessionStatusName(SessionStatus status) {
    switch (status) {
        case SessionStatus::Idle:
            return "Idle";
        case SessionStatus::Live:
            return "Live";
        case SessionStatus::Reconnecting:
            return "Reconnecting";
        case SessionStatus::Closed:
            return "Closed";
    }
    return "Unknown";
}

/**
 * @brief Listener interface for session-level status
 */
class SessionListener {
  public:
    virtual ~SessionListener() = default;

    virtual void sessionStatusChanged(SessionStatus status) = 0;

    // "Changes may not be saved" for one track
    virtual void persistenceFailed(const std::string& trackId, const std::string& message) {
        (void)trackId;
        (void)message;
    }
};

/**
 * @brief External collaborators a session talks to. Not owned.
 */
struct SessionServices {
    IdentityInterface* identity = nullptr;
    ProfileInterface* profiles = nullptr;
    TrackStoreInterface* trackStore = nullptr;
    ChatStoreInterface* chatStore = nullptr;
};

struct SessionSettings {
    PresenceRegistry::Settings presence;
    CursorBroadcaster::Settings cursor;

    /**
     * @brief Settings taken from the Config singleton
     */
    static SessionSettings fromConfig();
};

/**
 * @brief One user's live view of one project
 *
 * Owns the presence, cursor, track and chat components, each on its own
 * topic of the shared transport. Drives re-sync when the transport comes
 * back: presence re-joins, the cursor re-announces, tracks re-hydrate and
 * chat resumes.
 */
class CollaborationSession : private ChannelTransportListener,
                             private PresenceListener,
                             private TrackLogListener {
  public:
    CollaborationSession(ChannelTransport& transport, SessionServices services,
                         Clock clock = systemClock(),
                         SessionSettings settings = SessionSettings::fromConfig());
    ~CollaborationSession() override;

    CollaborationSession(const CollaborationSession&) = delete;
    CollaborationSession& operator=(const CollaborationSession&) = delete;

    /**
     * @brief Resolve the user and join every concern of the project
     * @throws std::runtime_error if the token is unknown or a session is already open
     * @throws PersistenceError if stored tracks or chat cannot be loaded
     *         (the session stays open and re-loads on the next reconnect)
     */
    void open(const std::string& projectId, const std::string& sessionToken);

    /**
     * @brief Heartbeats, presence expiry and the cursor trailing flush
     */
    void tick();

    /**
     * @brief Leave presence and close every subscription
     */
    void close();

    bool isOpen() const;
    SessionStatus getStatus() const;

    const std::string& getProjectId() const {
        return projectId_;
    }
    const std::string& getLocalUserId() const {
        return localUserId_;
    }

    // Components; only valid while the session is open
    PresenceRegistry& getPresence();
    CursorBroadcaster& getCursors();
    TrackReplicationLog& getTracks();
    ProjectChat& getChat();

    void addListener(SessionListener* listener);
    void removeListener(SessionListener* listener);

  private:
    // ChannelTransportListener
    void connectionStateChanged(ConnectionState state) override;

    // PresenceListener
    void rosterChanged(const std::vector<PresenceEntry>& roster) override;
    void collaboratorLeft(const std::string& userId) override;

    // TrackLogListener
    void tracksChanged(const std::vector<TrackRecord>& tracks) override;
    void persistenceFailed(const std::string& trackId, const std::string& message) override;

    void resync();
    void goOffline();
    void setStatus(SessionStatus status);
    void requireOpen() const;

    ChannelTransport& transport_;
    SessionServices services_;
    Clock clock_;
    SessionSettings settings_;

    std::string projectId_;
    std::string localUserId_;

    mutable std::mutex statusLock_;
    SessionStatus status_ = SessionStatus::Idle;
    std::vector<SessionListener*> listeners_;

    std::unique_ptr<PresenceRegistry> presence_;
    std::unique_ptr<CursorBroadcaster> cursors_;
    std::unique_ptr<TrackReplicationLog> tracks_;
    std::unique_ptr<ProjectChat> chat_;

    // Declared after the components so they unregister first
    ScopedListener<ChannelTransportListener> transportRegistration_{this};
    ScopedListener<PresenceListener> presenceRegistration_{this};
    ScopedListener<TrackLogListener> trackRegistration_{this};
};

}  // namespace jamroom
