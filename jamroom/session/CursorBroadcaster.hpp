#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ChannelTransport.hpp"
#include "SessionTypes.hpp"

namespace jamroom {

/**
 * @brief Listener interface for remote cursor changes
 */
class CursorListener {
  public:
    virtual ~CursorListener() = default;

    // Visible remote cursors after a change, ordered by userId
    virtual void cursorsChanged(const std::vector<CursorState>& visible) = 0;
};

/**
 * @brief Ephemeral pointer sharing for one project
 *
 * Local moves are hard-throttled: the first move in a window is sent at once,
 * later ones overwrite a pending slot that tick() flushes when the window has
 * elapsed. The last position is therefore always sent eventually.
 */
class CursorBroadcaster {
  public:
    static constexpr int PALETTE_SIZE = 12;

    // Decides whether a remote user may show a cursor
    using UserFilter = std::function<bool(const std::string& userId)>;

    struct Settings {
        int throttleMs = 50;
    };

    CursorBroadcaster(ChannelTransport& transport, std::string projectId,
                      std::string localUserId, std::string displayName, Clock clock,
                      Settings settings);
    CursorBroadcaster(ChannelTransport& transport, std::string projectId,
                      std::string localUserId, std::string displayName = {},
                      Clock clock = systemClock());
    ~CursorBroadcaster();

    CursorBroadcaster(const CursorBroadcaster&) = delete;
    CursorBroadcaster& operator=(const CursorBroadcaster&) = delete;

    /**
     * @brief Join the cursor topic
     */
    void attach();

    /**
     * @brief Leave the cursor topic and forget every remote cursor
     */
    void detach();

    void moveLocal(double x, double y);

    /**
     * @brief The local pointer left the workspace; sends the (-1, -1) sentinel
     */
    void leaveLocal();

    /**
     * @brief Flush a pending position once the throttle window has elapsed
     */
    void tick();

    /**
     * @brief Re-publish the last local position, e.g. after a reconnect
     */
    void reannounce();

    /**
     * @brief Ignore cursor events from users the filter rejects
     *
     * Without a filter every remote cursor is kept. The session passes its
     * presence roster so cursors never outlive their owner's presence.
     */
    void setUserFilter(UserFilter filter);

    void removeUser(const std::string& userId);
    void clear();

    /**
     * @brief Remote cursors with a visible position, ordered by userId
     */
    std::vector<CursorState> getVisibleCursors() const;

    std::optional<CursorState> getCursor(const std::string& userId) const;

    const std::string& getLocalColorToken() const {
        return colorToken_;
    }

    /**
     * @brief Number of cursor events actually published
     */
    std::uint64_t getSentCount() const;

    /**
     * @brief Stable palette colour of a user: FNV-1a 32 of the id, mod palette size
     */
    static std::string colorTokenFor(const std::string& userId);
    static const std::array<const char*, PALETTE_SIZE>& getPalette();

    void addListener(CursorListener* listener);
    void removeListener(CursorListener* listener);

  private:
    void submit(double x, double y);
    void send(const CursorState& state);
    void handleEvent(const ChannelEvent& event);
    std::vector<CursorState> buildVisibleLocked() const;
    void notify();

    ChannelTransport& transport_;
    const std::string projectId_;
    const std::string topic_;
    const std::string localUserId_;
    const std::string displayName_;
    const std::string colorToken_;
    Clock clock_;
    Settings settings_;

    mutable std::mutex lock_;
    std::optional<CursorState> lastLocal_;
    std::optional<CursorState> pending_;
    std::optional<Timestamp> lastSentAt_;
    std::uint64_t sentCount_ = 0;
    std::map<std::string, CursorState> remote_;
    UserFilter userFilter_;

    std::vector<CursorListener*> listeners_;
    std::unique_ptr<ChannelSubscription> subscription_;
};

}  // namespace jamroom
