#include "CursorBroadcaster.hpp"

#include <juce_core/juce_core.h>

#include <algorithm>

#include "PayloadCodec.hpp"

namespace jamroom {

namespace {

const std::array<const char*, CursorBroadcaster::PALETTE_SIZE> kPalette = {
    "#e09145", "#46b1c9", "#e17878", "#7ba05b", "#9b72b0", "#d4a259",
    "#f59e0b", "#10b981", "#3b82f6", "#8b5cf6", "#ec4899", "#f43f5e"};

}  // namespace

CursorBroadcaster::CursorBroadcaster(ChannelTransport& transport, std::string projectId,
                                     std::string localUserId, std::string displayName,
                                     Clock clock, Settings settings)
    : transport_(transport),
      projectId_(std::move(projectId)),
      topic_(topicFor(projectId_, SessionConcern::Cursor)),
      localUserId_(std::move(localUserId)),
      displayName_(std::move(displayName)),
      colorToken_(colorTokenFor(localUserId_)),
      clock_(std::move(clock)),
      settings_(settings) {}

CursorBroadcaster::CursorBroadcaster(ChannelTransport& transport, std::string projectId,
                                     std::string localUserId, std::string displayName,
                                     Clock clock)
    : CursorBroadcaster(transport, std::move(projectId), std::move(localUserId),
                        std::move(displayName), std::move(clock), Settings{}) {}

CursorBroadcaster::~CursorBroadcaster() {
    if (subscription_)
        subscription_->close();
}

std::string CursorBroadcaster::colorTokenFor(const std::string& userId) {
    std::uint32_t hash = 2166136261u;
    for (unsigned char c : userId) {
        hash ^= c;
        hash *= 16777619u;
    }
    return kPalette[hash % PALETTE_SIZE];
}

const std::array<const char*, CursorBroadcaster::PALETTE_SIZE>& CursorBroadcaster::getPalette() {
    return kPalette;
}

void CursorBroadcaster::attach() {
    if (subscription_ && subscription_->isOpen())
        return;

    subscription_ = transport_.join(topic_);
    subscription_->onEvent([this](const ChannelEvent& event) { handleEvent(event); });
}

void CursorBroadcaster::detach() {
    if (subscription_)
        subscription_->close();
    clear();
}

void CursorBroadcaster::moveLocal(double x, double y) {
    submit(x, y);
}

void CursorBroadcaster::leaveLocal() {
    submit(-1.0, -1.0);
}

void CursorBroadcaster::submit(double x, double y) {
    CursorState state;
    state.userId = localUserId_;
    state.x = x;
    state.y = y;
    state.colorToken = colorToken_;
    state.displayName = displayName_;

    const Timestamp now = clock_();
    {
        std::lock_guard<std::mutex> lock(lock_);
        lastLocal_ = state;

        if (lastSentAt_ && now - *lastSentAt_ < settings_.throttleMs) {
            pending_ = state;
            return;
        }
        pending_.reset();
        // The window restarts even when the send fails, so a dead link is not hammered
        lastSentAt_ = now;
    }
    send(state);
}

void CursorBroadcaster::tick() {
    const Timestamp now = clock_();
    CursorState state;
    {
        std::lock_guard<std::mutex> lock(lock_);
        if (!pending_ || (lastSentAt_ && now - *lastSentAt_ < settings_.throttleMs))
            return;

        state = *pending_;
        pending_.reset();
        lastSentAt_ = now;
    }
    send(state);
}

void CursorBroadcaster::reannounce() {
    const Timestamp now = clock_();
    CursorState state;
    {
        std::lock_guard<std::mutex> lock(lock_);
        if (!lastLocal_)
            return;

        state = *lastLocal_;
        pending_.reset();
        lastSentAt_ = now;
    }
    send(state);
}

void CursorBroadcaster::send(const CursorState& state) {
    ChannelEvent event;
    event.type = events::CURSOR_MOVE;
    event.payload = codec::encodeCursorState(state);
    event.ephemeral = true;

    try {
        transport_.publish(topic_, event);
    } catch (const TransportError& e) {
        DBG("Cursor update not sent: " << e.what());
        return;
    }

    std::lock_guard<std::mutex> lock(lock_);
    ++sentCount_;
}

void CursorBroadcaster::setUserFilter(UserFilter filter) {
    std::lock_guard<std::mutex> lock(lock_);
    userFilter_ = std::move(filter);
}

void CursorBroadcaster::removeUser(const std::string& userId) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(lock_);
        removed = remote_.erase(userId) > 0;
    }
    if (removed)
        notify();
}

void CursorBroadcaster::clear() {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(lock_);
        removed = !remote_.empty();
        remote_.clear();
    }
    if (removed)
        notify();
}

std::vector<CursorState> CursorBroadcaster::getVisibleCursors() const {
    std::lock_guard<std::mutex> lock(lock_);
    return buildVisibleLocked();
}

std::optional<CursorState> CursorBroadcaster::getCursor(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(lock_);
    auto it = remote_.find(userId);
    if (it == remote_.end())
        return std::nullopt;
    return it->second;
}

std::uint64_t CursorBroadcaster::getSentCount() const {
    std::lock_guard<std::mutex> lock(lock_);
    return sentCount_;
}

void CursorBroadcaster::addListener(CursorListener* listener) {
    std::lock_guard<std::mutex> lock(lock_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
        listeners_.push_back(listener);
}

void CursorBroadcaster::removeListener(CursorListener* listener) {
    std::lock_guard<std::mutex> lock(lock_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

void CursorBroadcaster::handleEvent(const ChannelEvent& event) {
    if (event.type != events::CURSOR_MOVE)
        return;

    CursorState state;
    try {
        state = codec::decodeCursorState(event.payload);
    } catch (const ConflictApplyError& e) {
        DBG("Cursor event dropped: " << e.what());
        return;
    }

    if (state.userId == localUserId_)
        return;
    if (state.colorToken.empty())
        state.colorToken = colorTokenFor(state.userId);

    UserFilter filter;
    {
        std::lock_guard<std::mutex> lock(lock_);
        filter = userFilter_;
    }
    if (filter && !filter(state.userId)) {
        DBG("Cursor of absent user ignored: " << juce::String(state.userId));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(lock_);
        remote_[state.userId] = state;
    }
    notify();
}

std::vector<CursorState> CursorBroadcaster::buildVisibleLocked() const {
    std::vector<CursorState> visible;
    for (const auto& [userId, state] : remote_) {
        if (state.isVisible())
            visible.push_back(state);
    }
    return visible;
}

void CursorBroadcaster::notify() {
    std::vector<CursorListener*> listeners;
    std::vector<CursorState> visible;
    {
        std::lock_guard<std::mutex> lock(lock_);
        listeners = listeners_;
        visible = buildVisibleLocked();
    }
    for (auto* listener : listeners)
        listener->cursorsChanged(visible);
}

}  // namespace jamroom
