#include "LocalChannelHub.hpp"

#include <juce_core/juce_core.h>

#include <algorithm>

namespace jamroom {

// ============================================================================
// Subscription handle
// ============================================================================

class LocalChannelTransport::Subscription : public ChannelSubscription {
  public:
    Subscription(LocalChannelHub& hub, std::shared_ptr<LocalChannelHub::SubscriptionCore> core)
        : hub_(hub), core_(std::move(core)) {}

    ~Subscription() override {
        close();
    }

    const std::string& getTopic() const override {
        return core_->topic;
    }

    void onEvent(Handler handler) override {
        std::lock_guard<std::mutex> lock(core_->handlerLock);
        core_->handler = std::move(handler);
    }

    void close() override {
        if (core_->open.exchange(false))
            hub_.detach(core_);
    }

    bool isOpen() const override {
        return core_->open.load();
    }

  private:
    LocalChannelHub& hub_;
    std::shared_ptr<LocalChannelHub::SubscriptionCore> core_;
};

// ============================================================================
// Hub
// ============================================================================

LocalChannelHub::~LocalChannelHub() {
    std::lock_guard<std::mutex> lock(lock_);
    topics_.clear();
    queue_.clear();
}

std::unique_ptr<LocalChannelTransport> LocalChannelHub::connect() {
    std::string clientId;
    {
        std::lock_guard<std::mutex> lock(lock_);
        clientId = "local_" + std::to_string(nextClientNumber_++);
    }
    return std::unique_ptr<LocalChannelTransport>(new LocalChannelTransport(*this, clientId));
}

size_t LocalChannelHub::getSubscriberCount(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(lock_);
    auto it = topics_.find(topic);
    return it != topics_.end() ? it->second.size() : 0;
}

void LocalChannelHub::attach(const std::shared_ptr<SubscriptionCore>& core) {
    {
        std::lock_guard<std::mutex> lock(lock_);
        if (core->attached.exchange(true))
            return;

        topics_[core->topic].push_back(core);

        ChannelEvent joined;
        joined.type = SYSTEM_JOIN_EVENT;
        joined.payload = {{"clientId", core->clientId}};
        joined.senderClientId = core->clientId;
        enqueueLocked(core->topic, joined, core.get());
    }
    drain();
}

void LocalChannelHub::detach(const std::shared_ptr<SubscriptionCore>& core) {
    {
        std::lock_guard<std::mutex> lock(lock_);
        if (!core->attached.exchange(false))
            return;

        auto it = topics_.find(core->topic);
        if (it != topics_.end()) {
            auto& subscribers = it->second;
            subscribers.erase(std::remove(subscribers.begin(), subscribers.end(), core),
                              subscribers.end());
            if (subscribers.empty())
                topics_.erase(it);
        }

        ChannelEvent left;
        left.type = SYSTEM_LEAVE_EVENT;
        left.payload = {{"clientId", core->clientId}};
        left.senderClientId = core->clientId;
        enqueueLocked(core->topic, left, core.get());
    }
    drain();
}

void LocalChannelHub::enqueue(const std::string& topic, const ChannelEvent& event,
                              const SubscriptionCore* exclude) {
    {
        std::lock_guard<std::mutex> lock(lock_);
        enqueueLocked(topic, event, exclude);
    }
    drain();
}

void LocalChannelHub::enqueueLocked(const std::string& topic, const ChannelEvent& event,
                                    const SubscriptionCore* exclude) {
    auto it = topics_.find(topic);
    if (it == topics_.end())
        return;

    // Targets are fixed at publish time: later joiners never see this event
    Delivery delivery;
    delivery.topic = topic;
    delivery.event = event;
    for (const auto& core : it->second) {
        if (core.get() != exclude)
            delivery.targets.push_back(core);
    }

    if (!delivery.targets.empty())
        queue_.push_back(std::move(delivery));
}

void LocalChannelHub::drain() {
    {
        std::lock_guard<std::mutex> lock(lock_);
        if (dispatching_)
            return;
        dispatching_ = true;
    }

    while (true) {
        Delivery delivery;
        {
            std::lock_guard<std::mutex> lock(lock_);
            if (queue_.empty()) {
                dispatching_ = false;
                return;
            }
            delivery = std::move(queue_.front());
            queue_.pop_front();
        }

        for (const auto& target : delivery.targets) {
            if (!target->open.load() || !target->attached.load())
                continue;

            ChannelSubscription::Handler handler;
            {
                std::lock_guard<std::mutex> lock(target->handlerLock);
                handler = target->handler;
            }
            if (!handler)
                continue;

            try {
                handler(delivery.event);
                ++delivered_;
            } catch (const std::exception& e) {
                juce::Logger::writeToLog("LocalChannelHub: handler on " +
                                         juce::String(delivery.topic) + " threw for '" +
                                         juce::String(delivery.event.type) + "': " + e.what());
            }
        }
    }
}

// ============================================================================
// Endpoint
// ============================================================================

LocalChannelTransport::LocalChannelTransport(LocalChannelHub& hub, std::string clientId)
    : hub_(hub), clientId_(std::move(clientId)) {}

LocalChannelTransport::~LocalChannelTransport() {
    std::vector<std::shared_ptr<LocalChannelHub::SubscriptionCore>> live;
    {
        std::lock_guard<std::mutex> lock(lock_);
        for (auto& weak : cores_) {
            if (auto core = weak.lock())
                live.push_back(core);
        }
        cores_.clear();
    }
    for (auto& core : live) {
        core->open = false;
        hub_.detach(core);
    }
}

std::unique_ptr<ChannelSubscription> LocalChannelTransport::join(const std::string& topic) {
    auto core = std::make_shared<LocalChannelHub::SubscriptionCore>();
    core->topic = topic;
    core->clientId = clientId_;

    bool connected = false;
    {
        std::lock_guard<std::mutex> lock(lock_);
        cores_.erase(std::remove_if(cores_.begin(), cores_.end(),
                                    [](const auto& weak) { return weak.expired(); }),
                     cores_.end());
        cores_.push_back(core);
        connected = state_ == ConnectionState::Connected;
    }

    // Joined while offline: attached on reconnect
    if (connected)
        hub_.attach(core);

    return std::make_unique<Subscription>(hub_, core);
}

void LocalChannelTransport::publish(const std::string& topic, const ChannelEvent& event) {
    {
        std::lock_guard<std::mutex> lock(lock_);
        if (state_ != ConnectionState::Connected)
            throw TransportError("Cannot publish to " + topic + ": transport " +
                                 getConnectionStateName(state_));

        bool joined = std::any_of(cores_.begin(), cores_.end(), [&topic](const auto& weak) {
            auto core = weak.lock();
            return core && core->open.load() && core->topic == topic;
        });
        if (!joined)
            throw TransportError("Publish to unjoined topic: " + topic);
    }

    ChannelEvent stamped = event;
    stamped.senderClientId = clientId_;
    hub_.enqueue(topic, stamped, nullptr);
}

ConnectionState LocalChannelTransport::getConnectionState() const {
    std::lock_guard<std::mutex> lock(lock_);
    return state_;
}

void LocalChannelTransport::addListener(ChannelTransportListener* listener) {
    std::lock_guard<std::mutex> lock(lock_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
        listeners_.push_back(listener);
}

void LocalChannelTransport::removeListener(ChannelTransportListener* listener) {
    std::lock_guard<std::mutex> lock(lock_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

void LocalChannelTransport::simulateDisconnect() {
    std::vector<std::shared_ptr<LocalChannelHub::SubscriptionCore>> live;
    {
        std::lock_guard<std::mutex> lock(lock_);
        if (state_ != ConnectionState::Connected)
            return;
        for (auto& weak : cores_) {
            if (auto core = weak.lock())
                live.push_back(core);
        }
    }

    for (auto& core : live)
        hub_.detach(core);

    setState(ConnectionState::Reconnecting);
}

void LocalChannelTransport::simulateReconnect() {
    std::vector<std::shared_ptr<LocalChannelHub::SubscriptionCore>> live;
    {
        std::lock_guard<std::mutex> lock(lock_);
        if (state_ == ConnectionState::Connected)
            return;
        state_ = ConnectionState::Connected;
        for (auto& weak : cores_) {
            auto core = weak.lock();
            if (core && core->open.load())
                live.push_back(core);
        }
    }

    for (auto& core : live)
        hub_.attach(core);

    setState(ConnectionState::Connected);
}

void LocalChannelTransport::setState(ConnectionState state) {
    std::vector<ChannelTransportListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(lock_);
        state_ = state;
        listeners = listeners_;
    }

    DBG("LocalChannelTransport " << juce::String(clientId_) << ": "
                                 << getConnectionStateName(state));

    for (auto* listener : listeners)
        listener->connectionStateChanged(state);
}

}  // namespace jamroom
