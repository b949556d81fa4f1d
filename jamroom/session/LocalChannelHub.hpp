#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ChannelTransport.hpp"

namespace jamroom {

class LocalChannelTransport;

/**
 * @brief In-process channel hub
 *
 * Same delivery contract as the WebSocket hub, without the network: events
 * are queued in one FIFO and dispatched by whichever thread is publishing.
 * A publish issued from inside a handler is queued behind the current event
 * instead of recursing, so per-publisher order holds for every subscriber.
 *
 * Each connect() returns an endpoint playing the role of one client. The
 * endpoint can drop and restore its connection to exercise reconnect paths.
 */
class LocalChannelHub {
  public:
    LocalChannelHub() = default;
    ~LocalChannelHub();

    LocalChannelHub(const LocalChannelHub&) = delete;
    LocalChannelHub& operator=(const LocalChannelHub&) = delete;

    /**
     * @brief Create a connected endpoint
     */
    std::unique_ptr<LocalChannelTransport> connect();

    size_t getSubscriberCount(const std::string& topic) const;

    /**
     * @brief Number of events delivered to handlers so far
     */
    std::uint64_t getDeliveredCount() const {
        return delivered_.load();
    }

  private:
    friend class LocalChannelTransport;

    struct SubscriptionCore {
        std::string topic;
        std::string clientId;
        std::mutex handlerLock;
        ChannelSubscription::Handler handler;
        std::atomic<bool> open{true};
        std::atomic<bool> attached{false};
    };

    struct Delivery {
        std::string topic;
        ChannelEvent event;
        std::vector<std::shared_ptr<SubscriptionCore>> targets;
    };

    void attach(const std::shared_ptr<SubscriptionCore>& core);
    void detach(const std::shared_ptr<SubscriptionCore>& core);
    void enqueue(const std::string& topic, const ChannelEvent& event,
                 const SubscriptionCore* exclude);
    void enqueueLocked(const std::string& topic, const ChannelEvent& event,
                       const SubscriptionCore* exclude);
    void drain();

    mutable std::mutex lock_;
    std::map<std::string, std::vector<std::shared_ptr<SubscriptionCore>>> topics_;
    std::deque<Delivery> queue_;
    bool dispatching_ = false;
    std::uint64_t nextClientNumber_ = 1;
    std::atomic<std::uint64_t> delivered_{0};
};

/**
 * @brief One client endpoint of a LocalChannelHub
 */
class LocalChannelTransport : public ChannelTransport {
  public:
    ~LocalChannelTransport() override;

    // ChannelTransport implementation
    std::unique_ptr<ChannelSubscription> join(const std::string& topic) override;
    void publish(const std::string& topic, const ChannelEvent& event) override;
    ConnectionState getConnectionState() const override;
    std::string getClientId() const override {
        return clientId_;
    }
    void addListener(ChannelTransportListener* listener) override;
    void removeListener(ChannelTransportListener* listener) override;

    /**
     * @brief Drop the connection as a network failure would
     *
     * Other endpoints see system.leave on every topic this endpoint held.
     */
    void simulateDisconnect();

    /**
     * @brief Restore the connection and re-join every topic still open
     */
    void simulateReconnect();

  private:
    friend class LocalChannelHub;
    class Subscription;

    LocalChannelTransport(LocalChannelHub& hub, std::string clientId);

    void setState(ConnectionState state);

    LocalChannelHub& hub_;
    const std::string clientId_;
    mutable std::mutex lock_;
    ConnectionState state_ = ConnectionState::Connected;
    std::vector<std::weak_ptr<LocalChannelHub::SubscriptionCore>> cores_;
    std::vector<ChannelTransportListener*> listeners_;
};

}  // namespace jamroom
