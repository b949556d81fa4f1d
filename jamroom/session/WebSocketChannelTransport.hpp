#pragma once

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "ChannelTransport.hpp"
#include "ReconnectBackoff.hpp"

namespace jamroom {

/**
 * @brief Channel transport connected to a WebSocketHubServer
 *
 * Runs its own asio thread. Subscriptions outlive the connection: after a
 * drop the transport reconnects with exponential backoff, joins every topic
 * that still has an open subscription, and only then reports Connected.
 * Handlers and listeners are called on the asio thread.
 */
class WebSocketChannelTransport : public ChannelTransport {
  public:
    using WebSocketClient = websocketpp::client<websocketpp::config::asio_client>;
    using ConnectionHdl = websocketpp::connection_hdl;

    /**
     * @param uri Hub address, e.g. "ws://127.0.0.1:8787"
     */
    WebSocketChannelTransport(std::string uri, ReconnectBackoff::Settings backoff);
    explicit WebSocketChannelTransport(std::string uri);
    ~WebSocketChannelTransport() override;

    WebSocketChannelTransport(const WebSocketChannelTransport&) = delete;
    WebSocketChannelTransport& operator=(const WebSocketChannelTransport&) = delete;

    /**
     * @brief Start the network thread and the first connection attempt
     * @return true if the client started
     */
    bool start();

    /**
     * @brief Close the connection and stop reconnecting
     */
    void stop();

    // ChannelTransport implementation
    std::unique_ptr<ChannelSubscription> join(const std::string& topic) override;
    void publish(const std::string& topic, const ChannelEvent& event) override;
    ConnectionState getConnectionState() const override;
    std::string getClientId() const override;
    void addListener(ChannelTransportListener* listener) override;
    void removeListener(ChannelTransportListener* listener) override;

    const std::string& getUri() const {
        return uri_;
    }

  private:
    class Subscription;

    struct SubscriptionCore {
        std::string topic;
        std::mutex handlerLock;
        ChannelSubscription::Handler handler;
        std::atomic<bool> open{true};
    };

    void connectNow();
    void scheduleReconnect();
    void onOpen(ConnectionHdl hdl);
    void onFail(ConnectionHdl hdl);
    void onClose(ConnectionHdl hdl);
    void onMessage(ConnectionHdl hdl, WebSocketClient::message_ptr msg);

    void handleWelcome(const Envelope& envelope);
    void dispatch(const std::string& topic, const ChannelEvent& event);
    void release(const std::shared_ptr<SubscriptionCore>& core);
    void sendEnvelope(const Envelope& envelope);
    void setState(ConnectionState state);

    const std::string uri_;
    WebSocketClient client_;
    std::thread thread_;
    ReconnectBackoff backoff_;

    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::Disconnected;
    ConnectionHdl connection_;
    std::string client_id_;
    bool running_ = false;
    bool stopping_ = false;
    WebSocketClient::timer_ptr reconnect_timer_;
    std::map<std::string, std::vector<std::shared_ptr<SubscriptionCore>>> topics_;
    std::vector<ChannelTransportListener*> listeners_;
};

}  // namespace jamroom
