#pragma once

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "envelope.hpp"
#include "hub_server_interface.hpp"

namespace jamroom {

/**
 * @brief WebSocket channel hub
 *
 * One process serving any number of projects. Topics are plain strings
 * ("project:<id>:tracks"), so each project's concerns are independent rooms.
 * Events are delivered to every subscriber of the topic, the publisher
 * included, in the order the hub received them.
 *
 * Backpressure: an ephemeral event is skipped for a connection whose outgoing
 * buffer already holds more than maxBufferedBytes. Durable events are always
 * queued.
 */
class WebSocketHubServer : public HubServerInterface {
  public:
    using WebSocketServer = websocketpp::server<websocketpp::config::asio>;
    using ConnectionHdl = websocketpp::connection_hdl;

    /**
     * @brief Construct WebSocket hub server
     * @param port Port to listen on
     * @param max_buffered_bytes Outgoing buffer size above which ephemeral events are dropped
     */
    explicit WebSocketHubServer(int port = 8787, size_t max_buffered_bytes = 1 << 20);

    ~WebSocketHubServer() override;

    // HubServerInterface implementation
    bool start() override;
    void stop() override;
    bool isRunning() const override {
        return running_;
    }
    std::vector<std::string> getConnectedClients() const override;
    size_t getClientCount() const override;
    size_t getSubscriberCount(const std::string& topic) const override;
    std::uint64_t getDroppedEphemeralCount() const override {
        return dropped_ephemeral_.load();
    }
    std::string getServerType() const override {
        return "WebSocket";
    }
    int getPort() const override {
        return port_;
    }

  private:
    // WebSocket event handlers
    void onOpen(ConnectionHdl hdl);
    void onClose(ConnectionHdl hdl);
    void onMessage(ConnectionHdl hdl, WebSocketServer::message_ptr msg);

    // Envelope processing (mutex_ held)
    void processEnvelope(ConnectionHdl hdl, const std::string& client_id, const Envelope& envelope);
    void joinTopic(ConnectionHdl hdl, const std::string& client_id, const std::string& topic);
    void leaveTopic(ConnectionHdl hdl, const std::string& client_id, const std::string& topic);
    void fanOut(const std::string& topic, const ChannelEvent& event, const ConnectionHdl* skip);
    void sendEnvelope(ConnectionHdl hdl, const Envelope& envelope);
    bool isCongested(ConnectionHdl hdl);

    std::string generateClientId();

    WebSocketServer server_;
    std::thread server_thread_;

    int port_;
    size_t max_buffered_bytes_;
    bool running_;
    std::atomic<std::uint64_t> dropped_ephemeral_{0};
    std::uint64_t next_client_number_ = 1;

    // Client tracking
    std::map<ConnectionHdl, std::string, std::owner_less<ConnectionHdl>> connections_;
    std::map<ConnectionHdl, std::set<std::string>, std::owner_less<ConnectionHdl>>
        connection_topics_;
    std::map<std::string, std::set<ConnectionHdl, std::owner_less<ConnectionHdl>>> topics_;

    mutable std::mutex mutex_;
};

}  // namespace jamroom
