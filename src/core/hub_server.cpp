#include "jamroom/core/hub_server.hpp"

#include <iostream>
#include <random>
#include <sstream>

namespace jamroom {

WebSocketHubServer::WebSocketHubServer(int port, size_t max_buffered_bytes)
    : port_(port), max_buffered_bytes_(max_buffered_bytes), running_(false) {
    // Set up server
    server_.set_access_channels(websocketpp::log::alevel::connect |
                                websocketpp::log::alevel::disconnect);
    server_.clear_access_channels(websocketpp::log::alevel::frame_payload);
    server_.set_reuse_addr(true);

    server_.init_asio();

    // Set up handlers
    server_.set_open_handler([this](ConnectionHdl hdl) { onOpen(hdl); });
    server_.set_close_handler([this](ConnectionHdl hdl) { onClose(hdl); });
    server_.set_message_handler([this](ConnectionHdl hdl, WebSocketServer::message_ptr msg) {
        onMessage(hdl, msg);
    });
}

WebSocketHubServer::~WebSocketHubServer() {
    stop();
}

bool WebSocketHubServer::start() {
    try {
        std::lock_guard<std::mutex> lock(mutex_);

        if (running_) {
            return true;
        }

        server_.listen(port_);
        server_.start_accept();

        // Run server in a separate thread
        server_thread_ = std::thread([this]() {
            try {
                server_.run();
            } catch (const std::exception& e) {
                std::cerr << "Hub server error: " << e.what() << std::endl;
            }
        });

        running_ = true;
        std::cout << "Channel hub started on port " << port_ << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Failed to start hub: " << e.what() << std::endl;
        return false;
    }
}

void WebSocketHubServer::stop() {
    std::vector<ConnectionHdl> open_connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        for (const auto& [hdl, client_id] : connections_) {
            open_connections.push_back(hdl);
        }
    }

    // Close handlers take the mutex, so the server is stopped without holding it
    try {
        websocketpp::lib::error_code ec;
        server_.stop_listening(ec);
        for (auto& hdl : open_connections) {
            server_.close(hdl, websocketpp::close::status::going_away, "hub shutting down", ec);
        }
        server_.stop();

        if (server_thread_.joinable()) {
            server_thread_.join();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error stopping hub: " << e.what() << std::endl;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    connections_.clear();
    connection_topics_.clear();
    topics_.clear();
    std::cout << "Channel hub stopped" << std::endl;
}

std::vector<std::string> WebSocketHubServer::getConnectedClients() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> client_ids;
    for (const auto& [hdl, client_id] : connections_) {
        client_ids.push_back(client_id);
    }
    return client_ids;
}

size_t WebSocketHubServer::getClientCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

size_t WebSocketHubServer::getSubscriberCount(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = topics_.find(topic);
    return it != topics_.end() ? it->second.size() : 0;
}

void WebSocketHubServer::onOpen(ConnectionHdl hdl) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string client_id = generateClientId();
    connections_[hdl] = client_id;
    connection_topics_[hdl];

    std::cout << "Client connected: " << client_id << std::endl;

    Envelope welcome(Envelope::Op::Welcome);
    welcome.setClientId(client_id);
    welcome.setMessage("jamroom-hub 0.1.0");
    sendEnvelope(hdl, welcome);
}

void WebSocketHubServer::onClose(ConnectionHdl hdl) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = connections_.find(hdl);
    if (it == connections_.end()) {
        return;
    }

    std::string client_id = it->second;
    std::cout << "Client disconnected: " << client_id << std::endl;

    // Copy: leaveTopic edits the set
    auto joined = connection_topics_[hdl];
    for (const auto& topic : joined) {
        leaveTopic(hdl, client_id, topic);
    }

    connection_topics_.erase(hdl);
    connections_.erase(it);
}

void WebSocketHubServer::onMessage(ConnectionHdl hdl, WebSocketServer::message_ptr msg) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = connections_.find(hdl);
    if (it == connections_.end()) {
        return;
    }

    try {
        Envelope envelope = Envelope::fromJsonString(msg->get_payload());
        processEnvelope(hdl, it->second, envelope);
    } catch (const std::exception& e) {
        std::cerr << "Error processing message from " << it->second << ": " << e.what()
                  << std::endl;

        Envelope error(Envelope::Op::Error);
        error.setMessage(e.what());
        sendEnvelope(hdl, error);
    }
}

void WebSocketHubServer::processEnvelope(ConnectionHdl hdl, const std::string& client_id,
                                         const Envelope& envelope) {
    switch (envelope.getOp()) {
        case Envelope::Op::Join:
            joinTopic(hdl, client_id, envelope.getTopic());
            break;
        case Envelope::Op::Leave:
            leaveTopic(hdl, client_id, envelope.getTopic());
            break;
        case Envelope::Op::Publish: {
            auto topic_it = topics_.find(envelope.getTopic());
            if (topic_it == topics_.end() || topic_it->second.count(hdl) == 0) {
                throw std::runtime_error("Publish to unjoined topic: " + envelope.getTopic());
            }
            ChannelEvent event = envelope.getEvent();
            event.senderClientId = client_id;
            fanOut(envelope.getTopic(), event, nullptr);
            break;
        }
        case Envelope::Op::Welcome:
        case Envelope::Op::Event:
        case Envelope::Op::Error:
            throw std::runtime_error(std::string("Unexpected op from client: ") +
                                     Envelope::opToString(envelope.getOp()));
    }
}

void WebSocketHubServer::joinTopic(ConnectionHdl hdl, const std::string& client_id,
                                   const std::string& topic) {
    auto& subscribers = topics_[topic];
    if (!subscribers.insert(hdl).second) {
        return;
    }
    connection_topics_[hdl].insert(topic);

    ChannelEvent joined;
    joined.type = SYSTEM_JOIN_EVENT;
    joined.payload = {{"clientId", client_id}};
    joined.senderClientId = client_id;
    fanOut(topic, joined, &hdl);
}

void WebSocketHubServer::leaveTopic(ConnectionHdl hdl, const std::string& client_id,
                                    const std::string& topic) {
    auto it = topics_.find(topic);
    if (it == topics_.end() || it->second.erase(hdl) == 0) {
        return;
    }
    connection_topics_[hdl].erase(topic);

    if (it->second.empty()) {
        topics_.erase(it);
        return;
    }

    ChannelEvent left;
    left.type = SYSTEM_LEAVE_EVENT;
    left.payload = {{"clientId", client_id}};
    left.senderClientId = client_id;
    fanOut(topic, left, nullptr);
}

void WebSocketHubServer::fanOut(const std::string& topic, const ChannelEvent& event,
                                const ConnectionHdl* skip) {
    auto it = topics_.find(topic);
    if (it == topics_.end()) {
        return;
    }

    Envelope envelope(Envelope::Op::Event, topic);
    envelope.setEvent(event);
    const std::string message = envelope.toJsonString();

    for (const auto& hdl : it->second) {
        if (skip != nullptr && !hdl.owner_before(*skip) && !skip->owner_before(hdl)) {
            continue;
        }
        if (event.ephemeral && isCongested(hdl)) {
            ++dropped_ephemeral_;
            continue;
        }
        try {
            server_.send(hdl, message, websocketpp::frame::opcode::text);
        } catch (const std::exception& e) {
            std::cerr << "Failed to deliver to " << connections_[hdl] << " on " << topic << ": "
                      << e.what() << std::endl;
        }
    }
}

void WebSocketHubServer::sendEnvelope(ConnectionHdl hdl, const Envelope& envelope) {
    try {
        server_.send(hdl, envelope.toJsonString(), websocketpp::frame::opcode::text);
    } catch (const std::exception& e) {
        std::cerr << "Failed to send " << Envelope::opToString(envelope.getOp()) << ": " << e.what()
                  << std::endl;
    }
}

bool WebSocketHubServer::isCongested(ConnectionHdl hdl) {
    websocketpp::lib::error_code ec;
    auto connection = server_.get_con_from_hdl(hdl, ec);
    if (ec || !connection) {
        return true;
    }
    return connection->get_buffered_amount() > max_buffered_bytes_;
}

std::string WebSocketHubServer::generateClientId() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(1000, 9999);

    std::stringstream ss;
    ss << "client_" << next_client_number_++ << "_" << dis(gen);
    return ss.str();
}

}  // namespace jamroom
