#include "WebSocketChannelTransport.hpp"

#include <juce_core/juce_core.h>

#include <algorithm>
#include <iostream>

namespace jamroom {

// ============================================================================
// Subscription handle
// ============================================================================

class WebSocketChannelTransport::Subscription : public ChannelSubscription {
  public:
    Subscription(WebSocketChannelTransport& transport, std::shared_ptr<SubscriptionCore> core)
        : transport_(transport), core_(std::move(core)) {}

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
            transport_.release(core_);
    }

    bool isOpen() const override {
        return core_->open.load();
    }

  private:
    WebSocketChannelTransport& transport_;
    std::shared_ptr<SubscriptionCore> core_;
};

// ============================================================================
// Lifecycle
// ============================================================================

WebSocketChannelTransport::WebSocketChannelTransport(std::string uri,
                                                     ReconnectBackoff::Settings backoff)
    : uri_(std::move(uri)), backoff_(backoff) {
    client_.clear_access_channels(websocketpp::log::alevel::all);
    client_.set_error_channels(websocketpp::log::elevel::warn | websocketpp::log::elevel::rerror |
                               websocketpp::log::elevel::fatal);

    client_.init_asio();

    client_.set_open_handler([this](ConnectionHdl hdl) { onOpen(hdl); });
    client_.set_fail_handler([this](ConnectionHdl hdl) { onFail(hdl); });
    client_.set_close_handler([this](ConnectionHdl hdl) { onClose(hdl); });
    client_.set_message_handler([this](ConnectionHdl hdl, WebSocketClient::message_ptr msg) {
        onMessage(hdl, msg);
    });
}

WebSocketChannelTransport::WebSocketChannelTransport(std::string uri)
    : WebSocketChannelTransport(std::move(uri), ReconnectBackoff::Settings{}) {}

WebSocketChannelTransport::~WebSocketChannelTransport() {
    stop();
}

bool WebSocketChannelTransport::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_)
            return true;

        running_ = true;
        stopping_ = false;
    }

    try {
        // Keeps run() alive between connection attempts
        client_.start_perpetual();
        thread_ = std::thread([this]() {
            try {
                client_.run();
            } catch (const std::exception& e) {
                std::cerr << "Channel transport error: " << e.what() << std::endl;
            }
        });
    } catch (const std::exception& e) {
        std::cerr << "Failed to start channel transport: " << e.what() << std::endl;
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        return false;
    }

    setState(ConnectionState::Connecting);
    connectNow();
    return true;
}

void WebSocketChannelTransport::stop() {
    ConnectionHdl connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_)
            return;

        running_ = false;
        stopping_ = true;
        connection = connection_;
        if (reconnect_timer_)
            reconnect_timer_->cancel();
    }

    websocketpp::lib::error_code ec;
    if (!connection.expired())
        client_.close(connection, websocketpp::close::status::normal, "client closing", ec);
    client_.stop_perpetual();
    client_.stop();

    if (thread_.joinable())
        thread_.join();

    setState(ConnectionState::Disconnected);
    juce::Logger::writeToLog("Channel transport stopped: " + juce::String(uri_));
}

void WebSocketChannelTransport::connectNow() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_)
            return;
    }

    websocketpp::lib::error_code ec;
    WebSocketClient::connection_ptr connection = client_.get_connection(uri_, ec);
    if (ec) {
        std::cerr << "Cannot connect to " << uri_ << ": " << ec.message() << std::endl;
        scheduleReconnect();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = connection->get_handle();
    }
    client_.connect(connection);
}

void WebSocketChannelTransport::scheduleReconnect() {
    int delay = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_)
            return;

        delay = backoff_.nextDelayMs();
        reconnect_timer_ = client_.set_timer(delay, [this](const websocketpp::lib::error_code& ec) {
            if (!ec)
                connectNow();
        });
    }

    DBG("Channel transport retrying in " << delay << " ms");
    setState(ConnectionState::Reconnecting);
}

// ============================================================================
// Connection handlers
// ============================================================================

void WebSocketChannelTransport::onOpen(ConnectionHdl) {
    // Connected is reported once the welcome assigns our client id
    DBG("Channel transport socket open: " << juce::String(uri_));
}

void WebSocketChannelTransport::onFail(ConnectionHdl hdl) {
    websocketpp::lib::error_code ec;
    auto connection = client_.get_con_from_hdl(hdl, ec);
    if (connection)
        DBG("Channel transport connect failed: "
            << juce::String(connection->get_ec().message()));

    scheduleReconnect();
}

void WebSocketChannelTransport::onClose(ConnectionHdl) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client_id_.clear();
        if (stopping_)
            return;
    }

    juce::Logger::writeToLog("Channel transport lost connection to " + juce::String(uri_));
    scheduleReconnect();
}

void WebSocketChannelTransport::onMessage(ConnectionHdl, WebSocketClient::message_ptr msg) {
    try {
        Envelope envelope = Envelope::fromJsonString(msg->get_payload());
        switch (envelope.getOp()) {
            case Envelope::Op::Welcome:
                handleWelcome(envelope);
                break;
            case Envelope::Op::Event:
                dispatch(envelope.getTopic(), envelope.getEvent());
                break;
            case Envelope::Op::Error:
                std::cerr << "Hub reported error: " << envelope.getMessage() << std::endl;
                break;
            case Envelope::Op::Join:
            case Envelope::Op::Leave:
            case Envelope::Op::Publish:
                std::cerr << "Unexpected op from hub: " << Envelope::opToString(envelope.getOp())
                          << std::endl;
                break;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error processing hub message: " << e.what() << std::endl;
    }
}

void WebSocketChannelTransport::handleWelcome(const Envelope& envelope) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client_id_ = envelope.getClientId();
        backoff_.reset();

        // Re-join before anyone is told we are back
        for (const auto& [topic, cores] : topics_) {
            websocketpp::lib::error_code ec;
            client_.send(connection_, Envelope(Envelope::Op::Join, topic).toJsonString(),
                         websocketpp::frame::opcode::text, ec);
            if (ec)
                std::cerr << "Failed to re-join " << topic << ": " << ec.message() << std::endl;
        }
    }

    juce::Logger::writeToLog("Channel transport connected to " + juce::String(uri_) + " as " +
                             juce::String(envelope.getClientId()));
    setState(ConnectionState::Connected);
}

void WebSocketChannelTransport::dispatch(const std::string& topic, const ChannelEvent& event) {
    std::vector<std::shared_ptr<SubscriptionCore>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = topics_.find(topic);
        if (it == topics_.end())
            return;
        targets = it->second;
    }

    for (const auto& core : targets) {
        if (!core->open.load())
            continue;

        ChannelSubscription::Handler handler;
        {
            std::lock_guard<std::mutex> lock(core->handlerLock);
            handler = core->handler;
        }
        if (!handler)
            continue;

        try {
            handler(event);
        } catch (const std::exception& e) {
            juce::Logger::writeToLog("Channel handler on " + juce::String(topic) + " threw for '" +
                                     juce::String(event.type) + "': " + e.what());
        }
    }
}

// ============================================================================
// ChannelTransport
// ============================================================================

std::unique_ptr<ChannelSubscription> WebSocketChannelTransport::join(const std::string& topic) {
    auto core = std::make_shared<SubscriptionCore>();
    core->topic = topic;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& cores = topics_[topic];
        const bool first = cores.empty();
        cores.push_back(core);

        // Topics joined while offline are sent on the next welcome
        if (first && state_ == ConnectionState::Connected) {
            websocketpp::lib::error_code ec;
            client_.send(connection_, Envelope(Envelope::Op::Join, topic).toJsonString(),
                         websocketpp::frame::opcode::text, ec);
            if (ec)
                DBG("Join of " << juce::String(topic)
                               << " deferred: " << juce::String(ec.message()));
        }
    }

    return std::make_unique<Subscription>(*this, core);
}

void WebSocketChannelTransport::release(const std::shared_ptr<SubscriptionCore>& core) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = topics_.find(core->topic);
    if (it == topics_.end())
        return;

    auto& cores = it->second;
    cores.erase(std::remove(cores.begin(), cores.end(), core), cores.end());
    if (!cores.empty())
        return;

    topics_.erase(it);
    if (state_ == ConnectionState::Connected) {
        websocketpp::lib::error_code ec;
        client_.send(connection_, Envelope(Envelope::Op::Leave, core->topic).toJsonString(),
                     websocketpp::frame::opcode::text, ec);
    }
}

void WebSocketChannelTransport::publish(const std::string& topic, const ChannelEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Connected)
        throw TransportError("Cannot publish to " + topic + ": transport " +
                             getConnectionStateName(state_));
    if (topics_.count(topic) == 0)
        throw TransportError("Publish to unjoined topic: " + topic);

    Envelope envelope(Envelope::Op::Publish, topic);
    envelope.setEvent(event);

    websocketpp::lib::error_code ec;
    client_.send(connection_, envelope.toJsonString(), websocketpp::frame::opcode::text, ec);
    if (ec)
        throw TransportError("Publish to " + topic + " failed: " + ec.message());
}

ConnectionState WebSocketChannelTransport::getConnectionState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string WebSocketChannelTransport::getClientId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_id_;
}

void WebSocketChannelTransport::addListener(ChannelTransportListener* listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
        listeners_.push_back(listener);
}

void WebSocketChannelTransport::removeListener(ChannelTransportListener* listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

void WebSocketChannelTransport::setState(ConnectionState state) {
    std::vector<ChannelTransportListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == state)
            return;
        state_ = state;
        listeners = listeners_;
    }

    for (auto* listener : listeners)
        listener->connectionStateChanged(state);
}

}  // namespace jamroom
