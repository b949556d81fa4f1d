#pragma once

#include <functional>
#include <memory>
#include <string>

#include "jamroom/core/envelope.hpp"
#include "jamroom/core/errors.hpp"

namespace jamroom {

/**
 * @brief Connection state of a transport endpoint
 */
enum class ConnectionState { Disconnected, Connecting, Connected, Reconnecting };

inline const char* getConnectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected:
            return "Disconnected";
        case ConnectionState::Connecting:
            return "Connecting";
        case ConnectionState::Connected:
            return "Connected";
        case ConnectionState::Reconnecting:
            return "Reconnecting";
    }
    return "Unknown";
}

/**
 * @brief Handle to one joined topic
 *
 * Events are delivered to the handler in the order the topic received them.
 * Closing is idempotent; no handler call starts after close() returns on the
 * delivering thread.
 */
class ChannelSubscription {
  public:
    using Handler = std::function<void(const ChannelEvent&)>;

    virtual ~ChannelSubscription() = default;

    virtual const std::string& getTopic() const = 0;

    /**
     * @brief Install the event handler, replacing any previous one
     */
    virtual void onEvent(Handler handler) = 0;

    /**
     * @brief Leave the topic
     */
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
};

/**
 * @brief Listener interface for connection state changes
 */
class ChannelTransportListener {
  public:
    virtual ~ChannelTransportListener() = default;

    // Called after the state changed. On Connected after a reconnect, every
    // previously joined topic has already been re-joined.
    virtual void connectionStateChanged(ConnectionState state) = 0;
};

/**
 * @brief Named multi-subscriber pub/sub channel
 *
 * Guarantees at-least-once delivery to the subscribers connected at publish
 * time, publisher included. No replay for later joiners. Topics are
 * independent of each other.
 */
class ChannelTransport {
  public:
    virtual ~ChannelTransport() = default;

    /**
     * @brief Join a topic
     */
    virtual std::unique_ptr<ChannelSubscription> join(const std::string& topic) = 0;

    /**
     * @brief Publish an event to every subscriber of a topic
     * @throws TransportError if the transport is not connected
     */
    virtual void publish(const std::string& topic, const ChannelEvent& event) = 0;

    virtual ConnectionState getConnectionState() const = 0;

    /**
     * @brief Id the hub knows this endpoint by; sender id of its events
     */
    virtual std::string getClientId() const = 0;

    virtual void addListener(ChannelTransportListener* listener) = 0;
    virtual void removeListener(ChannelTransportListener* listener) = 0;
};

}  // namespace jamroom
