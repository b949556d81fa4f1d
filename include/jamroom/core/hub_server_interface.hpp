#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace jamroom {

/**
 * @brief Base interface for channel hub servers
 *
 * A hub multiplexes project topics (presence, cursor, tracks, chat) onto the
 * connected client handles and fans published events out to every subscriber.
 */
class HubServerInterface {
  public:
    virtual ~HubServerInterface() = default;

    /**
     * @brief Start the server
     * @return true if started successfully
     */
    virtual bool start() = 0;

    /**
     * @brief Stop the server
     */
    virtual void stop() = 0;

    /**
     * @brief Check if server is running
     */
    virtual bool isRunning() const = 0;

    /**
     * @brief Get list of connected client IDs
     */
    virtual std::vector<std::string> getConnectedClients() const = 0;

    /**
     * @brief Get number of connected clients
     */
    virtual size_t getClientCount() const = 0;

    /**
     * @brief Get number of clients subscribed to a topic
     */
    virtual size_t getSubscriberCount(const std::string& topic) const = 0;

    /**
     * @brief Number of ephemeral events dropped for slow consumers
     */
    virtual std::uint64_t getDroppedEphemeralCount() const = 0;

    /**
     * @brief Get server type identifier
     */
    virtual std::string getServerType() const = 0;

    /**
     * @brief Get server port
     */
    virtual int getPort() const = 0;
};

}  // namespace jamroom
