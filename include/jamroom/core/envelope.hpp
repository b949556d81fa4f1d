#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace jamroom {

/**
 * @brief One event broadcast on a channel topic
 *
 * The type names the concern ("presence.join", "track.mutation", ...). Events
 * flagged ephemeral may be dropped by the hub for slow consumers.
 */
struct ChannelEvent {
    std::string type;
    nlohmann::json payload = nlohmann::json::object();
    std::string senderClientId;  // Filled in by the transport on delivery
    bool ephemeral = false;

    nlohmann::json toJson() const;
    static ChannelEvent fromJson(const nlohmann::json& json);
};

// System events emitted by the transport itself
constexpr const char* SYSTEM_JOIN_EVENT = "system.join";
constexpr const char* SYSTEM_LEAVE_EVENT = "system.leave";

/**
 * @brief Wire message exchanged between hub and clients
 *
 * Every message is a JSON object with an "op" field. Clients send join, leave
 * and publish; the hub sends welcome, event and error.
 */
class Envelope {
  public:
    enum class Op { Welcome, Join, Leave, Publish, Event, Error };

    explicit Envelope(Op op, const std::string& topic = "");

    /**
     * @brief Construct an envelope from JSON
     * @throws std::runtime_error if "op" is missing or unknown
     */
    explicit Envelope(const nlohmann::json& json);

    Op getOp() const {
        return op_;
    }
    const std::string& getTopic() const {
        return topic_;
    }

    const ChannelEvent& getEvent() const {
        return event_;
    }
    void setEvent(const ChannelEvent& event) {
        event_ = event;
    }

    const std::string& getClientId() const {
        return client_id_;
    }
    void setClientId(const std::string& client_id) {
        client_id_ = client_id;
    }

    const std::string& getMessage() const {
        return message_;
    }
    void setMessage(const std::string& message) {
        message_ = message;
    }

    nlohmann::json toJson() const;

    /**
     * @brief Create from JSON string
     */
    static Envelope fromJsonString(const std::string& json_str);

    /**
     * @brief Convert to JSON string
     */
    std::string toJsonString() const;

    static const char* opToString(Op op);

  private:
    Op op_;
    std::string topic_;
    ChannelEvent event_;
    std::string client_id_;
    std::string message_;
};

}  // namespace jamroom
