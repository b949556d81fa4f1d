#include "jamroom/core/envelope.hpp"

#include <stdexcept>

namespace jamroom {

// ChannelEvent implementation
nlohmann::json ChannelEvent::toJson() const {
    nlohmann::json json;
    json["type"] = type;
    json["payload"] = payload;
    json["ephemeral"] = ephemeral;
    if (!senderClientId.empty()) {
        json["sender"] = senderClientId;
    }
    return json;
}

ChannelEvent ChannelEvent::fromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("type") || !json["type"].is_string()) {
        throw std::runtime_error("Event missing 'type' field");
    }

    ChannelEvent event;
    event.type = json["type"].get<std::string>();
    event.payload = json.value("payload", nlohmann::json::object());
    event.ephemeral = json.value("ephemeral", false);
    event.senderClientId = json.value("sender", std::string());
    return event;
}

// Envelope implementation
Envelope::Envelope(Op op, const std::string& topic) : op_(op), topic_(topic) {}

Envelope::Envelope(const nlohmann::json& json) : op_(Op::Error) {
    if (!json.is_object() || !json.contains("op")) {
        throw std::runtime_error("JSON missing 'op' field");
    }

    const auto op = json["op"].get<std::string>();
    if (op == "welcome") {
        op_ = Op::Welcome;
    } else if (op == "join") {
        op_ = Op::Join;
    } else if (op == "leave") {
        op_ = Op::Leave;
    } else if (op == "publish") {
        op_ = Op::Publish;
    } else if (op == "event") {
        op_ = Op::Event;
    } else if (op == "error") {
        op_ = Op::Error;
    } else {
        throw std::runtime_error("Unknown op: " + op);
    }

    topic_ = json.value("topic", std::string());
    client_id_ = json.value("clientId", std::string());
    message_ = json.value("message", std::string());

    if (op_ == Op::Publish || op_ == Op::Event) {
        if (!json.contains("event")) {
            throw std::runtime_error("JSON missing 'event' field");
        }
        event_ = ChannelEvent::fromJson(json["event"]);
    }

    if ((op_ == Op::Join || op_ == Op::Leave || op_ == Op::Publish || op_ == Op::Event) &&
        topic_.empty()) {
        throw std::runtime_error(std::string("Envelope '") + op + "' requires a topic");
    }
}

nlohmann::json Envelope::toJson() const {
    nlohmann::json json;
    json["op"] = opToString(op_);

    if (!topic_.empty()) {
        json["topic"] = topic_;
    }
    if (!client_id_.empty()) {
        json["clientId"] = client_id_;
    }
    if (!message_.empty()) {
        json["message"] = message_;
    }
    if (op_ == Op::Publish || op_ == Op::Event) {
        json["event"] = event_.toJson();
    }

    return json;
}

Envelope Envelope::fromJsonString(const std::string& json_str) {
    nlohmann::json json = nlohmann::json::parse(json_str);
    return Envelope(json);
}

std::string Envelope::toJsonString() const {
    return toJson().dump();
}

const char* Envelope::opToString(Op op) {
    switch (op) {
        case Op::Welcome:
            return "welcome";
        case Op::Join:
            return "join";
        case Op::Leave:
            return "leave";
        case Op::Publish:
            return "publish";
        case Op::Event:
            return "event";
        case Op::Error:
            return "error";
    }
    return "error";
}

}  // namespace jamroom
