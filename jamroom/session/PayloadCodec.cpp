#include "PayloadCodec.hpp"

#include <optional>

namespace jamroom {
namespace codec {

namespace {

template <typename T>
T require(const nlohmann::json& json, const char* key) {
    if (!json.is_object())
        throw ConflictApplyError(std::string("Payload is not an object (reading '") + key + "')");

    auto it = json.find(key);
    if (it == json.end() || it->is_null())
        throw ConflictApplyError(std::string("Missing field '") + key + "'");

    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConflictApplyError(std::string("Bad field '") + key + "': " + e.what());
    }
}

template <typename T>
T valueOr(const nlohmann::json& json, const char* key, const T& fallback) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null())
        return fallback;

    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConflictApplyError(std::string("Bad field '") + key + "': " + e.what());
    }
}

template <typename T>
void readField(const nlohmann::json& json, const char* key, std::optional<T>& out) {
    if (json.contains(key))
        out = require<T>(json, key);
}

}  // namespace

// ============================================================================
// Presence
// ============================================================================

nlohmann::json encodePresenceEntry(const PresenceEntry& entry) {
    return {{"userId", entry.userId},
            {"displayName", entry.displayName},
            {"avatarRef", entry.avatarRef},
            {"joinedAt", entry.joinedAt},
            {"clientId", entry.clientId}};
}

PresenceEntry decodePresenceEntry(const nlohmann::json& json) {
    PresenceEntry entry;
    entry.userId = require<std::string>(json, "userId");
    entry.joinedAt = require<Timestamp>(json, "joinedAt");
    entry.displayName = valueOr<std::string>(json, "displayName", "");
    entry.avatarRef = valueOr<std::string>(json, "avatarRef", "");
    entry.clientId = valueOr<std::string>(json, "clientId", "");

    if (entry.userId.empty())
        throw ConflictApplyError("Presence entry without userId");
    return entry;
}

// ============================================================================
// Cursor
// ============================================================================

nlohmann::json encodeCursorState(const CursorState& cursor) {
    return {{"userId", cursor.userId},
            {"x", cursor.x},
            {"y", cursor.y},
            {"colorToken", cursor.colorToken},
            {"displayName", cursor.displayName}};
}

CursorState decodeCursorState(const nlohmann::json& json) {
    CursorState cursor;
    cursor.userId = require<std::string>(json, "userId");
    cursor.x = require<double>(json, "x");
    cursor.y = require<double>(json, "y");
    cursor.colorToken = valueOr<std::string>(json, "colorToken", "");
    cursor.displayName = valueOr<std::string>(json, "displayName", "");

    if (cursor.userId.empty())
        throw ConflictApplyError("Cursor state without userId");
    return cursor;
}

// ============================================================================
// Tracks
// ============================================================================

nlohmann::json encodeTrackRecord(const TrackRecord& record) {
    return {{"trackId", record.trackId},
            {"projectId", record.projectId},
            {"name", record.name},
            {"trackNumber", record.trackNumber},
            {"audioRef", record.audioRef},
            {"gain", record.gain},
            {"pan", record.pan},
            {"muted", record.muted},
            {"durationSeconds", record.durationSeconds},
            {"startOffsetSeconds", record.startOffsetSeconds},
            {"updatedAt", record.updatedAt},
            {"updatedBy", record.updatedBy}};
}

TrackRecord decodeTrackRecord(const nlohmann::json& json) {
    TrackRecord record;
    record.trackId = require<std::string>(json, "trackId");
    record.projectId = require<std::string>(json, "projectId");
    record.name = valueOr<std::string>(json, "name", "");
    record.trackNumber = valueOr<int>(json, "trackNumber", 0);
    record.audioRef = valueOr<std::string>(json, "audioRef", "");
    record.gain = valueOr<double>(json, "gain", 1.0);
    record.pan = valueOr<double>(json, "pan", 0.0);
    record.muted = valueOr<bool>(json, "muted", false);
    record.durationSeconds = valueOr<double>(json, "durationSeconds", 0.0);
    record.startOffsetSeconds = valueOr<double>(json, "startOffsetSeconds", 0.0);
    record.updatedAt = valueOr<Timestamp>(json, "updatedAt", 0);
    record.updatedBy = valueOr<std::string>(json, "updatedBy", "");
    return record;
}

nlohmann::json encodeTrackFields(const TrackFields& fields) {
    nlohmann::json json = nlohmann::json::object();
    if (fields.name)
        json["name"] = *fields.name;
    if (fields.trackNumber)
        json["trackNumber"] = *fields.trackNumber;
    if (fields.audioRef)
        json["audioRef"] = *fields.audioRef;
    if (fields.gain)
        json["gain"] = *fields.gain;
    if (fields.pan)
        json["pan"] = *fields.pan;
    if (fields.muted)
        json["muted"] = *fields.muted;
    if (fields.durationSeconds)
        json["durationSeconds"] = *fields.durationSeconds;
    if (fields.startOffsetSeconds)
        json["startOffsetSeconds"] = *fields.startOffsetSeconds;
    return json;
}

TrackFields decodeTrackFields(const nlohmann::json& json) {
    if (!json.is_object())
        throw ConflictApplyError("Track fields are not an object");

    TrackFields fields;
    readField(json, "name", fields.name);
    readField(json, "trackNumber", fields.trackNumber);
    readField(json, "audioRef", fields.audioRef);
    readField(json, "gain", fields.gain);
    readField(json, "pan", fields.pan);
    readField(json, "muted", fields.muted);
    readField(json, "durationSeconds", fields.durationSeconds);
    readField(json, "startOffsetSeconds", fields.startOffsetSeconds);
    return fields;
}

MutationKind parseMutationKind(const std::string& name) {
    if (name == "create")
        return MutationKind::Create;
    if (name == "update")
        return MutationKind::Update;
    if (name == "delete")
        return MutationKind::Delete;
    throw ConflictApplyError("Unknown mutation kind: " + name);
}

nlohmann::json encodeTrackMutation(const TrackMutationEvent& event) {
    return {{"trackId", event.trackId},
            {"projectId", event.projectId},
            {"kind", getMutationKindName(event.kind)},
            {"fields", encodeTrackFields(event.fields)},
            {"timestamp", event.timestamp},
            {"actorId", event.actorId}};
}

TrackMutationEvent decodeTrackMutation(const nlohmann::json& json) {
    TrackMutationEvent event;
    event.trackId = require<std::string>(json, "trackId");
    event.projectId = require<std::string>(json, "projectId");
    event.kind = parseMutationKind(require<std::string>(json, "kind"));
    event.timestamp = require<Timestamp>(json, "timestamp");
    event.actorId = require<std::string>(json, "actorId");

    auto fields = json.find("fields");
    if (fields != json.end() && !fields->is_null())
        event.fields = decodeTrackFields(*fields);
    return event;
}

// ============================================================================
// Chat
// ============================================================================

nlohmann::json encodeChatMessage(const ChatMessage& message) {
    return {{"id", message.id},
            {"projectId", message.projectId},
            {"senderId", message.senderId},
            {"content", message.content},
            {"createdAt", message.createdAt}};
}

ChatMessage decodeChatMessage(const nlohmann::json& json) {
    ChatMessage message;
    message.id = require<std::string>(json, "id");
    message.projectId = require<std::string>(json, "projectId");
    message.senderId = require<std::string>(json, "senderId");
    message.content = require<std::string>(json, "content");
    message.createdAt = require<Timestamp>(json, "createdAt");

    if (message.id.empty())
        throw ConflictApplyError("Chat message without id");
    return message;
}

}  // namespace codec
}  // namespace jamroom
