#pragma once

#include <nlohmann/json.hpp>

#include "jamroom/core/errors.hpp"
#include "jamroom/core/model.hpp"

namespace jamroom {

// Event types carried on the project topics
namespace events {
constexpr const char* PRESENCE_JOIN = "presence.join";
constexpr const char* PRESENCE_LEAVE = "presence.leave";
constexpr const char* PRESENCE_HEARTBEAT = "presence.heartbeat";
constexpr const char* PRESENCE_SYNC_REQUEST = "presence.sync_request";
constexpr const char* CURSOR_MOVE = "cursor.move";
constexpr const char* TRACK_MUTATION = "track.mutation";
constexpr const char* CHAT_MESSAGE = "chat.message";
}  // namespace events

/**
 * @brief JSON payload codecs for the values exchanged on project topics
 *
 * Every decode function throws ConflictApplyError when a required field is
 * missing or has the wrong type. Client-side decorations (chat delivery
 * state, cursor display names) are not part of the wire format unless noted.
 */
namespace codec {

nlohmann::json encodePresenceEntry(const PresenceEntry& entry);
PresenceEntry decodePresenceEntry(const nlohmann::json& json);

nlohmann::json encodeCursorState(const CursorState& cursor);
CursorState decodeCursorState(const nlohmann::json& json);

nlohmann::json encodeTrackRecord(const TrackRecord& record);
TrackRecord decodeTrackRecord(const nlohmann::json& json);

nlohmann::json encodeTrackFields(const TrackFields& fields);
TrackFields decodeTrackFields(const nlohmann::json& json);

nlohmann::json encodeTrackMutation(const TrackMutationEvent& event);
TrackMutationEvent decodeTrackMutation(const nlohmann::json& json);

nlohmann::json encodeChatMessage(const ChatMessage& message);
ChatMessage decodeChatMessage(const nlohmann::json& json);

/**
 * @throws ConflictApplyError for an unknown kind name
 */
MutationKind parseMutationKind(const std::string& name);

}  // namespace codec

}  // namespace jamroom
