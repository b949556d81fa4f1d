#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../jamroom/session/PayloadCodec.hpp"

using namespace jamroom;

TEST_CASE("PayloadCodec - Track mutations", "[codec]") {
    SECTION("Only the fields that were set go on the wire") {
        TrackMutationEvent event;
        event.trackId = "t1";
        event.projectId = "p1";
        event.kind = MutationKind::Update;
        event.fields.gain = 0.5;
        event.fields.muted = false;
        event.timestamp = 1234;
        event.actorId = "alice";

        auto json = codec::encodeTrackMutation(event);
        REQUIRE(json["kind"] == "update");
        REQUIRE(json["fields"].size() == 2);
        REQUIRE(json["fields"]["muted"] == false);

        auto decoded = codec::decodeTrackMutation(json);
        REQUIRE(decoded.kind == MutationKind::Update);
        REQUIRE(decoded.fields.gain == Catch::Approx(0.5));
        REQUIRE(decoded.fields.muted == false);
        REQUIRE_FALSE(decoded.fields.name.has_value());
        REQUIRE(decoded.timestamp == 1234);
    }

    SECTION("Delete needs no fields") {
        nlohmann::json json = {{"trackId", "t1"},   {"projectId", "p1"}, {"kind", "delete"},
                               {"timestamp", 10}, {"actorId", "bob"}};
        auto decoded = codec::decodeTrackMutation(json);
        REQUIRE(decoded.kind == MutationKind::Delete);
        REQUIRE(decoded.fields.isEmpty());
    }

    SECTION("Missing or mistyped fields are rejected") {
        nlohmann::json json = {{"trackId", "t1"}, {"projectId", "p1"}, {"kind", "update"},
                               {"timestamp", 10}};
        REQUIRE_THROWS_AS(codec::decodeTrackMutation(json), ConflictApplyError);

        json["actorId"] = "bob";
        json["fields"] = {{"gain", "loud"}};
        REQUIRE_THROWS_AS(codec::decodeTrackMutation(json), ConflictApplyError);

        json["fields"] = {{"gain", 0.3}};
        json["kind"] = "merge";
        REQUIRE_THROWS_AS(codec::decodeTrackMutation(json), ConflictApplyError);

        REQUIRE_THROWS_AS(codec::decodeTrackMutation(nlohmann::json::array()),
                          ConflictApplyError);
    }
}

TEST_CASE("PayloadCodec - Track records", "[codec]") {
    nlohmann::json json = {{"trackId", "t1"}, {"projectId", "p1"}, {"audioRef", "a.wav"},
                           {"durationSeconds", 4.5}};
    auto record = codec::decodeTrackRecord(json);

    REQUIRE(record.audioRef == "a.wav");
    REQUIRE(record.durationSeconds == Catch::Approx(4.5));
    // Defaults for everything left out
    REQUIRE(record.gain == Catch::Approx(1.0));
    REQUIRE(record.pan == Catch::Approx(0.0));
    REQUIRE_FALSE(record.muted);
    REQUIRE(record.startOffsetSeconds == Catch::Approx(0.0));

    REQUIRE(codec::decodeTrackRecord(codec::encodeTrackRecord(record)) == record);
    REQUIRE_THROWS_AS(codec::decodeTrackRecord({{"trackId", "t1"}}), ConflictApplyError);
}

TEST_CASE("PayloadCodec - Presence, cursor and chat", "[codec]") {
    SECTION("Presence entry needs a user and a join time") {
        REQUIRE_THROWS_AS(codec::decodePresenceEntry({{"userId", "u1"}}), ConflictApplyError);
        REQUIRE_THROWS_AS(codec::decodePresenceEntry({{"userId", ""}, {"joinedAt", 1}}),
                          ConflictApplyError);

        auto entry = codec::decodePresenceEntry({{"userId", "u1"}, {"joinedAt", 99}});
        REQUIRE(entry.joinedAt == 99);
        REQUIRE(entry.displayName.empty());
    }

    SECTION("Cursor coordinates must be numbers") {
        REQUIRE_THROWS_AS(codec::decodeCursorState({{"userId", "u1"}, {"x", "left"}, {"y", 1}}),
                          ConflictApplyError);

        auto cursor = codec::decodeCursorState({{"userId", "u1"}, {"x", 3}, {"y", -1.0}});
        REQUIRE(cursor.x == Catch::Approx(3.0));
        REQUIRE_FALSE(cursor.isVisible());
    }

    SECTION("Chat messages keep their canonical id") {
        ChatMessage message;
        message.id = "msg-4";
        message.projectId = "p1";
        message.senderId = "alice";
        message.content = "hello";
        message.createdAt = 500;
        message.senderName = "Alice";

        auto json = codec::encodeChatMessage(message);
        REQUIRE_FALSE(json.contains("senderName"));

        auto decoded = codec::decodeChatMessage(json);
        REQUIRE(decoded.id == "msg-4");
        REQUIRE(decoded.content == "hello");
        REQUIRE(decoded.createdAt == 500);

        json.erase("content");
        REQUIRE_THROWS_AS(codec::decodeChatMessage(json), ConflictApplyError);
    }
}
