#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "../jamroom/session/LocalChannelHub.hpp"

using namespace jamroom;

namespace {

ChannelEvent makeEvent(const std::string& type, int seq = 0) {
    ChannelEvent event;
    event.type = type;
    event.payload = {{"seq", seq}};
    return event;
}

class RecordingConnectionListener : public ChannelTransportListener {
  public:
    void connectionStateChanged(ConnectionState state) override {
        states.push_back(state);
    }

    std::vector<ConnectionState> states;
};

}  // namespace

TEST_CASE("LocalChannelHub - Delivery", "[transport]") {
    LocalChannelHub hub;
    auto alice = hub.connect();
    auto bob = hub.connect();
    REQUIRE(alice->getClientId() != bob->getClientId());

    std::vector<ChannelEvent> aliceSeen, bobSeen;
    auto aliceSub = alice->join("project:p1:tracks");
    auto bobSub = bob->join("project:p1:tracks");
    aliceSub->onEvent([&](const ChannelEvent& e) { aliceSeen.push_back(e); });
    bobSub->onEvent([&](const ChannelEvent& e) { bobSeen.push_back(e); });

    REQUIRE(hub.getSubscriberCount("project:p1:tracks") == 2);

    SECTION("Every subscriber gets every event in publish order") {
        for (int i = 0; i < 10; ++i)
            alice->publish("project:p1:tracks", makeEvent("track.mutation", i));

        REQUIRE(bobSeen.size() == 10);
        REQUIRE(aliceSeen.size() == 10);
        for (int i = 0; i < 10; ++i) {
            REQUIRE(bobSeen[static_cast<size_t>(i)].payload["seq"] == i);
            REQUIRE(bobSeen[static_cast<size_t>(i)].senderClientId == alice->getClientId());
        }
    }

    SECTION("Later joiners get no replay") {
        alice->publish("project:p1:tracks", makeEvent("track.mutation"));

        auto carol = hub.connect();
        std::vector<ChannelEvent> carolSeen;
        auto carolSub = carol->join("project:p1:tracks");
        carolSub->onEvent([&](const ChannelEvent& e) { carolSeen.push_back(e); });
        REQUIRE(carolSeen.empty());

        // Existing members are told about the newcomer
        REQUIRE(bobSeen.back().type == SYSTEM_JOIN_EVENT);
        REQUIRE(bobSeen.back().payload["clientId"] == carol->getClientId());
    }

    SECTION("Topics are independent") {
        std::vector<ChannelEvent> chatSeen;
        auto chatSub = bob->join("project:p1:chat");
        chatSub->onEvent([&](const ChannelEvent& e) { chatSeen.push_back(e); });

        alice->publish("project:p1:tracks", makeEvent("track.mutation"));
        REQUIRE(chatSeen.empty());
    }

    SECTION("Publish from inside a handler is queued behind the current event") {
        std::vector<std::string> order;
        bobSub->onEvent([&](const ChannelEvent& e) {
            order.push_back(e.type);
            if (e.type == "first")
                bob->publish("project:p1:tracks", makeEvent("reply"));
        });
        aliceSub->onEvent([&](const ChannelEvent& e) { order.push_back("alice:" + e.type); });

        alice->publish("project:p1:tracks", makeEvent("first"));
        REQUIRE(order == std::vector<std::string>{"alice:first", "first", "alice:reply", "reply"});
    }

    SECTION("A throwing handler does not stop delivery") {
        aliceSub->onEvent([](const ChannelEvent&) { throw std::runtime_error("boom"); });
        alice->publish("project:p1:tracks", makeEvent("track.mutation"));
        REQUIRE(bobSeen.size() == 1);
    }

    SECTION("Closed subscriptions receive nothing") {
        bobSub->close();
        bobSub->close();
        REQUIRE_FALSE(bobSub->isOpen());
        REQUIRE(hub.getSubscriberCount("project:p1:tracks") == 1);

        alice->publish("project:p1:tracks", makeEvent("track.mutation"));
        REQUIRE(bobSeen.empty());
        REQUIRE_THROWS_AS(bob->publish("project:p1:tracks", makeEvent("x")), TransportError);
    }
}

TEST_CASE("LocalChannelHub - Publish errors", "[transport][errors]") {
    LocalChannelHub hub;
    auto alice = hub.connect();
    auto subscription = alice->join("project:p1:chat");

    REQUIRE_THROWS_AS(alice->publish("project:p1:tracks", makeEvent("x")), TransportError);

    alice->simulateDisconnect();
    REQUIRE(alice->getConnectionState() == ConnectionState::Reconnecting);
    REQUIRE_THROWS_AS(alice->publish("project:p1:chat", makeEvent("x")), TransportError);
}

TEST_CASE("LocalChannelHub - Drop and reconnect", "[transport]") {
    LocalChannelHub hub;
    auto alice = hub.connect();
    auto bob = hub.connect();

    std::vector<ChannelEvent> aliceSeen;
    auto aliceSub = alice->join("project:p1:presence");
    aliceSub->onEvent([&](const ChannelEvent& e) { aliceSeen.push_back(e); });

    std::vector<ChannelEvent> bobSeen;
    auto bobSub = bob->join("project:p1:presence");
    bobSub->onEvent([&](const ChannelEvent& e) { bobSeen.push_back(e); });

    RecordingConnectionListener listener;
    bob->addListener(&listener);

    bob->simulateDisconnect();
    REQUIRE(aliceSeen.back().type == SYSTEM_LEAVE_EVENT);
    REQUIRE(aliceSeen.back().payload["clientId"] == bob->getClientId());
    REQUIRE(hub.getSubscriberCount("project:p1:presence") == 1);

    // Missed while away
    alice->publish("project:p1:presence", makeEvent("presence.heartbeat"));
    REQUIRE(bobSeen.empty());

    bob->simulateReconnect();
    REQUIRE(aliceSeen.back().type == SYSTEM_JOIN_EVENT);
    REQUIRE(hub.getSubscriberCount("project:p1:presence") == 2);
    REQUIRE(listener.states == std::vector<ConnectionState>{ConnectionState::Reconnecting,
                                                            ConnectionState::Connected});

    alice->publish("project:p1:presence", makeEvent("presence.heartbeat"));
    REQUIRE(bobSeen.size() == 1);

    bob->removeListener(&listener);
}

TEST_CASE("LocalChannelHub - Endpoint teardown leaves its topics", "[transport]") {
    LocalChannelHub hub;
    auto alice = hub.connect();
    auto bob = hub.connect();

    std::vector<ChannelEvent> aliceSeen;
    auto aliceSub = alice->join("project:p1:cursor");
    aliceSub->onEvent([&](const ChannelEvent& e) { aliceSeen.push_back(e); });
    auto bobSub = bob->join("project:p1:cursor");

    bobSub.reset();
    REQUIRE(aliceSeen.back().type == SYSTEM_LEAVE_EVENT);
    REQUIRE(hub.getSubscriberCount("project:p1:cursor") == 1);

    bob.reset();
    aliceSub.reset();
    REQUIRE(hub.getSubscriberCount("project:p1:cursor") == 0);
}
