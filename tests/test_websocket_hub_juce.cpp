#include <juce_core/juce_core.h>

#include <mutex>

#include "../jamroom/session/WebSocketChannelTransport.hpp"
#include "jamroom/core/hub_server.hpp"

using namespace jamroom;

namespace {

constexpr int kTimeoutMs = 5000;

int pickTestPort() {
    return 20000 + juce::Random::getSystemRandom().nextInt(20000);
}

template <typename Predicate>
bool waitUntil(Predicate predicate, int timeoutMs = kTimeoutMs) {
    const auto deadline =
        juce::Time::getMillisecondCounter() + static_cast<juce::uint32>(timeoutMs);
    while (!predicate()) {
        if (juce::Time::getMillisecondCounter() > deadline)
            return false;
        juce::Thread::sleep(5);
    }
    return true;
}

/**
 * Collects the events a subscription receives on the asio thread.
 */
class EventInbox {
  public:
    ChannelSubscription::Handler handler() {
        return [this](const ChannelEvent& event) {
            std::lock_guard<std::mutex> lock(lock_);
            events_.push_back(event);
        };
    }

    std::vector<ChannelEvent> ofType(const std::string& type) const {
        std::lock_guard<std::mutex> lock(lock_);
        std::vector<ChannelEvent> matching;
        for (const auto& event : events_) {
            if (event.type == type)
                matching.push_back(event);
        }
        return matching;
    }

  private:
    mutable std::mutex lock_;
    std::vector<ChannelEvent> events_;
};

ReconnectBackoff::Settings fastBackoff() {
    ReconnectBackoff::Settings settings;
    settings.baseDelayMs = 50;
    settings.maxDelayMs = 200;
    settings.jitter = 0.0;
    return settings;
}

}  // namespace

// =============================================================================
// WebSocket hub round trips
// =============================================================================

class WebSocketHubTest final : public juce::UnitTest {
  public:
    WebSocketHubTest() : juce::UnitTest("WebSocket Hub Tests", "jamroom") {}

    void runTest() override {
        testDeliveryToEverySubscriber();
        testPeerDropIsAnnounced();
        testReconnectRejoinsTopics();
    }

  private:
    void testDeliveryToEverySubscriber() {
        beginTest("Events reach every subscriber, the publisher included, in order");

        const int port = pickTestPort();
        WebSocketHubServer hub(port);
        expect(hub.start(), "Hub should start");

        const auto uri = "ws://127.0.0.1:" + std::to_string(port);
        WebSocketChannelTransport alice(uri, fastBackoff());
        WebSocketChannelTransport bob(uri, fastBackoff());
        expect(alice.start());
        expect(bob.start());
        expect(waitUntil([&] {
            return alice.getConnectionState() == ConnectionState::Connected &&
                   bob.getConnectionState() == ConnectionState::Connected;
        }));
        expect(alice.getClientId() != bob.getClientId());

        const std::string topic = "project:p1:tracks";
        EventInbox aliceInbox, bobInbox;
        auto aliceSub = alice.join(topic);
        auto bobSub = bob.join(topic);
        aliceSub->onEvent(aliceInbox.handler());
        bobSub->onEvent(bobInbox.handler());
        expect(waitUntil([&] { return hub.getSubscriberCount(topic) == 2; }));

        for (int i = 0; i < 20; ++i) {
            ChannelEvent event;
            event.type = "track.mutation";
            event.payload = {{"seq", i}};
            alice.publish(topic, event);
        }

        expect(waitUntil([&] { return bobInbox.ofType("track.mutation").size() == 20; }));
        expect(waitUntil([&] { return aliceInbox.ofType("track.mutation").size() == 20; }));

        auto received = bobInbox.ofType("track.mutation");
        bool ordered = true;
        for (int i = 0; i < static_cast<int>(received.size()); ++i)
            ordered = ordered && received[static_cast<size_t>(i)].payload.value("seq", -1) == i;
        expect(ordered, "Per-publisher order should hold");
        expectEquals(juce::String(received.front().senderClientId),
                     juce::String(alice.getClientId()));

        // Other projects are separate rooms
        expectEquals(static_cast<int>(hub.getSubscriberCount("project:p2:tracks")), 0);

        bool threw = false;
        try {
            ChannelEvent stray;
            stray.type = "chat.message";
            alice.publish("project:p1:chat", stray);
        } catch (const TransportError&) {
            threw = true;
        }
        expect(threw, "Publishing to an unjoined topic should throw");

        aliceSub->close();
        bobSub->close();
        alice.stop();
        bob.stop();
        hub.stop();
    }

    void testPeerDropIsAnnounced() {
        beginTest("Closing a connection sends system.leave to the other subscribers");

        const int port = pickTestPort();
        WebSocketHubServer hub(port);
        expect(hub.start());

        const auto uri = "ws://127.0.0.1:" + std::to_string(port);
        WebSocketChannelTransport alice(uri, fastBackoff());
        WebSocketChannelTransport bob(uri, fastBackoff());
        expect(alice.start());
        expect(bob.start());
        expect(waitUntil([&] {
            return alice.getConnectionState() == ConnectionState::Connected &&
                   bob.getConnectionState() == ConnectionState::Connected;
        }));

        const std::string topic = "project:p1:presence";
        EventInbox aliceInbox;
        auto aliceSub = alice.join(topic);
        aliceSub->onEvent(aliceInbox.handler());
        expect(waitUntil([&] { return hub.getSubscriberCount(topic) == 1; }));

        auto bobSub = bob.join(topic);
        expect(waitUntil([&] { return aliceInbox.ofType(SYSTEM_JOIN_EVENT).size() == 1; }));

        const auto bobId = bob.getClientId();
        bob.stop();

        expect(waitUntil([&] { return aliceInbox.ofType(SYSTEM_LEAVE_EVENT).size() == 1; }));
        auto leave = aliceInbox.ofType(SYSTEM_LEAVE_EVENT).front();
        expectEquals(juce::String(leave.payload.value("clientId", std::string())),
                     juce::String(bobId));
        expect(waitUntil([&] { return hub.getClientCount() == 1; }));

        bobSub->close();
        aliceSub->close();
        alice.stop();
        hub.stop();
    }

    void testReconnectRejoinsTopics() {
        beginTest("Transport reconnects with backoff and re-joins open topics");

        const int port = pickTestPort();
        const auto uri = "ws://127.0.0.1:" + std::to_string(port);
        const std::string topic = "project:p1:chat";

        WebSocketChannelTransport alice(uri, fastBackoff());
        EventInbox inbox;
        auto subscription = alice.join(topic);
        subscription->onEvent(inbox.handler());

        {
            WebSocketHubServer first(port);
            expect(first.start());
            expect(alice.start());
            expect(waitUntil([&] { return first.getSubscriberCount(topic) == 1; }));
            first.stop();
        }

        expect(waitUntil(
            [&] { return alice.getConnectionState() != ConnectionState::Connected; }));

        bool threw = false;
        try {
            ChannelEvent event;
            event.type = "chat.message";
            alice.publish(topic, event);
        } catch (const TransportError&) {
            threw = true;
        }
        expect(threw, "Publishing while offline should throw");

        WebSocketHubServer second(port);
        expect(second.start());
        expect(waitUntil([&] {
            return alice.getConnectionState() == ConnectionState::Connected &&
                   second.getSubscriberCount(topic) == 1;
        }));

        ChannelEvent event;
        event.type = "chat.message";
        event.payload = {{"content", "back again"}};
        alice.publish(topic, event);
        expect(waitUntil([&] { return inbox.ofType("chat.message").size() == 1; }));

        subscription->close();
        alice.stop();
        second.stop();
    }
};

static WebSocketHubTest webSocketHubTest;
