#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ChannelTransport.hpp"
#include "SessionTypes.hpp"
#include "jamroom/core/interfaces/chat_store_interface.hpp"
#include "jamroom/core/interfaces/profile_interface.hpp"

namespace jamroom {

/**
 * @brief Listener interface for the chat log
 */
class ChatListener {
  public:
    virtual ~ChatListener() = default;

    // Full log after a change, ordered by (createdAt, id)
    virtual void messagesChanged(const std::vector<ChatMessage>& messages) = 0;
};

/**
 * @brief Append-only chat log of one project
 *
 * Sending is optimistic: a provisional "local-" message shows up at once as
 * Pending and is replaced by the canonical message the store returns.
 * Messages are deduplicated by id, so a broadcast that overtakes the store
 * acknowledgement is harmless.
 */
class ProjectChat {
  public:
    static constexpr const char* PROVISIONAL_ID_PREFIX = "local-";

    ProjectChat(ChannelTransport& transport, std::string projectId, ChatStoreInterface* store,
                std::string localUserId, ProfileInterface* profiles = nullptr,
                Clock clock = systemClock());
    ~ProjectChat();

    ProjectChat(const ProjectChat&) = delete;
    ProjectChat& operator=(const ProjectChat&) = delete;

    /**
     * @brief Subscribe and load the stored history
     * @throws PersistenceError if the store cannot be read
     */
    void hydrate();

    /**
     * @brief Catch up after a reconnect
     *
     * Merges every stored message missing from the log, then broadcasts the
     * messages that were stored while the channel was down.
     * @throws PersistenceError if the store cannot be read
     */
    void resume();

    /**
     * @brief Broadcast queued messages
     * @return Number of messages sent; the rest stay queued
     */
    size_t flushOutbox();

    size_t getOutboxSize() const;

    void close();

    /**
     * @brief Send a message
     * @return The canonical stored message
     * @throws std::invalid_argument if the content is blank
     * @throws PersistenceError if the store rejected it (the message stays, marked Failed)
     */
    ChatMessage send(const std::string& content);

    /**
     * @brief Send a Failed message again
     * @throws std::invalid_argument if no failed message has this id
     * @throws PersistenceError if the store rejected it again
     */
    ChatMessage resend(const std::string& messageId);

    /**
     * @brief Merge a message received from the channel
     */
    void onRemoteMessage(const ChatMessage& message);

    std::vector<ChatMessage> getMessages() const;

    std::uint64_t getDroppedEventCount() const {
        return droppedEvents_.load();
    }

    void addListener(ChatListener* listener);
    void removeListener(ChatListener* listener);

  private:
    void ensureSubscribed();
    void handleEvent(const ChannelEvent& event);
    ChatMessage deliver(const ChatMessage& provisional);
    void publishMessage(const ChatMessage& message);
    std::vector<ChatMessage> loadStored();
    std::string senderNameFor(const std::string& userId);

    bool containsLocked(const std::string& id) const;
    void insertLocked(ChatMessage message);
    void notify();

    ChannelTransport& transport_;
    const std::string projectId_;
    const std::string topic_;
    ChatStoreInterface* store_;
    const std::string localUserId_;
    ProfileInterface* profiles_;
    Clock clock_;

    mutable std::mutex lock_;
    std::vector<ChatMessage> messages_;
    std::vector<ChatMessage> outbox_;
    std::map<std::string, std::string> senderNames_;
    std::atomic<std::uint64_t> droppedEvents_{0};

    std::vector<ChatListener*> listeners_;
    std::unique_ptr<ChannelSubscription> subscription_;
};

}  // namespace jamroom
