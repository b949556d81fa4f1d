#include "ProjectChat.hpp"

#include <juce_core/juce_core.h>

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <tuple>

#include "PayloadCodec.hpp"

namespace jamroom {

namespace {

bool comesBefore(const ChatMessage& a, const ChatMessage& b) {
    return std::tie(a.createdAt, a.id) < std::tie(b.createdAt, b.id);
}

}  // namespace

ProjectChat::ProjectChat(ChannelTransport& transport, std::string projectId,
                         ChatStoreInterface* store, std::string localUserId,
                         ProfileInterface* profiles, Clock clock)
    : transport_(transport),
      projectId_(std::move(projectId)),
      topic_(topicFor(projectId_, SessionConcern::Chat)),
      store_(store),
      localUserId_(std::move(localUserId)),
      profiles_(profiles),
      clock_(std::move(clock)) {}

ProjectChat::~ProjectChat() {
    close();
}

void ProjectChat::close() {
    if (subscription_)
        subscription_->close();
}

void ProjectChat::ensureSubscribed() {
    if (subscription_ && subscription_->isOpen())
        return;

    subscription_ = transport_.join(topic_);
    subscription_->onEvent([this](const ChannelEvent& event) { handleEvent(event); });
}

std::vector<ChatMessage> ProjectChat::loadStored() {
    if (store_ == nullptr)
        return {};

    std::vector<ChatMessage> stored;
    try {
        stored = store_->listMessages(projectId_);
    } catch (const std::exception& e) {
        throw PersistenceError("Failed to load chat of project " + projectId_ + ": " + e.what());
    }

    for (auto& message : stored) {
        message.senderName = senderNameFor(message.senderId);
        message.delivery = ChatMessage::Delivery::Delivered;
    }
    return stored;
}

void ProjectChat::hydrate() {
    ensureSubscribed();

    auto stored = loadStored();
    {
        std::lock_guard<std::mutex> lock(lock_);
        for (auto& message : stored) {
            if (message.projectId == projectId_ && !containsLocked(message.id))
                insertLocked(std::move(message));
        }
    }
    notify();

    juce::Logger::writeToLog("Chat hydrated for project " + juce::String(projectId_) + ": " +
                             juce::String(static_cast<int>(stored.size())) + " messages");
}

void ProjectChat::resume() {
    ensureSubscribed();

    // Everything the store has that we lack, including messages older than
    // ones we sent while offline
    auto stored = loadStored();
    size_t merged = 0;
    {
        std::lock_guard<std::mutex> lock(lock_);
        for (auto& message : stored) {
            if (message.projectId != projectId_ || containsLocked(message.id))
                continue;
            insertLocked(std::move(message));
            ++merged;
        }
    }

    DBG("Chat resumed with " << static_cast<int>(merged) << " missed messages");
    if (merged > 0)
        notify();

    flushOutbox();
}

size_t ProjectChat::flushOutbox() {
    std::vector<ChatMessage> pending;
    {
        std::lock_guard<std::mutex> lock(lock_);
        pending.swap(outbox_);
    }

    size_t sent = 0;
    for (size_t i = 0; i < pending.size(); ++i) {
        try {
            publishMessage(pending[i]);
            ++sent;
        } catch (const TransportError& e) {
            DBG("Chat outbox flush stopped: " << e.what());
            std::lock_guard<std::mutex> lock(lock_);
            outbox_.insert(outbox_.begin(), pending.begin() + static_cast<std::ptrdiff_t>(i),
                           pending.end());
            break;
        }
    }

    if (sent > 0)
        DBG("Flushed " << static_cast<int>(sent) << " queued chat messages");
    return sent;
}

size_t ProjectChat::getOutboxSize() const {
    std::lock_guard<std::mutex> lock(lock_);
    return outbox_.size();
}

void ProjectChat::publishMessage(const ChatMessage& message) {
    ChannelEvent event;
    event.type = events::CHAT_MESSAGE;
    event.payload = codec::encodeChatMessage(message);
    transport_.publish(topic_, event);
}

ChatMessage ProjectChat::send(const std::string& content) {
    const std::string trimmed = juce::String(content).trim().toStdString();
    if (trimmed.empty())
        throw std::invalid_argument("Chat message is empty");

    ChatMessage provisional;
    provisional.id = PROVISIONAL_ID_PREFIX + juce::Uuid().toString().toStdString();
    provisional.projectId = projectId_;
    provisional.senderId = localUserId_;
    provisional.content = trimmed;
    provisional.createdAt = clock_();
    provisional.senderName = senderNameFor(localUserId_);
    provisional.delivery = ChatMessage::Delivery::Pending;

    {
        std::lock_guard<std::mutex> lock(lock_);
        insertLocked(provisional);
    }
    notify();

    return deliver(provisional);
}

ChatMessage ProjectChat::resend(const std::string& messageId) {
    ChatMessage provisional;
    {
        std::lock_guard<std::mutex> lock(lock_);
        auto it = std::find_if(messages_.begin(), messages_.end(),
                               [&messageId](const ChatMessage& m) { return m.id == messageId; });
        if (it == messages_.end() || it->delivery != ChatMessage::Delivery::Failed)
            throw std::invalid_argument("No failed chat message " + messageId);

        it->delivery = ChatMessage::Delivery::Pending;
        provisional = *it;
    }
    notify();

    return deliver(provisional);
}

ChatMessage ProjectChat::deliver(const ChatMessage& provisional) {
    ChatMessage canonical = provisional;
    if (store_ != nullptr) {
        try {
            canonical = store_->appendMessage(provisional);
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(lock_);
                for (auto& message : messages_) {
                    if (message.id == provisional.id)
                        message.delivery = ChatMessage::Delivery::Failed;
                }
            }
            notify();
            juce::Logger::writeToLog("Chat message not saved: " + juce::String(e.what()));
            throw PersistenceError(std::string("Message could not be sent: ") + e.what());
        }
    }

    canonical.senderName = senderNameFor(canonical.senderId);
    canonical.delivery = ChatMessage::Delivery::Delivered;

    // Reconcile: the provisional entry gives way to the stored one
    {
        std::lock_guard<std::mutex> lock(lock_);
        messages_.erase(std::remove_if(messages_.begin(), messages_.end(),
                                       [&provisional](const ChatMessage& m) {
                                           return m.id == provisional.id;
                                       }),
                        messages_.end());
        if (!containsLocked(canonical.id))
            insertLocked(canonical);
    }
    notify();

    try {
        publishMessage(canonical);
    } catch (const TransportError& e) {
        // Stored already; broadcast once the link is back
        DBG("Chat broadcast queued while offline: " << e.what());
        std::lock_guard<std::mutex> lock(lock_);
        outbox_.push_back(canonical);
    }

    return canonical;
}

void ProjectChat::onRemoteMessage(const ChatMessage& message) {
    if (message.projectId != projectId_ || message.id.empty()) {
        ++droppedEvents_;
        DBG("Chat message for another project dropped: " << juce::String(message.projectId));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(lock_);
        if (containsLocked(message.id))
            return;
    }

    ChatMessage decorated = message;
    decorated.senderName = senderNameFor(message.senderId);
    decorated.delivery = ChatMessage::Delivery::Delivered;

    {
        std::lock_guard<std::mutex> lock(lock_);
        if (containsLocked(decorated.id))
            return;
        insertLocked(std::move(decorated));
    }
    notify();
}

void ProjectChat::handleEvent(const ChannelEvent& event) {
    if (event.type != events::CHAT_MESSAGE)
        return;

    ChatMessage message;
    try {
        message = codec::decodeChatMessage(event.payload);
    } catch (const ConflictApplyError& e) {
        ++droppedEvents_;
        DBG("Malformed chat message dropped: " << e.what());
        return;
    }
    onRemoteMessage(message);
}

std::string ProjectChat::senderNameFor(const std::string& userId) {
    {
        std::lock_guard<std::mutex> lock(lock_);
        auto it = senderNames_.find(userId);
        if (it != senderNames_.end())
            return it->second;
    }

    std::string name = resolveProfile(profiles_, userId).displayName;

    std::lock_guard<std::mutex> lock(lock_);
    senderNames_[userId] = name;
    return name;
}

std::vector<ChatMessage> ProjectChat::getMessages() const {
    std::lock_guard<std::mutex> lock(lock_);
    return messages_;
}

bool ProjectChat::containsLocked(const std::string& id) const {
    return std::any_of(messages_.begin(), messages_.end(),
                       [&id](const ChatMessage& m) { return m.id == id; });
}

void ProjectChat::insertLocked(ChatMessage message) {
    auto pos = std::upper_bound(messages_.begin(), messages_.end(), message, comesBefore);
    messages_.insert(pos, std::move(message));
}

void ProjectChat::addListener(ChatListener* listener) {
    std::lock_guard<std::mutex> lock(lock_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
        listeners_.push_back(listener);
}

void ProjectChat::removeListener(ChatListener* listener) {
    std::lock_guard<std::mutex> lock(lock_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

void ProjectChat::notify() {
    std::vector<ChatListener*> listeners;
    std::vector<ChatMessage> messages;
    {
        std::lock_guard<std::mutex> lock(lock_);
        listeners = listeners_;
        messages = messages_;
    }
    for (auto* listener : listeners)
        listener->messagesChanged(messages);
}

}  // namespace jamroom
