#pragma once

#include <string>
#include <vector>

#include "../model.hpp"

namespace jamroom {

/**
 * @brief Durable backing store for project chat
 */
class ChatStoreInterface {
  public:
    virtual ~ChatStoreInterface() = default;

    /**
     * @brief Load every message of a project, oldest first
     */
    virtual std::vector<ChatMessage> listMessages(const std::string& project_id) = 0;

    /**
     * @brief Append a message
     * @return The stored message carrying its canonical id and createdAt
     */
    virtual ChatMessage appendMessage(const ChatMessage& message) = 0;
};

}  // namespace jamroom
