#pragma once

#include <optional>
#include <string>

namespace jamroom {

/**
 * @brief Resolves a session token to the id used for all attribution
 */
class IdentityInterface {
  public:
    virtual ~IdentityInterface() = default;

    /**
     * @brief Resolve a session token
     * @return The user id, or nullopt if the token is not valid
     */
    virtual std::optional<std::string> resolveUserId(const std::string& session_token) = 0;
};

}  // namespace jamroom
