#pragma once

#include <optional>
#include <string>

#include "../model.hpp"

namespace jamroom {

/**
 * @brief Looks up display names and avatars for user ids
 */
class ProfileInterface {
  public:
    virtual ~ProfileInterface() = default;

    /**
     * @brief Get a user's profile
     * @return The profile, or nullopt for an unknown user
     */
    virtual std::optional<Profile> getProfile(const std::string& user_id) = 0;
};

constexpr const char* PLACEHOLDER_DISPLAY_NAME = "Anonymous";

/**
 * @brief Profile lookup that tolerates a missing service and unknown ids
 */
inline Profile resolveProfile(ProfileInterface* profiles, const std::string& user_id) {
    if (profiles != nullptr) {
        if (auto profile = profiles->getProfile(user_id)) {
            if (profile->displayName.empty())
                profile->displayName = PLACEHOLDER_DISPLAY_NAME;
            return *profile;
        }
    }
    return Profile{PLACEHOLDER_DISPLAY_NAME, {}};
}

}  // namespace jamroom
