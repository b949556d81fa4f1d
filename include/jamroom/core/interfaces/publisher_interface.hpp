#pragma once

#include <string>

#include "../model.hpp"

namespace jamroom {

/**
 * @brief Marks a project as published once its mixdown is stored
 */
class PublisherInterface {
  public:
    virtual ~PublisherInterface() = default;

    virtual void markPublished(const std::string& project_id, const std::string& storage_ref,
                               const PublishMetadata& metadata) = 0;
};

}  // namespace jamroom
