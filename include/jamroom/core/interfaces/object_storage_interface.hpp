#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace jamroom {

/**
 * @brief Audio/object storage for rendered artifacts
 */
class ObjectStorageInterface {
  public:
    virtual ~ObjectStorageInterface() = default;

    /**
     * @brief Store a blob
     * @param bytes Encoded content
     * @param content_type MIME type, e.g. "audio/wav"
     * @return A reference the blob can be retrieved with
     */
    virtual std::string store(const std::vector<std::uint8_t>& bytes,
                              const std::string& content_type) = 0;
};

}  // namespace jamroom
