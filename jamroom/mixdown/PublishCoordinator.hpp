#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "AudioSourceResolver.hpp"
#include "MixdownTypes.hpp"
#include "MixdownWorker.hpp"
#include "jamroom/core/interfaces/object_storage_interface.hpp"
#include "jamroom/core/interfaces/publisher_interface.hpp"

namespace jamroom {

/**
 * @brief What a published project points to
 */
struct PublishReceipt {
    std::string storageRef;
    double durationSeconds = 0.0;
    int numTracksMixed = 0;
    size_t numBytes = 0;
};

/**
 * @brief Outcome of publishAsync
 */
struct PublishOutcome {
    std::optional<PublishReceipt> receipt;
    std::optional<MixdownError::Kind> mixdownError;  // Set when the mixdown itself failed
    std::string errorMessage;

    bool succeeded() const {
        return receipt.has_value();
    }
};

/**
 * @brief Freezes a session into a stored, published artifact
 *
 * mixdown -> WAV -> object storage -> publisher. Nothing is published when
 * any step fails.
 */
class PublishCoordinator {
  public:
    static constexpr const char* DEFAULT_TITLE = "Untitled Project";
    static constexpr const char* CONTENT_TYPE = "audio/wav";

    PublishCoordinator(AudioSourceResolver& resolver, ObjectStorageInterface& storage,
                       PublisherInterface& publisher, MixdownWorker* worker = nullptr);

    /**
     * @brief Run the whole pipeline on the calling thread
     * @throws MixdownError if the mixdown fails
     * @throws PersistenceError if storing or publishing fails
     */
    PublishReceipt publish(const std::string& projectId, const std::vector<TrackRecord>& tracks,
                           const PublishMetadata& metadata, const CancelCheck& shouldCancel = {});

    /**
     * @brief Mix down on the worker, then upload and publish from the worker thread
     * @return false if no worker is set or the project is already being mixed
     */
    bool publishAsync(const std::string& projectId, const std::vector<TrackRecord>& tracks,
                      const PublishMetadata& metadata,
                      std::function<void(PublishOutcome)> onComplete);

  private:
    PublishReceipt store(const std::string& projectId, const MixdownResult& result,
                         const PublishMetadata& metadata);

    AudioSourceResolver& resolver_;
    ObjectStorageInterface& storage_;
    PublisherInterface& publisher_;
    MixdownWorker* worker_;
};

}  // namespace jamroom
