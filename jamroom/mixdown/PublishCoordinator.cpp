#include "PublishCoordinator.hpp"

#include <juce_core/juce_core.h>

#include "MixdownEngine.hpp"

namespace jamroom {

namespace {

PublishMetadata withDefaults(PublishMetadata metadata) {
    metadata.title = juce::String(metadata.title).trim().toStdString();
    if (metadata.title.empty())
        metadata.title = PublishCoordinator::DEFAULT_TITLE;
    return metadata;
}

}  // namespace

PublishCoordinator::PublishCoordinator(AudioSourceResolver& resolver,
                                       ObjectStorageInterface& storage,
                                       PublisherInterface& publisher, MixdownWorker* worker)
    : resolver_(resolver), storage_(storage), publisher_(publisher), worker_(worker) {}

PublishReceipt PublishCoordinator::publish(const std::string& projectId,
                                           const std::vector<TrackRecord>& tracks,
                                           const PublishMetadata& metadata,
                                           const CancelCheck& shouldCancel) {
    juce::Logger::writeToLog("Publishing project " + juce::String(projectId));

    MixdownEngine engine(resolver_);
    auto result = engine.render(MixdownRequest::fromConfig(tracks), shouldCancel);
    return store(projectId, result, metadata);
}

bool PublishCoordinator::publishAsync(const std::string& projectId,
                                      const std::vector<TrackRecord>& tracks,
                                      const PublishMetadata& metadata,
                                      std::function<void(PublishOutcome)> onComplete) {
    if (worker_ == nullptr)
        return false;

    juce::Logger::writeToLog("Publishing project " + juce::String(projectId) + " in background");

    return worker_->submit(
        projectId, MixdownRequest::fromConfig(tracks),
        [this, metadata, onComplete](const std::string& id, MixdownOutcome mixdown) {
            PublishOutcome outcome;
            if (!mixdown.succeeded()) {
                outcome.mixdownError = mixdown.errorKind;
                outcome.errorMessage = mixdown.errorMessage;
            } else {
                try {
                    outcome.receipt = store(id, *mixdown.result, metadata);
                } catch (const JamRoomError& e) {
                    outcome.errorMessage = e.what();
                }
            }

            if (onComplete)
                onComplete(std::move(outcome));
        });
}

PublishReceipt PublishCoordinator::store(const std::string& projectId,
                                         const MixdownResult& result,
                                         const PublishMetadata& metadata) {
    const auto bytes = MixdownEngine::encodeWav(result);

    PublishReceipt receipt;
    receipt.durationSeconds = result.durationSeconds;
    receipt.numTracksMixed = result.numTracksMixed;
    receipt.numBytes = bytes.size();

    try {
        receipt.storageRef = storage_.store(bytes, CONTENT_TYPE);
    } catch (const std::exception& e) {
        throw PersistenceError("Failed to upload mixdown of " + projectId + ": " + e.what());
    }

    try {
        publisher_.markPublished(projectId, receipt.storageRef, withDefaults(metadata));
    } catch (const std::exception& e) {
        throw PersistenceError("Failed to publish " + projectId + ": " + e.what());
    }

    juce::Logger::writeToLog("Published project " + juce::String(projectId) + " as " +
                             juce::String(receipt.storageRef));
    return receipt;
}

}  // namespace jamroom
