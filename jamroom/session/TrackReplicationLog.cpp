#include "TrackReplicationLog.hpp"

#include <juce_core/juce_core.h>

#include <algorithm>
#include <set>

#include "PayloadCodec.hpp"

namespace jamroom {

TrackReplicationLog::TrackReplicationLog(ChannelTransport& transport, std::string projectId,
                                         TrackStoreInterface* store, std::string localUserId,
                                         Clock clock)
    : transport_(transport),
      projectId_(std::move(projectId)),
      topic_(topicFor(projectId_, SessionConcern::Tracks)),
      store_(store),
      localUserId_(std::move(localUserId)),
      clock_(std::move(clock)),
      table_(projectId_) {}

TrackReplicationLog::~TrackReplicationLog() {
    close();
}

void TrackReplicationLog::close() {
    if (subscription_)
        subscription_->close();
}

void TrackReplicationLog::ensureSubscribed() {
    if (subscription_ && subscription_->isOpen())
        return;

    subscription_ = transport_.join(topic_);
    subscription_->onEvent([this](const ChannelEvent& event) { handleEvent(event); });
}

// ============================================================================
// Hydration
// ============================================================================

std::vector<TrackRecord> TrackReplicationLog::loadStored() {
    if (store_ == nullptr)
        return {};

    try {
        return store_->listTracks(projectId_);
    } catch (const std::exception& e) {
        throw PersistenceError("Failed to load tracks of project " + projectId_ + ": " +
                               e.what());
    }
}

void TrackReplicationLog::hydrate() {
    {
        std::lock_guard<std::mutex> lock(lock_);
        hydrating_ = true;
        buffered_.clear();
    }

    // Subscribe before loading so nothing published in between is lost
    ensureSubscribed();

    std::vector<TrackRecord> stored;
    std::string loadError;
    try {
        stored = loadStored();
    } catch (const PersistenceError& e) {
        loadError = e.what();
    }

    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(lock_);
        for (const auto& record : stored)
            applyQuietlyLocked(TrackTable::eventFromRecord(record));
        for (const auto& event : buffered_)
            applyQuietlyLocked(event);

        buffered_.clear();
        hydrating_ = false;
        hydrated_ = loadError.empty();
        count = table_.getTracks().size();
    }

    notifyChanged();

    if (!loadError.empty())
        throw PersistenceError(loadError);

    juce::Logger::writeToLog("Tracks hydrated for project " + juce::String(projectId_) + ": " +
                             juce::String(static_cast<int>(count)) + " tracks");
}

void TrackReplicationLog::rehydrate() {
    {
        std::lock_guard<std::mutex> lock(lock_);
        hydrating_ = true;
        buffered_.clear();
    }

    ensureSubscribed();

    std::vector<TrackRecord> stored;
    try {
        stored = loadStored();
    } catch (const PersistenceError&) {
        // Keep the current table; live events resume immediately
        {
            std::lock_guard<std::mutex> lock(lock_);
            for (const auto& event : buffered_)
                applyQuietlyLocked(event);
            buffered_.clear();
            hydrating_ = false;
        }
        notifyChanged();
        throw;
    }

    const Timestamp now = clock_();
    {
        std::lock_guard<std::mutex> lock(lock_);
        // Merge, never clear: tombstones and field stamps outlive a reconnect
        std::set<std::string> storedIds;
        for (const auto& record : stored) {
            storedIds.insert(record.trackId);
            applyQuietlyLocked(TrackTable::eventFromRecord(record));
        }

        // Gone from the store while we were away: deleted by a peer
        if (store_ != nullptr) {
            for (const auto& track : table_.getTracks()) {
                if (storedIds.count(track.trackId) > 0 || unsaved_.count(track.trackId) > 0 ||
                    hasOutboxEventLocked(track.trackId))
                    continue;
                applyQuietlyLocked(TrackTable::tombstoneFor(track));
            }
        }
        for (const auto& [trackId, events] : unsaved_) {
            for (const auto& event : events)
                applyQuietlyLocked(event);
        }

        // Stored rows carry one stamp for the whole record, so an offline edit
        // keeps its old stamp only at the risk of losing to an unrelated field
        // write. Offline edits take effect when they are flushed.
        for (auto& event : outbox_) {
            lastLocalTimestamp_ = std::max(now, lastLocalTimestamp_ + 1);
            event.timestamp = lastLocalTimestamp_;
            applyQuietlyLocked(event);
            unsaved_[event.trackId].push_back(event);
        }
        for (const auto& event : buffered_)
            applyQuietlyLocked(event);

        buffered_.clear();
        hydrating_ = false;
        hydrated_ = true;
    }

    notifyChanged();

    size_t sent = flushOutbox();
    if (sent > 0)
        DBG("Flushed " << static_cast<int>(sent) << " queued track events");

    if (!retryPersistence())
        DBG("Tracks still unsaved after rehydrate");
}

// ============================================================================
// Mutations
// ============================================================================

void TrackReplicationLog::applyLocalMutation(const TrackMutationEvent& event) {
    TrackTable::validate(event, projectId_);

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(lock_);
        changed = table_.apply(event);
        // Kept until the store confirms the track
        unsaved_[event.trackId].push_back(event);
        lastLocalTimestamp_ = std::max(lastLocalTimestamp_, event.timestamp);
    }
    if (changed)
        notifyChanged();

    ChannelEvent channelEvent;
    channelEvent.type = events::TRACK_MUTATION;
    channelEvent.payload = codec::encodeTrackMutation(event);
    try {
        transport_.publish(topic_, channelEvent);
    } catch (const TransportError& e) {
        DBG("Track event queued while offline: " << e.what());
        std::lock_guard<std::mutex> lock(lock_);
        outbox_.push_back(event);
    }

    std::string error;
    if (!persist(event.trackId, error)) {
        juce::Logger::writeToLog("Track " + juce::String(event.trackId) +
                                 " not saved: " + juce::String(error));
        notifyPersistenceFailed(event.trackId, error);
        throw PersistenceError("Changes to track " + event.trackId + " may not be saved: " +
                               error);
    }
}

void TrackReplicationLog::onRemoteMutation(const TrackMutationEvent& event) {
    try {
        TrackTable::validate(event, projectId_);
    } catch (const ConflictApplyError& e) {
        ++droppedEvents_;
        DBG("Track event dropped: " << e.what());
        return;
    }

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(lock_);
        if (hydrating_) {
            buffered_.push_back(event);
            return;
        }
        changed = table_.apply(event);
    }
    if (changed)
        notifyChanged();
}

void TrackReplicationLog::handleEvent(const ChannelEvent& event) {
    if (event.type != events::TRACK_MUTATION)
        return;

    TrackMutationEvent mutation;
    try {
        mutation = codec::decodeTrackMutation(event.payload);
    } catch (const ConflictApplyError& e) {
        ++droppedEvents_;
        DBG("Malformed track event dropped: " << e.what());
        return;
    }
    onRemoteMutation(mutation);
}

void TrackReplicationLog::applyQuietlyLocked(const TrackMutationEvent& event) {
    try {
        table_.apply(event);
    } catch (const ConflictApplyError& e) {
        ++droppedEvents_;
        DBG("Track event skipped: " << e.what());
    }
}

TrackRecord TrackReplicationLog::createTrack(const TrackFields& fields,
                                             const std::string& trackId) {
    TrackMutationEvent event;
    event.trackId = trackId.empty() ? juce::Uuid().toString().toStdString() : trackId;
    event.projectId = projectId_;
    event.kind = MutationKind::Create;
    event.fields = fields;
    event.actorId = localUserId_;
    event.timestamp = nextLocalTimestamp();

    if (!event.fields.trackNumber) {
        int next = 1;
        for (const auto& track : getTracks())
            next = std::max(next, track.trackNumber + 1);
        event.fields.trackNumber = next;
    }

    applyLocalMutation(event);

    auto created = getTrack(event.trackId);
    if (!created)
        throw ConflictApplyError("Track " + event.trackId + " is hidden by a later delete");
    return *created;
}

void TrackReplicationLog::updateTrack(const std::string& trackId, const TrackFields& fields) {
    TrackMutationEvent event;
    event.trackId = trackId;
    event.projectId = projectId_;
    event.kind = MutationKind::Update;
    event.fields = fields;
    event.actorId = localUserId_;
    event.timestamp = nextLocalTimestamp();
    applyLocalMutation(event);
}

void TrackReplicationLog::deleteTrack(const std::string& trackId) {
    TrackMutationEvent event;
    event.trackId = trackId;
    event.projectId = projectId_;
    event.kind = MutationKind::Delete;
    event.actorId = localUserId_;
    event.timestamp = nextLocalTimestamp();
    applyLocalMutation(event);
}

Timestamp TrackReplicationLog::nextLocalTimestamp() {
    const Timestamp now = clock_();
    std::lock_guard<std::mutex> lock(lock_);
    // Two edits within one millisecond must still order
    lastLocalTimestamp_ = std::max(now, lastLocalTimestamp_ + 1);
    return lastLocalTimestamp_;
}

// ============================================================================
// Persistence
// ============================================================================

bool TrackReplicationLog::persist(const std::string& trackId, std::string& error) {
    std::optional<TrackRecord> snapshot;
    size_t covered = 0;
    {
        std::lock_guard<std::mutex> lock(lock_);
        snapshot = table_.getTrack(trackId);
        auto it = unsaved_.find(trackId);
        covered = it != unsaved_.end() ? it->second.size() : 0;
    }

    if (store_ != nullptr) {
        try {
            if (snapshot)
                store_->upsertTrack(*snapshot);
            else
                store_->deleteTrack(trackId);
        } catch (const std::exception& e) {
            error = e.what();
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(lock_);
    auto it = unsaved_.find(trackId);
    if (it != unsaved_.end()) {
        // Events added while the write was in flight stay unsaved
        auto& events = it->second;
        const auto done = static_cast<std::ptrdiff_t>(std::min(covered, events.size()));
        events.erase(events.begin(), events.begin() + done);
        if (events.empty())
            unsaved_.erase(it);
    }
    return true;
}

bool TrackReplicationLog::retryPersistence() {
    for (const auto& trackId : getUnsavedTrackIds()) {
        std::string error;
        if (!persist(trackId, error)) {
            DBG("Retry failed for track " << juce::String(trackId) << ": " << juce::String(error));
            notifyPersistenceFailed(trackId, error);
        }
    }

    std::lock_guard<std::mutex> lock(lock_);
    return unsaved_.empty();
}

size_t TrackReplicationLog::flushOutbox() {
    std::vector<TrackMutationEvent> pending;
    {
        std::lock_guard<std::mutex> lock(lock_);
        pending.swap(outbox_);
    }

    size_t sent = 0;
    for (; sent < pending.size(); ++sent) {
        ChannelEvent channelEvent;
        channelEvent.type = events::TRACK_MUTATION;
        channelEvent.payload = codec::encodeTrackMutation(pending[sent]);
        try {
            transport_.publish(topic_, channelEvent);
        } catch (const TransportError& e) {
            DBG("Outbox flush stopped: " << e.what());
            std::lock_guard<std::mutex> lock(lock_);
            outbox_.insert(outbox_.begin(), pending.begin() + static_cast<std::ptrdiff_t>(sent),
                           pending.end());
            break;
        }
    }
    return sent;
}

// ============================================================================
// Queries and listeners
// ============================================================================

std::vector<TrackRecord> TrackReplicationLog::getTracks() const {
    std::lock_guard<std::mutex> lock(lock_);
    return table_.getTracks();
}

std::optional<TrackRecord> TrackReplicationLog::getTrack(const std::string& trackId) const {
    std::lock_guard<std::mutex> lock(lock_);
    return table_.getTrack(trackId);
}

std::vector<std::string> TrackReplicationLog::getUnsavedTrackIds() const {
    std::lock_guard<std::mutex> lock(lock_);
    std::vector<std::string> ids;
    for (const auto& [trackId, events] : unsaved_)
        ids.push_back(trackId);
    return ids;
}

bool TrackReplicationLog::hasOutboxEventLocked(const std::string& trackId) const {
    return std::any_of(outbox_.begin(), outbox_.end(), [&trackId](const TrackMutationEvent& e) {
        return e.trackId == trackId;
    });
}

size_t TrackReplicationLog::getOutboxSize() const {
    std::lock_guard<std::mutex> lock(lock_);
    return outbox_.size();
}

bool TrackReplicationLog::isHydrated() const {
    std::lock_guard<std::mutex> lock(lock_);
    return hydrated_;
}

void TrackReplicationLog::addListener(TrackLogListener* listener) {
    std::lock_guard<std::mutex> lock(lock_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
        listeners_.push_back(listener);
}

void TrackReplicationLog::removeListener(TrackLogListener* listener) {
    std::lock_guard<std::mutex> lock(lock_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

void TrackReplicationLog::notifyChanged() {
    std::vector<TrackLogListener*> listeners;
    std::vector<TrackRecord> tracks;
    {
        std::lock_guard<std::mutex> lock(lock_);
        listeners = listeners_;
        tracks = table_.getTracks();
    }
    for (auto* listener : listeners)
        listener->tracksChanged(tracks);
}

void TrackReplicationLog::notifyPersistenceFailed(const std::string& trackId,
                                                  const std::string& message) {
    std::vector<TrackLogListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(lock_);
        listeners = listeners_;
    }
    for (auto* listener : listeners)
        listener->persistenceFailed(trackId, message);
}

}  // namespace jamroom
