#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ChannelTransport.hpp"
#include "SessionTypes.hpp"
#include "TrackTable.hpp"
#include "jamroom/core/interfaces/track_store_interface.hpp"

namespace jamroom {

/**
 * @brief Listener interface for track table changes
 */
class TrackLogListener {
  public:
    virtual ~TrackLogListener() = default;

    // Visible tracks after a change, in display order
    virtual void tracksChanged(const std::vector<TrackRecord>& tracks) = 0;

    // A local change was applied but could not be stored
    virtual void persistenceFailed(const std::string& trackId, const std::string& message) {
        (void)trackId;
        (void)message;
    }
};

/**
 * @brief Replicated track table of one project
 *
 * Local mutations are applied optimistically, broadcast on the tracks topic
 * and written to the store. Remote mutations are merged field by field with
 * last-writer-wins. Events published while offline wait in an outbox that is
 * flushed after the next re-hydration.
 */
class TrackReplicationLog {
  public:
    TrackReplicationLog(ChannelTransport& transport, std::string projectId,
                        TrackStoreInterface* store, std::string localUserId,
                        Clock clock = systemClock());
    ~TrackReplicationLog();

    TrackReplicationLog(const TrackReplicationLog&) = delete;
    TrackReplicationLog& operator=(const TrackReplicationLog&) = delete;

    /**
     * @brief Subscribe, then load the stored table and replay what arrived meanwhile
     * @throws PersistenceError if the store cannot be read
     */
    void hydrate();

    /**
     * @brief Rebuild from the store after a reconnect, keeping local changes
     *
     * Unsaved local events are re-applied on top of the stored table. Events
     * queued while offline are re-stamped with the current time, applied,
     * flushed and written to the store.
     * @throws PersistenceError if the store cannot be read
     */
    void rehydrate();

    void close();

    /**
     * @brief Apply, broadcast and persist a local change
     * @throws ConflictApplyError if the event is invalid (nothing is applied)
     * @throws PersistenceError if the store write failed (the change is kept)
     */
    void applyLocalMutation(const TrackMutationEvent& event);

    /**
     * @brief Merge an event received from a peer; invalid events are dropped
     */
    void onRemoteMutation(const TrackMutationEvent& event);

    // Convenience builders stamped with the local user and a monotonic clock
    TrackRecord createTrack(const TrackFields& fields, const std::string& trackId = {});
    void updateTrack(const std::string& trackId, const TrackFields& fields);
    void deleteTrack(const std::string& trackId);

    /**
     * @brief Write every unsaved track to the store again
     * @return true if nothing is left unsaved
     */
    bool retryPersistence();

    /**
     * @brief Publish events queued while offline
     * @return Number of events sent
     */
    size_t flushOutbox();

    std::vector<TrackRecord> getTracks() const;
    std::optional<TrackRecord> getTrack(const std::string& trackId) const;

    std::vector<std::string> getUnsavedTrackIds() const;
    size_t getOutboxSize() const;
    std::uint64_t getDroppedEventCount() const {
        return droppedEvents_.load();
    }
    bool isHydrated() const;

    const std::string& getProjectId() const {
        return projectId_;
    }

    void addListener(TrackLogListener* listener);
    void removeListener(TrackLogListener* listener);

  private:
    void ensureSubscribed();
    void handleEvent(const ChannelEvent& event);
    std::vector<TrackRecord> loadStored();
    void applyQuietlyLocked(const TrackMutationEvent& event);
    bool persist(const std::string& trackId, std::string& error);
    Timestamp nextLocalTimestamp();
    void notifyChanged();
    void notifyPersistenceFailed(const std::string& trackId, const std::string& message);
    bool hasOutboxEventLocked(const std::string& trackId) const;

    ChannelTransport& transport_;
    const std::string projectId_;
    const std::string topic_;
    TrackStoreInterface* store_;
    const std::string localUserId_;
    Clock clock_;

    mutable std::mutex lock_;
    TrackTable table_;
    bool hydrating_ = false;
    bool hydrated_ = false;
    std::vector<TrackMutationEvent> buffered_;
    std::vector<TrackMutationEvent> outbox_;
    std::map<std::string, std::vector<TrackMutationEvent>> unsaved_;
    Timestamp lastLocalTimestamp_ = 0;
    std::atomic<std::uint64_t> droppedEvents_{0};

    std::vector<TrackLogListener*> listeners_;
    std::unique_ptr<ChannelSubscription> subscription_;
};

}  // namespace jamroom
