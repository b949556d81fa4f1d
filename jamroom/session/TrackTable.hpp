#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "SessionTypes.hpp"
#include "jamroom/core/errors.hpp"

namespace jamroom {

/**
 * @brief Materialized track table of one project
 *
 * Every field is a last-writer-wins register ordered by (timestamp, actorId);
 * equal stamps keep the greater value. A delete stamps a tombstone and only
 * fields written strictly after it survive. The visible state is a pure
 * function of the set of events applied, whatever their order.
 *
 * Not thread safe; TrackReplicationLog serializes access.
 */
class TrackTable {
  public:
    explicit TrackTable(std::string projectId);

    /**
     * @brief Check an event before it touches any table
     * @throws ConflictApplyError for empty ids, a foreign project, an empty
     *         update or out-of-range values
     */
    static void validate(const TrackMutationEvent& event, const std::string& projectId);

    /**
     * @brief Stored record as a Create stamped with its last write
     */
    static TrackMutationEvent eventFromRecord(const TrackRecord& record);

    /**
     * @brief Delete stamped with the record's last write, hiding everything
     *        known about it while letting later writes recreate it
     */
    static TrackMutationEvent tombstoneFor(const TrackRecord& record);

    /**
     * @brief Merge one event
     * @return true if the visible state of the track changed
     * @throws ConflictApplyError if the event does not validate
     */
    bool apply(const TrackMutationEvent& event);

    /**
     * @brief Visible tracks ordered by trackNumber, then trackId
     */
    std::vector<TrackRecord> getTracks() const;

    std::optional<TrackRecord> getTrack(const std::string& trackId) const;

    bool contains(const std::string& trackId) const {
        return getTrack(trackId).has_value();
    }

    const std::string& getProjectId() const {
        return projectId_;
    }

  private:
    template <typename T> struct Register {
        T value{};
        Stamp stamp;
        bool written = false;

        void write(const T& incoming, const Stamp& incomingStamp) {
            if (!written || incomingStamp > stamp ||
                (incomingStamp == stamp && value < incoming)) {
                value = incoming;
                stamp = incomingStamp;
                written = true;
            }
        }
    };

    struct Entry {
        Register<std::string> name;
        Register<int> trackNumber;
        Register<std::string> audioRef;
        Register<double> gain;
        Register<double> pan;
        Register<bool> muted;
        Register<double> durationSeconds;
        Register<double> startOffsetSeconds;
        std::optional<Stamp> deletedAt;
    };

    static std::optional<TrackRecord> materialize(const std::string& trackId,
                                                  const std::string& projectId,
                                                  const Entry& entry);

    std::string projectId_;
    std::map<std::string, Entry> entries_;
};

}  // namespace jamroom
