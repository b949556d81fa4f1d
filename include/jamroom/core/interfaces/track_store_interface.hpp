#pragma once

#include <string>
#include <vector>

#include "../model.hpp"

namespace jamroom {

/**
 * @brief Durable backing store for project tracks
 *
 * Implementations report failures by throwing; the replication log converts
 * them to PersistenceError.
 */
class TrackStoreInterface {
  public:
    virtual ~TrackStoreInterface() = default;

    /**
     * @brief Load the current track table of a project
     */
    virtual std::vector<TrackRecord> listTracks(const std::string& project_id) = 0;

    /**
     * @brief Insert or replace a track
     */
    virtual void upsertTrack(const TrackRecord& record) = 0;

    /**
     * @brief Remove a track
     */
    virtual void deleteTrack(const std::string& track_id) = 0;
};

}  // namespace jamroom
