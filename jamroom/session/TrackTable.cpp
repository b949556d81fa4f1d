#include "TrackTable.hpp"

#include <algorithm>
#include <cmath>

namespace jamroom {

namespace {

void requireInRange(const std::optional<double>& value, double min, double max,
                    const char* field) {
    if (value && !(*value >= min && *value <= max))
        throw ConflictApplyError(std::string(field) + " out of range: " +
                                 std::to_string(*value));
}

void requireNonNegative(const std::optional<double>& value, const char* field) {
    if (value && !(std::isfinite(*value) && *value >= 0.0))
        throw ConflictApplyError(std::string(field) + " must be a finite value >= 0");
}

// Written after the tombstone, if any
template <typename T>
bool survives(const T& reg, const std::optional<Stamp>& deletedAt) {
    return reg.written && (!deletedAt || reg.stamp > *deletedAt);
}

}  // namespace

TrackTable::TrackTable(std::string projectId) : projectId_(std::move(projectId)) {}

void TrackTable::validate(const TrackMutationEvent& event, const std::string& projectId) {
    if (event.trackId.empty())
        throw ConflictApplyError("Track mutation without trackId");
    if (event.actorId.empty())
        throw ConflictApplyError("Track mutation without actorId: " + event.trackId);
    if (event.projectId != projectId)
        throw ConflictApplyError("Track mutation for project '" + event.projectId +
                                 "' applied to '" + projectId + "'");
    if (event.timestamp < 0)
        throw ConflictApplyError("Negative timestamp on " + event.trackId);

    if (event.kind == MutationKind::Delete)
        return;

    if (event.kind == MutationKind::Update && event.fields.isEmpty())
        throw ConflictApplyError("Empty update for " + event.trackId);

    requireInRange(event.fields.gain, 0.0, 1.0, "gain");
    requireInRange(event.fields.pan, -1.0, 1.0, "pan");
    requireNonNegative(event.fields.durationSeconds, "durationSeconds");
    requireNonNegative(event.fields.startOffsetSeconds, "startOffsetSeconds");
}

TrackMutationEvent TrackTable::eventFromRecord(const TrackRecord& record) {
    TrackMutationEvent event;
    event.trackId = record.trackId;
    event.projectId = record.projectId;
    event.kind = MutationKind::Create;
    event.timestamp = record.updatedAt;
    event.actorId = record.updatedBy.empty() ? std::string("store") : record.updatedBy;

    event.fields.name = record.name;
    event.fields.trackNumber = record.trackNumber;
    event.fields.audioRef = record.audioRef;
    event.fields.gain = record.gain;
    event.fields.pan = record.pan;
    event.fields.muted = record.muted;
    event.fields.durationSeconds = record.durationSeconds;
    event.fields.startOffsetSeconds = record.startOffsetSeconds;
    return event;
}

TrackMutationEvent TrackTable::tombstoneFor(const TrackRecord& record) {
    TrackMutationEvent event;
    event.trackId = record.trackId;
    event.projectId = record.projectId;
    event.kind = MutationKind::Delete;
    event.timestamp = record.updatedAt;
    event.actorId = record.updatedBy.empty() ? std::string("store") : record.updatedBy;
    return event;
}

bool TrackTable::apply(const TrackMutationEvent& event) {
    validate(event, projectId_);

    auto before = getTrack(event.trackId);
    auto& entry = entries_[event.trackId];
    const Stamp stamp{event.timestamp, event.actorId};

    if (event.kind == MutationKind::Delete) {
        if (!entry.deletedAt || stamp > *entry.deletedAt)
            entry.deletedAt = stamp;
    } else {
        const TrackRecord defaults;
        const auto& f = event.fields;
        const bool create = event.kind == MutationKind::Create;

        if (f.name || create)
            entry.name.write(f.name.value_or(defaults.name), stamp);
        if (f.trackNumber || create)
            entry.trackNumber.write(f.trackNumber.value_or(defaults.trackNumber), stamp);
        if (f.audioRef || create)
            entry.audioRef.write(f.audioRef.value_or(defaults.audioRef), stamp);
        if (f.gain || create)
            entry.gain.write(f.gain.value_or(defaults.gain), stamp);
        if (f.pan || create)
            entry.pan.write(f.pan.value_or(defaults.pan), stamp);
        if (f.muted || create)
            entry.muted.write(f.muted.value_or(defaults.muted), stamp);
        if (f.durationSeconds || create)
            entry.durationSeconds.write(f.durationSeconds.value_or(defaults.durationSeconds),
                                        stamp);
        if (f.startOffsetSeconds || create)
            entry.startOffsetSeconds.write(
                f.startOffsetSeconds.value_or(defaults.startOffsetSeconds), stamp);
    }

    return before != getTrack(event.trackId);
}

std::vector<TrackRecord> TrackTable::getTracks() const {
    std::vector<TrackRecord> tracks;
    for (const auto& [trackId, entry] : entries_) {
        if (auto record = materialize(trackId, projectId_, entry))
            tracks.push_back(std::move(*record));
    }

    std::stable_sort(tracks.begin(), tracks.end(), [](const TrackRecord& a, const TrackRecord& b) {
        if (a.trackNumber != b.trackNumber)
            return a.trackNumber < b.trackNumber;
        return a.trackId < b.trackId;
    });
    return tracks;
}

std::optional<TrackRecord> TrackTable::getTrack(const std::string& trackId) const {
    auto it = entries_.find(trackId);
    if (it == entries_.end())
        return std::nullopt;
    return materialize(trackId, projectId_, it->second);
}

std::optional<TrackRecord> TrackTable::materialize(const std::string& trackId,
                                                   const std::string& projectId,
                                                   const Entry& entry) {
    TrackRecord record;
    record.trackId = trackId;
    record.projectId = projectId;

    bool visible = false;
    Stamp latest;

    auto take = [&](const auto& reg, auto& field) {
        if (!survives(reg, entry.deletedAt))
            return;
        field = reg.value;
        if (!visible || reg.stamp > latest)
            latest = reg.stamp;
        visible = true;
    };

    take(entry.name, record.name);
    take(entry.trackNumber, record.trackNumber);
    take(entry.audioRef, record.audioRef);
    take(entry.gain, record.gain);
    take(entry.pan, record.pan);
    take(entry.muted, record.muted);
    take(entry.durationSeconds, record.durationSeconds);
    take(entry.startOffsetSeconds, record.startOffsetSeconds);

    if (!visible)
        return std::nullopt;

    record.updatedAt = latest.timestamp;
    record.updatedBy = latest.actorId;
    return record;
}

}  // namespace jamroom
