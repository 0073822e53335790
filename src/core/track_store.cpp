#include "core/track_store.h"
#include "common/logger.h"
#include <algorithm>
#include <stdexcept>

namespace skyview {

float stalenessOpacity(double elapsed_seconds, const StalenessConfig& config) {
    if (elapsed_seconds < config.start_seconds) {
        return 1.0f;
    }
    if (elapsed_seconds < config.full_seconds) {
        double t = (elapsed_seconds - config.start_seconds) /
                   (config.full_seconds - config.start_seconds);
        return static_cast<float>(1.0 - t * (1.0 - config.min_opacity));
    }
    return config.min_opacity;
}

float trailPointOpacity(double age_seconds, const TrailConfig& config) {
    if (age_seconds < config.solid_seconds) {
        return 1.0f;
    }
    if (age_seconds < config.solid_seconds + config.fade_seconds) {
        return static_cast<float>(1.0 - (age_seconds - config.solid_seconds) / config.fade_seconds);
    }
    return 0.0f;
}

TrackStore::TrackStore() = default;

TrackStore::TrackStore(const TrailConfig& trail_config, const StalenessConfig& staleness_config)
    : trail_config_(trail_config)
    , staleness_config_(staleness_config) {

    if (trail_config_.sample_interval.count() < 0 || trail_config_.max_age_seconds <= 0.0) {
        throw std::invalid_argument("Invalid trail configuration");
    }
    if (trail_config_.fade_seconds <= 0.0) {
        throw std::invalid_argument("Trail fade duration must be positive");
    }
    if (staleness_config_.full_seconds <= staleness_config_.start_seconds ||
        staleness_config_.min_opacity < 0.0f || staleness_config_.min_opacity > 1.0f) {
        throw std::invalid_argument("Invalid staleness configuration");
    }
}

UpdateOutcome TrackStore::upsert(const AircraftReport& report, TimePoint now) {
    return applyUpdate(report, now, WritePredicate());
}

UpdateOutcome TrackStore::applyUpdate(const AircraftReport& report, TimePoint now,
                                      const WritePredicate& may_write) {
    auto clean = sanitizeReport(report);
    if (!clean) {
        return UpdateOutcome::DROPPED;
    }

    TimePoint seen = clean->last_seen ? *clean->last_seen : now;
    auto it = tracks_.find(clean->identifier);

    if (it == tracks_.end()) {
        if (!clean->position) {
            return UpdateOutcome::DROPPED;
        }

        Track track;
        track.identifier = clean->identifier;
        track.position = *clean->position;
        track.last_update = seen;
        mergeFields(track, *clean);
        tracks_.emplace(track.identifier, std::move(track));

        Logger::getInstance().debug("Track created: " + clean->identifier);
        return UpdateOutcome::CREATED;
    }

    Track& track = it->second;
    track.last_update = std::max(track.last_update, seen);

    if (may_write && !may_write(track)) {
        return UpdateOutcome::LIVENESS_ONLY;
    }

    mergeFields(track, *clean);
    return UpdateOutcome::UPDATED;
}

void TrackStore::mergeFields(Track& track, const AircraftReport& report) {
    track.identifier = report.identifier;
    applyPartial(track, report);
}

bool TrackStore::recordTrailSample(const std::string& identifier, TimePoint now) {
    Track* track = find(identifier);
    if (!track) {
        return false;
    }

    if (track->last_trail_sample &&
        now - *track->last_trail_sample < trail_config_.sample_interval) {
        return false;
    }

    track->trail.push_back(TrailPoint{track->position, track->altitude, now});
    track->last_trail_sample = now;
    return true;
}

std::size_t TrackStore::recordTrailSamples(TimePoint now) {
    std::size_t recorded = 0;
    for (auto& entry : tracks_) {
        if (recordTrailSample(entry.first, now)) {
            recorded++;
        }
    }
    return recorded;
}

void TrackStore::pruneTrails(double max_age_seconds, TimePoint now) {
    for (auto& entry : tracks_) {
        auto& trail = entry.second.trail;
        // Time ordered, so everything expired sits at the front
        while (!trail.empty() && secondsBetween(trail.front().recorded_at, now) > max_age_seconds) {
            trail.pop_front();
        }
    }
}

std::vector<std::string> TrackStore::removeAbsent(const std::set<std::string>& current_identifiers) {
    std::vector<std::string> removed;

    for (auto it = tracks_.begin(); it != tracks_.end();) {
        if (current_identifiers.count(it->first) == 0) {
            removed.push_back(it->first);
            it = tracks_.erase(it);
        } else {
            ++it;
        }
    }

    if (!removed.empty()) {
        Logger::getInstance().debug("Removed " + std::to_string(removed.size()) +
                                    " tracks absent from snapshot");
    }
    return removed;
}

float TrackStore::stalenessOpacity(const Track& track, TimePoint now) const {
    return skyview::stalenessOpacity(track.ageSeconds(now), staleness_config_);
}

float TrackStore::trailPointOpacity(const TrailPoint& point, TimePoint now) const {
    return skyview::trailPointOpacity(secondsBetween(point.recorded_at, now), trail_config_);
}

Track* TrackStore::find(const std::string& identifier) {
    auto it = tracks_.find(AircraftReport::normalizeIdentifier(identifier));
    return it != tracks_.end() ? &it->second : nullptr;
}

const Track* TrackStore::find(const std::string& identifier) const {
    auto it = tracks_.find(AircraftReport::normalizeIdentifier(identifier));
    return it != tracks_.end() ? &it->second : nullptr;
}

void TrackStore::clear() {
    tracks_.clear();
}

} // namespace skyview
