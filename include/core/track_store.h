#ifndef SKYVIEW_TRACK_STORE_H
#define SKYVIEW_TRACK_STORE_H

#include "core/aircraft_report.h"
#include "core/track.h"
#include "common/constants.h"
#include <chrono>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace skyview {

enum class UpdateOutcome {
    CREATED,          // new track
    UPDATED,          // fields merged
    LIVENESS_ONLY,    // write refused, last update refreshed
    DROPPED           // malformed, or positionless for an unseen identifier
};

struct TrailConfig {
    std::chrono::milliseconds sample_interval{constants::TRAIL_SAMPLE_INTERVAL_MS};
    double max_age_seconds{static_cast<double>(constants::TRAIL_MAX_AGE_SECONDS)};
    double solid_seconds{static_cast<double>(constants::TRAIL_SOLID_SECONDS)};
    double fade_seconds{static_cast<double>(constants::TRAIL_FADE_SECONDS)};
};

struct StalenessConfig {
    double start_seconds{constants::STALE_START_SECONDS};
    double full_seconds{constants::STALE_FULL_SECONDS};
    float min_opacity{constants::STALE_MIN_OPACITY};
};

// Opacity of a track that has not been updated for `elapsed_seconds`
float stalenessOpacity(double elapsed_seconds, const StalenessConfig& config);

// Opacity of a trail point recorded `age_seconds` ago
float trailPointOpacity(double age_seconds, const TrailConfig& config);

/**
 * Authoritative set of tracks keyed by identifier.
 *
 * Every write goes through applyUpdate(), which merges sparsely: a field
 * absent from the report leaves the stored value untouched. Tracks are only
 * created from reports carrying a position.
 *
 * Not thread safe; owned by the frame loop.
 */
class TrackStore {
public:
    // Decides whether a report may overwrite an existing track's fields
    using WritePredicate = std::function<bool(const Track&)>;

    TrackStore();
    TrackStore(const TrailConfig& trail_config, const StalenessConfig& staleness_config);

    UpdateOutcome upsert(const AircraftReport& report, TimePoint now);
    UpdateOutcome applyUpdate(const AircraftReport& report, TimePoint now,
                              const WritePredicate& may_write);

    // Trails
    bool recordTrailSample(const std::string& identifier, TimePoint now);
    std::size_t recordTrailSamples(TimePoint now);
    void pruneTrails(double max_age_seconds, TimePoint now);
    void pruneTrails(TimePoint now) { pruneTrails(trail_config_.max_age_seconds, now); }

    // Single-source mode: drop tracks missing from the latest full snapshot
    std::vector<std::string> removeAbsent(const std::set<std::string>& current_identifiers);

    float stalenessOpacity(const Track& track, TimePoint now) const;
    float trailPointOpacity(const TrailPoint& point, TimePoint now) const;

    Track* find(const std::string& identifier);
    const Track* find(const std::string& identifier) const;
    const std::map<std::string, Track>& tracks() const { return tracks_; }
    std::size_t size() const { return tracks_.size(); }
    bool empty() const { return tracks_.empty(); }
    void clear();

    const TrailConfig& getTrailConfig() const { return trail_config_; }
    const StalenessConfig& getStalenessConfig() const { return staleness_config_; }

private:
    static void mergeFields(Track& track, const AircraftReport& report);

    std::map<std::string, Track> tracks_;
    TrailConfig trail_config_;
    StalenessConfig staleness_config_;
};

} // namespace skyview

#endif // SKYVIEW_TRACK_STORE_H
