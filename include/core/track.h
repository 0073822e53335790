#ifndef SKYVIEW_TRACK_H
#define SKYVIEW_TRACK_H

#include "common/types.h"
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>

namespace skyview {

struct TrailPoint {
    GeoPoint position;
    std::optional<int> altitude;
    TimePoint recorded_at;
};

// Per (track, source) bookkeeping in fusion mode
struct SourceRecord {
    uint8_t priority;
    TimePoint last_update;
};

struct Track {
    std::string identifier;
    std::optional<std::string> callsign;
    GeoPoint position;
    std::optional<int> altitude;
    std::optional<double> heading;
    std::optional<double> ground_speed;
    std::optional<int> vertical_rate;
    std::optional<std::string> squawk;
    TimePoint last_update;

    // Oldest first
    std::deque<TrailPoint> trail;
    std::optional<TimePoint> last_trail_sample;

    // Fusion ownership; empty source name in single-source mode
    std::string primary_source;
    uint8_t primary_priority{0};
    std::map<std::string, SourceRecord> sources;

    // Callsign when known, identifier otherwise
    std::string displayLabel() const { return callsign ? *callsign : identifier; }

    double ageSeconds(TimePoint now) const { return secondsBetween(last_update, now); }
};

} // namespace skyview

#endif // SKYVIEW_TRACK_H
