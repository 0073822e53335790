#ifndef SKYVIEW_AIRCRAFT_REPORT_H
#define SKYVIEW_AIRCRAFT_REPORT_H

#include "common/types.h"
#include <cstdint>
#include <optional>
#include <string>

namespace skyview {

// One surveillance report as produced by a feed. Absent fields mean
// "not reported", never "cleared".
struct AircraftReport {
    std::string identifier;                 // 24-bit ICAO address, hex
    std::optional<GeoPoint> position;
    std::optional<int> altitude;            // feet
    std::optional<double> heading;          // degrees true
    std::optional<double> ground_speed;     // knots
    std::optional<int> vertical_rate;       // feet per minute
    std::optional<std::string> callsign;
    std::optional<std::string> squawk;
    std::optional<TimePoint> last_seen;     // when the feed last heard it

    bool isValid() const { return !normalizeIdentifier(identifier).empty(); }

    static std::string normalizeIdentifier(const std::string& identifier);
};

// A report tagged with the feed it came from (fusion mode)
struct SourcedReport {
    AircraftReport report;
    std::string source_name;
    std::optional<uint8_t> source_priority;
};

// Normalizes the identifier, drops non-finite values and clamps the
// position. Returns nullopt for reports that cannot be attributed.
std::optional<AircraftReport> sanitizeReport(const AircraftReport& report);

// Sparse merge: copies every field present in `update` onto `target` and
// leaves the rest untouched. Works for any record with the report's field
// names (a held AircraftReport, or a Track).
template <typename Target>
void applyPartial(Target& target, const AircraftReport& update) {
    if (update.position) {
        target.position = *update.position;
    }
    if (update.altitude) {
        target.altitude = update.altitude;
    }
    if (update.heading) {
        target.heading = update.heading;
    }
    if (update.ground_speed) {
        target.ground_speed = update.ground_speed;
    }
    if (update.vertical_rate) {
        target.vertical_rate = update.vertical_rate;
    }
    if (update.callsign) {
        target.callsign = update.callsign;
    }
    if (update.squawk) {
        target.squawk = update.squawk;
    }
}

} // namespace skyview

#endif // SKYVIEW_AIRCRAFT_REPORT_H
