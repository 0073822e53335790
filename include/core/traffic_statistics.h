#ifndef SKYVIEW_TRAFFIC_STATISTICS_H
#define SKYVIEW_TRAFFIC_STATISTICS_H

#include "core/track.h"
#include "core/track_store.h"
#include <optional>
#include <string>
#include <vector>

namespace skyview {

// Track counts by altitude band
struct AltitudeBandStats {
    std::size_t below_10k{0};       // < 10,000 ft
    std::size_t from_10k_to_25k{0}; // 10,000 - 24,999 ft
    std::size_t from_25k_to_40k{0}; // 25,000 - 39,999 ft
    std::size_t above_40k{0};       // >= 40,000 ft
    std::size_t unknown{0};

    std::size_t total() const {
        return below_10k + from_10k_to_25k + from_25k_to_40k + above_40k + unknown;
    }

    static AltitudeBandStats fromTracks(const TrackStore& store);
};

// "FL350" at or above the transition altitude, "12500 ft" below, "---" unknown
std::string formatAltitude(std::optional<int> altitude_ft);

enum class EmergencyType {
    NONE,
    HIJACK,          // 7500
    RADIO_FAILURE,   // 7600
    GENERAL          // 7700
};

EmergencyType classifySquawk(const std::string& squawk);
const char* emergencyLabel(EmergencyType type);

struct EmergencyAlert {
    std::string identifier;
    std::string label;      // callsign or identifier
    EmergencyType type;
};

std::vector<EmergencyAlert> detectEmergencies(const TrackStore& store);

struct PredictionConfig {
    bool enabled{true};
    std::vector<double> horizons_minutes{1.0, 5.0, 15.0};
    double min_speed_knots{constants::PREDICTION_MIN_SPEED_KNOTS};
};

struct PredictedPoint {
    double minutes_ahead;
    GeoPoint position;
};

// Dead-reckoned positions at each horizon. Empty when prediction is off, or
// heading or speed is unknown, or the aircraft is slower than the minimum.
std::vector<PredictedPoint> predictFlightPath(const Track& track,
                                              const PredictionConfig& config = PredictionConfig());

} // namespace skyview

#endif // SKYVIEW_TRAFFIC_STATISTICS_H
