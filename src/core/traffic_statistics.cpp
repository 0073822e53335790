#include "core/traffic_statistics.h"
#include "geo/geo_math.h"
#include "common/constants.h"
#include <cstdio>

namespace skyview {

AltitudeBandStats AltitudeBandStats::fromTracks(const TrackStore& store) {
    AltitudeBandStats stats;
    for (const auto& entry : store.tracks()) {
        const auto& altitude = entry.second.altitude;
        if (!altitude) {
            stats.unknown++;
        } else if (*altitude < 10000) {
            stats.below_10k++;
        } else if (*altitude < 25000) {
            stats.from_10k_to_25k++;
        } else if (*altitude < 40000) {
            stats.from_25k_to_40k++;
        } else {
            stats.above_40k++;
        }
    }
    return stats;
}

std::string formatAltitude(std::optional<int> altitude_ft) {
    if (!altitude_ft) {
        return "---";
    }
    if (*altitude_ft >= constants::FL_THRESHOLD) {
        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "FL%03d", *altitude_ft / 100);
        return buffer;
    }
    return std::to_string(*altitude_ft) + " ft";
}

EmergencyType classifySquawk(const std::string& squawk) {
    if (squawk == "7500") {
        return EmergencyType::HIJACK;
    }
    if (squawk == "7600") {
        return EmergencyType::RADIO_FAILURE;
    }
    if (squawk == "7700") {
        return EmergencyType::GENERAL;
    }
    return EmergencyType::NONE;
}

const char* emergencyLabel(EmergencyType type) {
    switch (type) {
        case EmergencyType::HIJACK:
            return "HIJACK";
        case EmergencyType::RADIO_FAILURE:
            return "RADIO FAILURE";
        case EmergencyType::GENERAL:
            return "EMERGENCY";
        case EmergencyType::NONE:
            break;
    }
    return "";
}

std::vector<EmergencyAlert> detectEmergencies(const TrackStore& store) {
    std::vector<EmergencyAlert> alerts;
    for (const auto& entry : store.tracks()) {
        const Track& track = entry.second;
        if (!track.squawk) {
            continue;
        }
        EmergencyType type = classifySquawk(*track.squawk);
        if (type != EmergencyType::NONE) {
            alerts.push_back(EmergencyAlert{track.identifier, track.displayLabel(), type});
        }
    }
    return alerts;
}

std::vector<PredictedPoint> predictFlightPath(const Track& track, const PredictionConfig& config) {
    std::vector<PredictedPoint> points;
    if (!config.enabled || !track.heading || !track.ground_speed) {
        return points;
    }
    if (*track.ground_speed < config.min_speed_knots) {
        return points;
    }

    for (double minutes : config.horizons_minutes) {
        points.push_back(PredictedPoint{
            minutes,
            geo::projectPosition(track.position, *track.heading, *track.ground_speed, minutes)
        });
    }
    return points;
}

} // namespace skyview
