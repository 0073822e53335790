#include "core/aircraft_report.h"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace skyview {

namespace {
    std::string trim(const std::string& value) {
        auto first = std::find_if_not(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isspace(c); });
        auto last = std::find_if_not(value.rbegin(), value.rend(),
                                     [](unsigned char c) { return std::isspace(c); }).base();
        if (first >= last) {
            return "";
        }
        return std::string(first, last);
    }
}

std::string AircraftReport::normalizeIdentifier(const std::string& identifier) {
    std::string normalized = trim(identifier);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return normalized;
}

std::optional<AircraftReport> sanitizeReport(const AircraftReport& report) {
    AircraftReport clean = report;
    clean.identifier = AircraftReport::normalizeIdentifier(report.identifier);
    if (clean.identifier.empty()) {
        return std::nullopt;
    }

    if (clean.position) {
        if (clean.position->isFinite()) {
            clean.position = GeoPoint::clamped(clean.position->latitude,
                                               clean.position->longitude);
        } else {
            clean.position.reset();
        }
    }
    if (clean.heading && !std::isfinite(*clean.heading)) {
        clean.heading.reset();
    }
    if (clean.ground_speed && !std::isfinite(*clean.ground_speed)) {
        clean.ground_speed.reset();
    }
    if (clean.callsign) {
        std::string callsign = trim(*clean.callsign);
        if (callsign.empty()) {
            clean.callsign.reset();
        } else {
            clean.callsign = callsign;
        }
    }
    if (clean.squawk) {
        std::string squawk = trim(*clean.squawk);
        if (squawk.empty()) {
            clean.squawk.reset();
        } else {
            clean.squawk = squawk;
        }
    }

    return clean;
}

} // namespace skyview
