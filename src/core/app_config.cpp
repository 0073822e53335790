#include "core/app_config.h"
#include <set>

namespace skyview {

namespace {
    const std::string REPLAY_PREFIX = "file:";
}

bool AppConfig::isReplayEndpoint(const std::string& endpoint) {
    return endpoint.compare(0, REPLAY_PREFIX.size(), REPLAY_PREFIX) == 0;
}

std::string AppConfig::replayPath(const std::string& endpoint) {
    if (!isReplayEndpoint(endpoint)) {
        return "";
    }
    return endpoint.substr(REPLAY_PREFIX.size());
}

std::optional<std::string> AppConfig::validateEndpoint(const std::string& endpoint) {
    if (endpoint.empty()) {
        return std::string("Endpoint address is required");
    }

    if (isReplayEndpoint(endpoint)) {
        if (replayPath(endpoint).empty()) {
            return std::string("Replay endpoint needs a file path");
        }
        return std::nullopt;
    }

    auto colon = endpoint.find(':');
    if (colon == std::string::npos || endpoint.find(':', colon + 1) != std::string::npos ||
        colon == 0) {
        return std::string("Endpoint must be in host:port format (e.g., 192.168.1.1:30003)");
    }

    std::string port = endpoint.substr(colon + 1);
    if (port.empty() || port.size() > 5 ||
        port.find_first_not_of("0123456789") != std::string::npos) {
        return std::string("Port must be a valid number (1-65535)");
    }
    int value = std::stoi(port);
    if (value < 1 || value > 65535) {
        return std::string("Port must be a valid number (1-65535)");
    }
    return std::nullopt;
}

std::optional<std::string> AppConfig::validate() const {
    std::set<std::string> names;
    for (const auto& source : sources) {
        if (source.name.empty()) {
            return std::string("Data source name is required");
        }
        if (!names.insert(source.name).second) {
            return "Duplicate data source name: " + source.name;
        }
        if (auto error = validateEndpoint(source.endpoint)) {
            return source.name + ": " + *error;
        }
        if (source.receiver_location &&
            (source.receiver_location->latitude < -90.0 || source.receiver_location->latitude > 90.0 ||
             source.receiver_location->longitude < -180.0 || source.receiver_location->longitude > 180.0)) {
            return source.name + ": receiver location out of range";
        }
    }

    if (fusion_mode == FusionMode::SINGLE_SOURCE) {
        std::size_t enabled = 0;
        for (const auto& source : sources) {
            if (source.enabled) {
                enabled++;
            }
        }
        if (enabled > 1) {
            return std::string("Single-source mode allows only one enabled source");
        }
    }

    if (refresh_interval.count() < 100 || refresh_interval.count() > 60000) {
        return std::string("Refresh interval must be 100-60000 ms");
    }
    if (retry_backoff.count() < 0) {
        return std::string("Retry backoff must not be negative");
    }
    if (frame_interval.count() <= 0) {
        return std::string("Frame interval must be positive");
    }

    if (map.default_latitude < -90.0 || map.default_latitude > 90.0) {
        return std::string("Latitude must be -90 to 90");
    }
    if (map.default_longitude < -180.0 || map.default_longitude > 180.0) {
        return std::string("Longitude must be -180 to 180");
    }
    if (map.default_zoom < constants::MIN_ZOOM_LEVEL || map.default_zoom > constants::MAX_ZOOM_LEVEL) {
        return std::string("Zoom must be 0-19");
    }

    if (viewport.width <= 0.0 || viewport.height <= 0.0) {
        return std::string("Viewport must have a positive size");
    }
    if (staleness.full_seconds <= staleness.start_seconds) {
        return std::string("Staleness thresholds must increase");
    }
    if (trails.max_age_seconds <= 0.0 || trails.fade_seconds <= 0.0) {
        return std::string("Trail durations must be positive");
    }
    if (prediction.min_speed_knots < 0.0) {
        return std::string("Prediction minimum speed must not be negative");
    }
    for (double horizon : prediction.horizons_minutes) {
        if (horizon <= 0.0) {
            return std::string("Prediction horizons must be positive");
        }
    }
    return std::nullopt;
}

GeoPoint AppConfig::coverageReceiver() const {
    if (receiver_location) {
        return *receiver_location;
    }
    for (const auto& source : sources) {
        if (source.enabled && source.receiver_location) {
            return *source.receiver_location;
        }
    }
    return GeoPoint{map.default_latitude, map.default_longitude};
}

} // namespace skyview
