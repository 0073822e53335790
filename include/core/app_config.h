#ifndef SKYVIEW_APP_CONFIG_H
#define SKYVIEW_APP_CONFIG_H

#include "core/data_source.h"
#include "core/track_store.h"
#include "core/traffic_statistics.h"
#include "display/view_state.h"
#include "common/constants.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace skyview {

enum class FusionMode {
    SINGLE_SOURCE,   // one feed, tracks follow its full snapshots
    MULTI_SOURCE     // N feeds merged by priority, tracks never removed
};

struct MapConfig {
    double default_latitude{constants::DEFAULT_LATITUDE};
    double default_longitude{constants::DEFAULT_LONGITUDE};
    int default_zoom{constants::DEFAULT_ZOOM_LEVEL};
};

struct AppConfig {
    std::vector<DataSourceConfig> sources;
    FusionMode fusion_mode{FusionMode::MULTI_SOURCE};

    MapConfig map;
    Viewport viewport{1280.0, 720.0};
    ZoomConfig zoom;
    TrailConfig trails;
    StalenessConfig staleness;
    PredictionConfig prediction;

    bool coverage_enabled{true};
    std::optional<GeoPoint> receiver_location;   // falls back to the map default

    std::chrono::milliseconds refresh_interval{constants::FEED_REFRESH_INTERVAL};
    std::chrono::milliseconds retry_backoff{constants::FEED_RETRY_BACKOFF};
    std::chrono::milliseconds frame_interval{constants::FRAME_INTERVAL};

    // Error message for the first invalid setting, nullopt when valid
    std::optional<std::string> validate() const;

    // Receiver used for coverage: explicit, else first source with one, else map default
    GeoPoint coverageReceiver() const;

    // "host:port" for live feeds, "file:<path>" for replay
    static std::optional<std::string> validateEndpoint(const std::string& endpoint);
    static bool isReplayEndpoint(const std::string& endpoint);
    static std::string replayPath(const std::string& endpoint);
};

} // namespace skyview

#endif // SKYVIEW_APP_CONFIG_H
