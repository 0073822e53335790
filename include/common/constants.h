#ifndef SKYVIEW_CONSTANTS_H
#define SKYVIEW_CONSTANTS_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace skyview {
namespace constants {

// Geodesy
extern const double EARTH_RADIUS_NM;          // WGS-84 mean radius
extern const double FEET_TO_METERS;
extern const double NM_TO_KM;
extern const double NM_PER_DEGREE;            // coarse polar-to-lat/lon factor
extern const double MERCATOR_LAT_LIMIT;

// Map tiles
extern const int TILE_SIZE;                   // pixels per tile edge
extern const int MIN_ZOOM_LEVEL;
extern const int MAX_ZOOM_LEVEL;
extern const int DEFAULT_ZOOM_LEVEL;
extern const int TILE_DOWNLOAD_RADIUS;
extern const int MIN_TILE_RADIUS;
extern const int MAX_TILE_RADIUS;
extern const double PAN_TILE_REQUEST_THRESHOLD;   // degrees

// Continuous zoom
extern const double ZOOM_UPGRADE_THRESHOLD;
extern const double ZOOM_DOWNGRADE_THRESHOLD;
extern const double MIN_CAMERA_ZOOM;
extern const double MAX_CAMERA_ZOOM;
extern const double ZOOM_SENSITIVITY_LINE;    // mouse wheel
extern const double ZOOM_SENSITIVITY_PIXEL;   // trackpad scroll
extern const double ZOOM_SENSITIVITY_PINCH;

// Default map center
extern const double DEFAULT_LATITUDE;
extern const double DEFAULT_LONGITUDE;

// Trails
extern const int TRAIL_SAMPLE_INTERVAL_MS;    // 2s
extern const int TRAIL_MAX_AGE_SECONDS;       // 5 minutes
extern const int TRAIL_SOLID_SECONDS;
extern const int TRAIL_FADE_SECONDS;

// Staleness
extern const double STALE_START_SECONDS;
extern const double STALE_FULL_SECONDS;
extern const float STALE_MIN_OPACITY;


// Prediction
extern const double PREDICTION_MIN_SPEED_KNOTS;

// Altitude
extern const int FL_THRESHOLD;                // flight levels at or above 18,000 ft

// Data sources
extern const std::uint8_t DEFAULT_SOURCE_PRIORITY;

// Timing (in milliseconds)
extern const int FEED_REFRESH_INTERVAL;       // 1s
extern const int FEED_RETRY_BACKOFF;          // 5s
extern const int FRAME_INTERVAL;              // ~60 Hz
extern const int METRICS_LOG_INTERVAL;        // 60s

// System version
extern const std::string SYSTEM_VERSION;

} // namespace constants
} // namespace skyview

#endif // SKYVIEW_CONSTANTS_H
