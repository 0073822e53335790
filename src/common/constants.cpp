#include "common/constants.h"

namespace skyview {
namespace constants {

// Geodesy
const double EARTH_RADIUS_NM = 3440.065;
const double FEET_TO_METERS = 0.3048;
const double NM_TO_KM = 1.852;
const double NM_PER_DEGREE = 60.0;
const double MERCATOR_LAT_LIMIT = 85.0511;

// Map tiles
const int TILE_SIZE = 256;
const int MIN_ZOOM_LEVEL = 0;
const int MAX_ZOOM_LEVEL = 19;
const int DEFAULT_ZOOM_LEVEL = 10;
const int TILE_DOWNLOAD_RADIUS = 3;
const int MIN_TILE_RADIUS = 3;
const int MAX_TILE_RADIUS = 8;
const double PAN_TILE_REQUEST_THRESHOLD = 0.001;

// Continuous zoom
const double ZOOM_UPGRADE_THRESHOLD = 1.5;
const double ZOOM_DOWNGRADE_THRESHOLD = 0.75;
const double MIN_CAMERA_ZOOM = 0.1;
const double MAX_CAMERA_ZOOM = 10.0;
const double ZOOM_SENSITIVITY_LINE = 0.1;
const double ZOOM_SENSITIVITY_PIXEL = 0.002;
const double ZOOM_SENSITIVITY_PINCH = 1.0;

// Default map center (Wichita, KS)
const double DEFAULT_LATITUDE = 37.6872;
const double DEFAULT_LONGITUDE = -97.3301;

// Trails
const int TRAIL_SAMPLE_INTERVAL_MS = 2000;
const int TRAIL_MAX_AGE_SECONDS = 300;
const int TRAIL_SOLID_SECONDS = 225;
const int TRAIL_FADE_SECONDS = 75;

// Staleness
const double STALE_START_SECONDS = 10.0;
const double STALE_FULL_SECONDS = 30.0;
const float STALE_MIN_OPACITY = 0.1f;


// Prediction
const double PREDICTION_MIN_SPEED_KNOTS = 10.0;

// Altitude
const int FL_THRESHOLD = 18000;

// Data sources
const std::uint8_t DEFAULT_SOURCE_PRIORITY = 100;

// Timing
const int FEED_REFRESH_INTERVAL = 1000;
const int FEED_RETRY_BACKOFF = 5000;
const int FRAME_INTERVAL = 16;
const int METRICS_LOG_INTERVAL = 60000;

const std::string SYSTEM_VERSION = "1.0.0";

} // namespace constants
} // namespace skyview
