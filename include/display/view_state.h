#ifndef SKYVIEW_VIEW_STATE_H
#define SKYVIEW_VIEW_STATE_H

#include "common/types.h"
#include "common/constants.h"
#include <cstdint>
#include <string>

namespace skyview {

struct ViewState {
    GeoPoint center;              // geographic point at the screen centre
    int zoom_level;               // discrete tile zoom level [0, 19]
    double continuous_zoom;       // scale factor on top of the tile level
    GeoPoint reference_point;     // geographic point mapped to the pixel origin

    static ViewState defaults() {
        GeoPoint home{constants::DEFAULT_LATITUDE, constants::DEFAULT_LONGITUDE};
        return ViewState{home, constants::DEFAULT_ZOOM_LEVEL, 1.0, home};
    }
};

struct Viewport {
    double width;     // screen pixels
    double height;    // screen pixels
};

// Tuning for the zoom controller; defaults match the map viewer
struct ZoomConfig {
    int min_zoom_level{constants::MIN_ZOOM_LEVEL};
    int max_zoom_level{constants::MAX_ZOOM_LEVEL};
    double min_continuous_zoom{constants::MIN_CAMERA_ZOOM};
    double max_continuous_zoom{constants::MAX_CAMERA_ZOOM};
    double upgrade_threshold{constants::ZOOM_UPGRADE_THRESHOLD};
    double downgrade_threshold{constants::ZOOM_DOWNGRADE_THRESHOLD};
    double line_sensitivity{constants::ZOOM_SENSITIVITY_LINE};
    double pixel_sensitivity{constants::ZOOM_SENSITIVITY_PIXEL};
    double pinch_sensitivity{constants::ZOOM_SENSITIVITY_PINCH};
    double pan_request_threshold{constants::PAN_TILE_REQUEST_THRESHOLD};
};

// Saved view, as exchanged with the config store
struct Bookmark {
    std::string name;
    double latitude;
    double longitude;
    uint8_t zoom_level;
};

} // namespace skyview

#endif // SKYVIEW_VIEW_STATE_H
