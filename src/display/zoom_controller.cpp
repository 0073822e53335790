#include "display/zoom_controller.h"
#include "common/logger.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <sstream>

namespace skyview {

ZoomController::ZoomController(const ViewState& initial,
                               const Viewport& viewport,
                               std::shared_ptr<ITileRequestSink> tile_sink,
                               const ZoomConfig& config)
    : state_(initial)
    , viewport_(viewport)
    , config_(config)
    , tile_sink_(std::move(tile_sink)) {

    if (config_.min_zoom_level > config_.max_zoom_level ||
        config_.min_continuous_zoom <= 0.0 ||
        config_.min_continuous_zoom > config_.max_continuous_zoom) {
        throw std::invalid_argument("Invalid zoom configuration");
    }
    if (config_.downgrade_threshold >= config_.upgrade_threshold) {
        throw std::invalid_argument("Zoom hysteresis thresholds overlap");
    }
    if (!isValidZoomLevel(initial.zoom_level)) {
        throw std::invalid_argument("Invalid zoom level: " + std::to_string(initial.zoom_level));
    }
    if (viewport.width <= 0.0 || viewport.height <= 0.0) {
        throw std::invalid_argument("Viewport must have a positive size");
    }

    state_.center = GeoPoint::clamped(initial.center.latitude, initial.center.longitude);
    state_.reference_point = GeoPoint::clamped(initial.reference_point.latitude,
                                               initial.reference_point.longitude);
    state_.continuous_zoom = std::clamp(initial.continuous_zoom,
                                        config_.min_continuous_zoom,
                                        config_.max_continuous_zoom);
}

bool ZoomController::applyScroll(double delta, ScrollUnit unit,
                                 std::optional<PixelPoint> cursor) {
    double factor = 1.0 - delta * sensitivityFor(unit);
    if (!std::isfinite(factor) || factor <= 0.0) {
        // A huge zoom-out step; settle on the lower bound
        factor = config_.min_continuous_zoom / state_.continuous_zoom;
    }

    PixelPoint anchor = cursor ? *cursor
                               : PixelPoint{viewport_.width / 2.0, viewport_.height / 2.0};
    return zoomAround(state_.continuous_zoom * factor, anchor);
}

bool ZoomController::setContinuousZoom(double zoom) {
    if (!std::isfinite(zoom) || zoom <= 0.0) {
        Logger::getInstance().warning("Rejected continuous zoom value");
        return false;
    }
    return zoomAround(zoom, PixelPoint{viewport_.width / 2.0, viewport_.height / 2.0});
}

double ZoomController::sensitivityFor(ScrollUnit unit) const {
    switch (unit) {
        case ScrollUnit::LINE:
            return config_.line_sensitivity;
        case ScrollUnit::PIXEL:
            return config_.pixel_sensitivity;
        case ScrollUnit::PINCH:
            return config_.pinch_sensitivity;
    }
    return config_.line_sensitivity;
}

bool ZoomController::zoomAround(double new_zoom, const PixelPoint& anchor) {
    // Geographic point under the anchor before anything changes
    PixelPoint offset = screenOffset(anchor);
    GeoPoint anchored = screenToGeo(anchor);

    state_.continuous_zoom = std::clamp(new_zoom,
                                        config_.min_continuous_zoom,
                                        config_.max_continuous_zoom);
    bool level_changed = checkLevelTransition();

    // Solve for the centre that puts the anchored point back under the anchor
    geo::Projection proj = projection();
    PixelPoint anchored_px = proj.toPixel(anchored);
    PixelPoint center_px{anchored_px.x - offset.x / state_.continuous_zoom,
                         anchored_px.y - offset.y / state_.continuous_zoom};
    GeoPoint center = proj.toGeo(center_px);
    state_.center = GeoPoint::clamped(center.latitude, center.longitude);

    if (level_changed) {
        requestTiles(computeTileRadius());
    }
    return level_changed;
}

bool ZoomController::checkLevelTransition() {
    int previous = state_.zoom_level;

    if (state_.continuous_zoom >= config_.upgrade_threshold &&
        state_.zoom_level < config_.max_zoom_level) {
        state_.zoom_level++;
        state_.continuous_zoom /= 2.0;
    } else if (state_.continuous_zoom <= config_.downgrade_threshold &&
               state_.zoom_level > config_.min_zoom_level) {
        state_.zoom_level--;
        state_.continuous_zoom *= 2.0;
    }

    if (state_.zoom_level == previous) {
        return false;
    }

    std::ostringstream oss;
    oss << "Zoom level " << previous << " -> " << state_.zoom_level
        << " (continuous " << state_.continuous_zoom << ")";
    Logger::getInstance().debug(oss.str());
    return true;
}

void ZoomController::pan(double dx, double dy) {
    // Dragging right moves the map right, so the centre moves west.
    // Screen y grows down while world y grows north.
    geo::Projection proj = projection();
    PixelPoint center_px = proj.toPixel(state_.center);
    center_px.x -= dx / state_.continuous_zoom;
    center_px.y += dy / state_.continuous_zoom;

    GeoPoint center = proj.toGeo(center_px);
    state_.center = GeoPoint::clamped(center.latitude, center.longitude);

    bool should_request = true;
    if (last_pan_request_) {
        double lat_diff = std::fabs(state_.center.latitude - last_pan_request_->latitude);
        double lon_diff = std::fabs(state_.center.longitude - last_pan_request_->longitude);
        should_request = lat_diff > config_.pan_request_threshold ||
                         lon_diff > config_.pan_request_threshold;
    }

    if (should_request) {
        requestTiles(computeTileRadius());
        last_pan_request_ = state_.center;
    }
}

void ZoomController::endPan() {
    requestTiles(constants::TILE_DOWNLOAD_RADIUS);
    last_pan_request_ = state_.center;
}

void ZoomController::recenter(const GeoPoint& center) {
    state_.center = GeoPoint::clamped(center.latitude, center.longitude);
    requestTiles(computeTileRadius());
    last_pan_request_ = state_.center;
}

bool ZoomController::jumpTo(const Bookmark& bookmark) {
    if (!isValidZoomLevel(bookmark.zoom_level)) {
        Logger::getInstance().warning("Bookmark '" + bookmark.name +
                                      "' has invalid zoom level " +
                                      std::to_string(bookmark.zoom_level));
        return false;
    }
    if (!std::isfinite(bookmark.latitude) || !std::isfinite(bookmark.longitude)) {
        Logger::getInstance().warning("Bookmark '" + bookmark.name + "' has invalid coordinates");
        return false;
    }

    GeoPoint target = GeoPoint::clamped(bookmark.latitude, bookmark.longitude);
    state_.center = target;
    state_.reference_point = target;
    state_.zoom_level = bookmark.zoom_level;
    state_.continuous_zoom = std::clamp(1.0, config_.min_continuous_zoom,
                                        config_.max_continuous_zoom);
    last_pan_request_.reset();

    Logger::getInstance().log("Jumped to bookmark '" + bookmark.name + "'");
    requestTiles(computeTileRadius());
    return true;
}

Bookmark ZoomController::makeBookmark(const std::string& name) const {
    return Bookmark{name,
                    state_.center.latitude,
                    state_.center.longitude,
                    static_cast<uint8_t>(state_.zoom_level)};
}

PixelPoint ZoomController::screenOffset(const PixelPoint& screen) const {
    return PixelPoint{screen.x - viewport_.width / 2.0,
                      -(screen.y - viewport_.height / 2.0)};
}

GeoPoint ZoomController::screenToGeo(const PixelPoint& screen) const {
    geo::Projection proj = projection();
    PixelPoint center_px = proj.toPixel(state_.center);
    PixelPoint offset = screenOffset(screen);
    return proj.toGeo(PixelPoint{center_px.x + offset.x / state_.continuous_zoom,
                                 center_px.y + offset.y / state_.continuous_zoom});
}

PixelPoint ZoomController::geoToScreen(const GeoPoint& point) const {
    geo::Projection proj = projection();
    PixelPoint center_px = proj.toPixel(state_.center);
    PixelPoint world = proj.toPixel(point);
    return PixelPoint{viewport_.width / 2.0 + (world.x - center_px.x) * state_.continuous_zoom,
                      viewport_.height / 2.0 - (world.y - center_px.y) * state_.continuous_zoom};
}

int ZoomController::computeTileRadius() const {
    double tile_screen_px = constants::TILE_SIZE * state_.continuous_zoom;
    int half_tiles_x = static_cast<int>(std::ceil(viewport_.width / (2.0 * tile_screen_px)));
    int half_tiles_y = static_cast<int>(std::ceil(viewport_.height / (2.0 * tile_screen_px)));
    return std::clamp(std::max(half_tiles_x, half_tiles_y),
                      constants::MIN_TILE_RADIUS, constants::MAX_TILE_RADIUS);
}

void ZoomController::setViewport(const Viewport& viewport) {
    if (viewport.width <= 0.0 || viewport.height <= 0.0) {
        Logger::getInstance().warning("Ignoring viewport with non-positive size");
        return;
    }
    viewport_ = viewport;
}

bool ZoomController::isValidZoomLevel(int level) const {
    return level >= config_.min_zoom_level && level <= config_.max_zoom_level;
}

void ZoomController::requestTiles(int radius) {
    if (!tile_sink_) {
        return;
    }
    tile_sink_->requestTiles(TileRequest{state_.center, state_.zoom_level, radius});
}

geo::Projection ZoomController::projection() const {
    return geo::Projection(state_.zoom_level, state_.reference_point);
}

} // namespace skyview
