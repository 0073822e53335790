#ifndef SKYVIEW_ZOOM_CONTROLLER_H
#define SKYVIEW_ZOOM_CONTROLLER_H

#include "display/view_state.h"
#include "display/tile_request_sink.h"
#include "geo/projection.h"
#include <memory>
#include <optional>
#include <string>

namespace skyview {

enum class ScrollUnit {
    LINE,     // mouse wheel notches
    PIXEL,    // trackpad pixel deltas
    PINCH     // gesture scale delta
};

/**
 * Owns the discrete tile zoom level and the continuous zoom factor layered on
 * top of it.
 *
 * Screen coordinates have their origin at the top-left corner with y growing
 * down. One world pixel at the current tile level covers `continuous_zoom`
 * screen pixels, and the screen centre shows `center`.
 *
 * Level changes use a hysteresis band: promote at >= 1.5, demote at <= 0.75,
 * halving/doubling the continuous factor so the visible scale does not change
 * at the transition. Every level change emits a TileRequest.
 */
class ZoomController {
public:
    ZoomController(const ViewState& initial,
                   const Viewport& viewport,
                   std::shared_ptr<ITileRequestSink> tile_sink,
                   const ZoomConfig& config = ZoomConfig());

    // Scroll or pinch input. Negative deltas zoom in. The geographic point
    // under `cursor` (screen centre when absent) stays under it.
    // Returns true when the tile level changed.
    bool applyScroll(double delta, ScrollUnit unit,
                     std::optional<PixelPoint> cursor = std::nullopt);

    // Programmatic zoom anchored at the screen centre
    bool setContinuousZoom(double zoom);

    // Drag by screen-pixel deltas
    void pan(double dx, double dy);
    void endPan();

    void recenter(const GeoPoint& center);
    bool jumpTo(const Bookmark& bookmark);
    Bookmark makeBookmark(const std::string& name) const;

    GeoPoint screenToGeo(const PixelPoint& screen) const;
    PixelPoint geoToScreen(const GeoPoint& point) const;

    int computeTileRadius() const;

    const ViewState& getViewState() const { return state_; }
    const Viewport& getViewport() const { return viewport_; }
    void setViewport(const Viewport& viewport);

    bool isValidZoomLevel(int level) const;

private:
    double sensitivityFor(ScrollUnit unit) const;
    bool zoomAround(double new_zoom, const PixelPoint& anchor);
    bool checkLevelTransition();
    void requestTiles(int radius);

    geo::Projection projection() const;
    PixelPoint screenOffset(const PixelPoint& screen) const;

    ViewState state_;
    Viewport viewport_;
    ZoomConfig config_;
    std::shared_ptr<ITileRequestSink> tile_sink_;
    std::optional<GeoPoint> last_pan_request_;
};

} // namespace skyview

#endif // SKYVIEW_ZOOM_CONTROLLER_H
