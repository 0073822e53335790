#ifndef SKYVIEW_PROJECTION_H
#define SKYVIEW_PROJECTION_H

#include "common/types.h"

namespace skyview {
namespace geo {

/**
 * Slippy-map style projection between geographic coordinates and a planar
 * world-pixel space anchored at a reference point.
 *
 * Longitude maps linearly to X. Latitude maps linearly to Y scaled by
 * 1/cos(reference latitude), i.e. the cosine compensation is evaluated at the
 * reference latitude rather than at each point's own latitude. This keeps the
 * frame consistent with the tile renderer and is accurate for viewport spans
 * up to a few hundred nautical miles; it is not true Mercator curvature.
 *
 * Y grows north. Zoom levels must already be validated (0..19).
 */
class Projection {
public:
    Projection(int zoom_level, const GeoPoint& reference);

    PixelPoint toPixel(const GeoPoint& point) const;
    GeoPoint toGeo(const PixelPoint& pixel) const;

    int getZoomLevel() const { return zoom_level_; }
    const GeoPoint& getReference() const { return reference_; }
    double getPixelsPerDegree() const { return pixels_per_degree_; }

    static double pixelsPerDegreeLongitude(int zoom_level);
    static PixelPoint toPixel(const GeoPoint& point, int zoom_level, const GeoPoint& reference);
    static GeoPoint toGeo(const PixelPoint& pixel, int zoom_level, const GeoPoint& reference);

private:
    int zoom_level_;
    GeoPoint reference_;
    double pixels_per_degree_;
    double latitude_scale_;    // 1 / cos(reference latitude)
};

} // namespace geo
} // namespace skyview

#endif // SKYVIEW_PROJECTION_H
