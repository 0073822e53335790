#include "geo/projection.h"
#include "geo/geo_math.h"
#include "common/constants.h"
#include <cmath>

namespace skyview {
namespace geo {

namespace {
    double latitudeScale(const GeoPoint& reference) {
        return 1.0 / std::cos(toRadians(reference.latitude));
    }
}

Projection::Projection(int zoom_level, const GeoPoint& reference)
    : zoom_level_(zoom_level)
    , reference_(reference)
    , pixels_per_degree_(pixelsPerDegreeLongitude(zoom_level))
    , latitude_scale_(latitudeScale(reference)) {}

PixelPoint Projection::toPixel(const GeoPoint& point) const {
    return PixelPoint{
        (point.longitude - reference_.longitude) * pixels_per_degree_,
        (point.latitude - reference_.latitude) * pixels_per_degree_ * latitude_scale_
    };
}

GeoPoint Projection::toGeo(const PixelPoint& pixel) const {
    return GeoPoint{
        reference_.latitude + pixel.y / (pixels_per_degree_ * latitude_scale_),
        reference_.longitude + pixel.x / pixels_per_degree_
    };
}

double Projection::pixelsPerDegreeLongitude(int zoom_level) {
    return std::ldexp(static_cast<double>(constants::TILE_SIZE), zoom_level) / 360.0;
}

PixelPoint Projection::toPixel(const GeoPoint& point, int zoom_level, const GeoPoint& reference) {
    return Projection(zoom_level, reference).toPixel(point);
}

GeoPoint Projection::toGeo(const PixelPoint& pixel, int zoom_level, const GeoPoint& reference) {
    return Projection(zoom_level, reference).toGeo(pixel);
}

} // namespace geo
} // namespace skyview
