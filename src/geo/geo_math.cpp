#include "geo/geo_math.h"
#include "common/constants.h"
#include <cmath>

namespace skyview {
namespace geo {

namespace {
    const double PI = 3.14159265358979323846;
}

double toRadians(double degrees) {
    return degrees * PI / 180.0;
}

double toDegrees(double radians) {
    return radians * 180.0 / PI;
}

double normalizeDegrees(double degrees) {
    double normalized = std::fmod(degrees, 360.0);
    if (normalized < 0.0) {
        normalized += 360.0;
    }
    // fmod of a tiny negative value can round up to exactly 360
    if (normalized >= 360.0) {
        normalized = 0.0;
    }
    return normalized;
}

double haversineDistanceNm(const GeoPoint& a, const GeoPoint& b) {
    double lat1 = toRadians(a.latitude);
    double lat2 = toRadians(b.latitude);
    double delta_lat = toRadians(b.latitude - a.latitude);
    double delta_lon = toRadians(b.longitude - a.longitude);

    double sin_lat = std::sin(delta_lat / 2.0);
    double sin_lon = std::sin(delta_lon / 2.0);
    double h = sin_lat * sin_lat + std::cos(lat1) * std::cos(lat2) * sin_lon * sin_lon;
    // Rounding can push h marginally above 1 for antipodal points
    double c = 2.0 * std::asin(std::sqrt(std::fmin(1.0, h)));

    return constants::EARTH_RADIUS_NM * c;
}

double initialBearingDegrees(const GeoPoint& a, const GeoPoint& b) {
    if (a.latitude == b.latitude && a.longitude == b.longitude) {
        return 0.0;
    }

    double lat1 = toRadians(a.latitude);
    double lat2 = toRadians(b.latitude);
    double delta_lon = toRadians(b.longitude - a.longitude);

    double x = std::sin(delta_lon) * std::cos(lat2);
    double y = std::cos(lat1) * std::sin(lat2) -
               std::sin(lat1) * std::cos(lat2) * std::cos(delta_lon);

    double bearing = toDegrees(std::atan2(x, y));
    if (!std::isfinite(bearing)) {
        return 0.0;
    }
    return normalizeDegrees(bearing);
}

GeoPoint projectPosition(const GeoPoint& origin,
                         double heading_deg,
                         double speed_knots,
                         double minutes) {
    double distance_nm = speed_knots / 60.0 * minutes;
    if (distance_nm == 0.0) {
        return origin;
    }

    double angular_distance = distance_nm / constants::EARTH_RADIUS_NM;
    double heading = toRadians(heading_deg);
    double lat1 = toRadians(origin.latitude);
    double lon1 = toRadians(origin.longitude);

    double lat2 = std::asin(std::sin(lat1) * std::cos(angular_distance) +
                            std::cos(lat1) * std::sin(angular_distance) * std::cos(heading));
    double lon2 = lon1 + std::atan2(std::sin(heading) * std::sin(angular_distance) * std::cos(lat1),
                                    std::cos(angular_distance) - std::sin(lat1) * std::sin(lat2));

    double longitude = toDegrees(lon2);
    // Wrap across the antimeridian back into [-180, 180]
    longitude = std::fmod(longitude + 540.0, 360.0) - 180.0;

    return GeoPoint{toDegrees(lat2), longitude};
}

double nauticalMilesToKm(double nm) {
    return nm * constants::NM_TO_KM;
}

double feetToMeters(double feet) {
    return feet * constants::FEET_TO_METERS;
}

} // namespace geo
} // namespace skyview
