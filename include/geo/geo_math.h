#ifndef SKYVIEW_GEO_MATH_H
#define SKYVIEW_GEO_MATH_H

#include "common/types.h"

namespace skyview {
namespace geo {

double toRadians(double degrees);
double toDegrees(double radians);

// Normalize an angle to [0, 360)
double normalizeDegrees(double degrees);

// Great-circle distance using the haversine formula, in nautical miles
double haversineDistanceNm(const GeoPoint& a, const GeoPoint& b);

// Initial bearing (forward azimuth) from a to b in degrees [0, 360),
// clockwise from north. Identical points have no bearing; 0 is returned.
double initialBearingDegrees(const GeoPoint& a, const GeoPoint& b);

// Spherical dead reckoning: where an aircraft at `origin` flying
// `heading_deg` at `speed_knots` will be after `minutes`.
GeoPoint projectPosition(const GeoPoint& origin,
                         double heading_deg,
                         double speed_knots,
                         double minutes);

double nauticalMilesToKm(double nm);
double feetToMeters(double feet);

} // namespace geo
} // namespace skyview

#endif // SKYVIEW_GEO_MATH_H
