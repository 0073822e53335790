#include "core/coverage_tracker.h"
#include "geo/geo_math.h"
#include "common/constants.h"
#include "common/logger.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace skyview {


void CoverageSector::observe(double range_nm) {
    max_range_nm = std::max(max_range_nm, range_nm);
    aircraft_count++;
    avg_range_nm += (range_nm - avg_range_nm) / static_cast<double>(aircraft_count);
}

void CoverageSector::reset() {
    max_range_nm = 0.0;
    avg_range_nm = 0.0;
    aircraft_count = 0;
}

CoverageTracker::CoverageTracker(const GeoPoint& receiver, bool enabled)
    : receiver_(GeoPoint::clamped(receiver.latitude, receiver.longitude))
    , enabled_(enabled) {}

std::size_t CoverageTracker::bearingToSector(double bearing_deg) {
    double normalized = geo::normalizeDegrees(bearing_deg);
    auto sector = static_cast<std::size_t>(normalized / DEGREES_PER_SECTOR);
    return std::min(sector, NUM_SECTORS - 1);
}

void CoverageTracker::observe(const std::string& identifier, const GeoPoint& position,
                              const GeoPoint& receiver) {
    GeoPoint clamped = GeoPoint::clamped(receiver.latitude, receiver.longitude);
    if (clamped.latitude != receiver_.latitude || clamped.longitude != receiver_.longitude) {
        setReceiver(clamped);
    }
    observe(identifier, position);
}

void CoverageTracker::observe(const std::string& identifier, const GeoPoint& position) {
    if (!enabled_ || identifier.empty() || !position.isFinite()) {
        return;
    }

    double bearing = geo::initialBearingDegrees(receiver_, position);
    double range = geo::haversineDistanceNm(receiver_, position);
    std::size_t sector = bearingToSector(bearing);

    auto& seen = sectors_seen_[identifier];
    if (seen.insert(sector).second) {
        sectors_[sector].observe(range);
    } else if (range > sectors_[sector].max_range_nm) {
        sectors_[sector].max_range_nm = range;
    }

    overall_max_range_nm_ = std::max(overall_max_range_nm_, range);
}

std::array<GeoPoint, CoverageTracker::NUM_SECTORS> CoverageTracker::getPolygonPoints() const {
    std::array<GeoPoint, NUM_SECTORS> points;
    double lon_scale = constants::NM_PER_DEGREE * std::cos(geo::toRadians(receiver_.latitude));

    for (std::size_t i = 0; i < NUM_SECTORS; ++i) {
        double range = sectors_[i].max_range_nm;
        if (range <= 0.0) {
            points[i] = receiver_;
            continue;
        }

        double bearing = geo::toRadians(i * DEGREES_PER_SECTOR + DEGREES_PER_SECTOR / 2.0);
        points[i] = GeoPoint{receiver_.latitude + range * std::cos(bearing) / constants::NM_PER_DEGREE,
                             receiver_.longitude + range * std::sin(bearing) / lon_scale};
    }
    return points;
}

CoverageStats CoverageTracker::getStats() const {
    CoverageStats stats;
    stats.max_range_nm = overall_max_range_nm_;
    stats.total_sectors = NUM_SECTORS;
    stats.unique_aircraft = sectors_seen_.size();

    double max_sum = 0.0;
    for (const auto& sector : sectors_) {
        if (sector.max_range_nm > 0.0) {
            stats.active_sectors++;
        }
        max_sum += sector.max_range_nm;
        stats.total_observations += sector.aircraft_count;
    }
    if (stats.active_sectors > 0) {
        stats.avg_max_range_nm = max_sum / static_cast<double>(stats.active_sectors);
    }
    return stats;
}

void CoverageTracker::reset() {
    for (auto& sector : sectors_) {
        sector.reset();
    }
    sectors_seen_.clear();
    overall_max_range_nm_ = 0.0;
}

void CoverageTracker::setReceiver(const GeoPoint& receiver) {
    receiver_ = GeoPoint::clamped(receiver.latitude, receiver.longitude);
    reset();

    std::ostringstream oss;
    oss << "Coverage receiver moved to (" << receiver_.latitude << ", "
        << receiver_.longitude << "), statistics reset";
    Logger::getInstance().log(oss.str());
}

} // namespace skyview
