#ifndef SKYVIEW_COVERAGE_TRACKER_H
#define SKYVIEW_COVERAGE_TRACKER_H

#include "common/types.h"
#include <array>
#include <cstddef>
#include <map>
#include <set>
#include <string>

namespace skyview {

struct CoverageSector {
    double max_range_nm{0.0};
    double avg_range_nm{0.0};
    std::size_t aircraft_count{0};   // distinct aircraft seen in this sector

    void observe(double range_nm);
    void reset();
};

struct CoverageStats {
    double max_range_nm{0.0};
    double avg_max_range_nm{0.0};
    std::size_t active_sectors{0};
    std::size_t total_sectors{0};
    std::size_t unique_aircraft{0};
    std::size_t total_observations{0};
};

/**
 * Receiver coverage by bearing sector: maximum and mean detection range in
 * 36 ten-degree sectors around the receiver. Each aircraft contributes to a
 * sector's count and mean once; later sightings in the same sector can only
 * extend the maximum.
 */
class CoverageTracker {
public:
    static constexpr std::size_t NUM_SECTORS = 36;
    static constexpr double DEGREES_PER_SECTOR = 360.0 / NUM_SECTORS;

    explicit CoverageTracker(const GeoPoint& receiver, bool enabled = true);

    void observe(const std::string& identifier, const GeoPoint& position);
    void observe(const std::string& identifier, const GeoPoint& position, const GeoPoint& receiver);

    // Vertex per sector at the sector's centre bearing. Sectors without data
    // collapse onto the receiver. Coarse (60 nm per degree), display only.
    std::array<GeoPoint, NUM_SECTORS> getPolygonPoints() const;

    CoverageStats getStats() const;
    void reset();

    void setReceiver(const GeoPoint& receiver);
    const GeoPoint& getReceiver() const { return receiver_; }

    void setEnabled(bool enabled) { enabled_ = enabled; }
    bool isEnabled() const { return enabled_; }

    const CoverageSector& getSector(std::size_t index) const { return sectors_.at(index); }

    static std::size_t bearingToSector(double bearing_deg);

private:
    GeoPoint receiver_;
    bool enabled_;
    std::array<CoverageSector, NUM_SECTORS> sectors_;
    std::map<std::string, std::set<std::size_t>> sectors_seen_;
    double overall_max_range_nm_{0.0};
};

} // namespace skyview

#endif // SKYVIEW_COVERAGE_TRACKER_H
