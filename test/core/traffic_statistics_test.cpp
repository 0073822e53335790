#include <gtest/gtest.h>
#include "core/traffic_statistics.h"
#include "geo/geo_math.h"

namespace skyview {
namespace test {

class TrafficStatisticsTest : public testing::Test {
protected:
    void SetUp() override {
        now_ = Clock::now();
    }

    void addTrack(const std::string& id, std::optional<int> altitude,
                  std::optional<std::string> squawk = std::nullopt) {
        AircraftReport report;
        report.identifier = id;
        report.position = GeoPoint{40.0, -100.0};
        report.altitude = altitude;
        report.squawk = squawk;
        store_.upsert(report, now_);
    }

    TrackStore store_;
    TimePoint now_;
};

TEST_F(TrafficStatisticsTest, AltitudeBands) {
    addTrack("AAA001", 500);
    addTrack("AAA002", 9999);
    addTrack("AAA003", 10000);
    addTrack("AAA004", 24999);
    addTrack("AAA005", 25000);
    addTrack("AAA006", 39999);
    addTrack("AAA007", 40000);
    addTrack("AAA008", std::nullopt);

    AltitudeBandStats stats = AltitudeBandStats::fromTracks(store_);
    EXPECT_EQ(stats.below_10k, 2u);
    EXPECT_EQ(stats.from_10k_to_25k, 2u);
    EXPECT_EQ(stats.from_25k_to_40k, 2u);
    EXPECT_EQ(stats.above_40k, 1u);
    EXPECT_EQ(stats.unknown, 1u);
    EXPECT_EQ(stats.total(), store_.size());
}

TEST_F(TrafficStatisticsTest, FormatAltitude) {
    EXPECT_EQ(formatAltitude(35000), "FL350");
    EXPECT_EQ(formatAltitude(18000), "FL180");
    EXPECT_EQ(formatAltitude(17999), "17999 ft");
    EXPECT_EQ(formatAltitude(2500), "2500 ft");
    EXPECT_EQ(formatAltitude(std::nullopt), "---");
}

TEST_F(TrafficStatisticsTest, ClassifySquawk) {
    EXPECT_EQ(classifySquawk("7500"), EmergencyType::HIJACK);
    EXPECT_EQ(classifySquawk("7600"), EmergencyType::RADIO_FAILURE);
    EXPECT_EQ(classifySquawk("7700"), EmergencyType::GENERAL);
    EXPECT_EQ(classifySquawk("1200"), EmergencyType::NONE);
    EXPECT_STREQ(emergencyLabel(EmergencyType::RADIO_FAILURE), "RADIO FAILURE");
}

TEST_F(TrafficStatisticsTest, DetectEmergencies) {
    addTrack("AAA001", 30000, std::string("7700"));
    addTrack("AAA002", 30000, std::string("1200"));
    addTrack("AAA003", 30000);

    auto alerts = detectEmergencies(store_);
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].identifier, "AAA001");
    EXPECT_EQ(alerts[0].type, EmergencyType::GENERAL);
}

TEST_F(TrafficStatisticsTest, PredictionAtConfiguredHorizons) {
    Track track;
    track.identifier = "AAA001";
    track.position = GeoPoint{40.0, -100.0};
    track.heading = 90.0;
    track.ground_speed = 480.0;

    auto points = predictFlightPath(track);
    ASSERT_EQ(points.size(), 3u);
    EXPECT_DOUBLE_EQ(points[0].minutes_ahead, 1.0);
    EXPECT_DOUBLE_EQ(points[2].minutes_ahead, 15.0);
    EXPECT_NEAR(geo::haversineDistanceNm(track.position, points[1].position), 40.0, 1e-6);
    EXPECT_GT(points[2].position.longitude, points[1].position.longitude);
}

TEST_F(TrafficStatisticsTest, NoPredictionWhenSlowOrUnknown) {
    Track track;
    track.position = GeoPoint{40.0, -100.0};
    track.heading = 90.0;
    EXPECT_TRUE(predictFlightPath(track).empty());

    track.ground_speed = 5.0;
    EXPECT_TRUE(predictFlightPath(track).empty());

    track.ground_speed = 300.0;
    PredictionConfig disabled;
    disabled.enabled = false;
    EXPECT_TRUE(predictFlightPath(track, disabled).empty());
    EXPECT_EQ(predictFlightPath(track).size(), 3u);
}

} // namespace test
} // namespace skyview
