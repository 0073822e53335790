#include <gtest/gtest.h>
#include "core/track_store.h"
#include "common/constants.h"
#include <stdexcept>

namespace skyview {
namespace test {

using std::chrono::milliseconds;
using std::chrono::seconds;

class TrackStoreTest : public testing::Test {
protected:
    void SetUp() override {
        t0_ = Clock::now();
    }

    static AircraftReport positioned(const std::string& id, double lat, double lon) {
        AircraftReport report;
        report.identifier = id;
        report.position = GeoPoint{lat, lon};
        return report;
    }

    TrackStore store_;
    TimePoint t0_;
};

TEST_F(TrackStoreTest, PositionlessReportDoesNotCreateTrack) {
    AircraftReport report;
    report.identifier = "A1B2C3";
    report.altitude = 12000;

    EXPECT_EQ(store_.upsert(report, t0_), UpdateOutcome::DROPPED);
    EXPECT_TRUE(store_.empty());
}

TEST_F(TrackStoreTest, PositionedReportCreatesTrack) {
    AircraftReport report = positioned("a1b2c3", 51.5, -0.12);
    report.callsign = "BAW123";
    report.altitude = 12000;

    EXPECT_EQ(store_.upsert(report, t0_), UpdateOutcome::CREATED);
    ASSERT_EQ(store_.size(), 1u);

    const Track* track = store_.find("A1B2C3");
    ASSERT_NE(track, nullptr);
    EXPECT_EQ(track->identifier, "A1B2C3");
    EXPECT_EQ(track->displayLabel(), "BAW123");
    EXPECT_EQ(track->altitude, 12000);
    EXPECT_FALSE(track->heading.has_value());
}

TEST_F(TrackStoreTest, OneTrackPerIdentifier) {
    store_.upsert(positioned("abc123", 50.0, 0.0), t0_);
    store_.upsert(positioned(" ABC123 ", 50.1, 0.1), t0_ + seconds(1));
    EXPECT_EQ(store_.size(), 1u);
    EXPECT_DOUBLE_EQ(store_.find("ABC123")->position.latitude, 50.1);
}

TEST_F(TrackStoreTest, EmptyIdentifierIsDropped) {
    EXPECT_EQ(store_.upsert(positioned("   ", 50.0, 0.0), t0_), UpdateOutcome::DROPPED);
    EXPECT_TRUE(store_.empty());
}

TEST_F(TrackStoreTest, SquawkOnlyUpdateKeepsOtherFields) {
    AircraftReport initial = positioned("4CA123", 53.35, -6.26);
    initial.altitude = 35000;
    initial.heading = 270.0;
    initial.ground_speed = 450.0;
    store_.upsert(initial, t0_);

    AircraftReport squawk;
    squawk.identifier = "4CA123";
    squawk.squawk = "7700";
    EXPECT_EQ(store_.upsert(squawk, t0_ + seconds(1)), UpdateOutcome::UPDATED);

    const Track* track = store_.find("4CA123");
    ASSERT_NE(track, nullptr);
    EXPECT_EQ(track->squawk, std::string("7700"));
    EXPECT_DOUBLE_EQ(track->position.latitude, 53.35);
    EXPECT_DOUBLE_EQ(track->position.longitude, -6.26);
    EXPECT_EQ(track->altitude, 35000);
    EXPECT_EQ(track->heading, 270.0);
    EXPECT_EQ(track->ground_speed, 450.0);
    EXPECT_EQ(track->last_update, t0_ + seconds(1));
}

TEST_F(TrackStoreTest, ApplyPartialMergesHeldReport) {
    AircraftReport held = positioned("4CA123", 53.35, -6.26);
    held.altitude = 35000;
    held.callsign = "EIN1";

    AircraftReport update;
    update.identifier = "4CA123";
    update.altitude = 34000;
    update.squawk = "7600";
    applyPartial(held, update);

    ASSERT_TRUE(held.position.has_value());
    EXPECT_DOUBLE_EQ(held.position->latitude, 53.35);
    EXPECT_EQ(held.altitude, 34000);
    EXPECT_EQ(held.callsign, std::string("EIN1"));
    EXPECT_EQ(held.squawk, std::string("7600"));
    EXPECT_FALSE(held.heading.has_value());
}

TEST_F(TrackStoreTest, NonFinitePositionTreatedAsAbsent) {
    store_.upsert(positioned("ABC123", 50.0, 1.0), t0_);
    store_.upsert(positioned("ABC123", std::nan(""), 2.0), t0_ + seconds(1));
    EXPECT_DOUBLE_EQ(store_.find("ABC123")->position.longitude, 1.0);
}

TEST_F(TrackStoreTest, PositionIsClamped) {
    store_.upsert(positioned("POLAR1", 89.9, 190.0), t0_);
    const Track* track = store_.find("POLAR1");
    ASSERT_NE(track, nullptr);
    EXPECT_DOUBLE_EQ(track->position.latitude, constants::MERCATOR_LAT_LIMIT);
    EXPECT_DOUBLE_EQ(track->position.longitude, 180.0);
}

TEST_F(TrackStoreTest, LastSeenTakesPrecedenceOverNow) {
    AircraftReport report = positioned("ABC123", 50.0, 0.0);
    report.last_seen = t0_ - seconds(5);
    store_.upsert(report, t0_);
    EXPECT_NEAR(store_.find("ABC123")->ageSeconds(t0_), 5.0, 1e-9);
}

TEST_F(TrackStoreTest, RefusedWriteOnlyRefreshesLiveness) {
    AircraftReport initial = positioned("ABC123", 50.0, 0.0);
    initial.altitude = 10000;
    store_.upsert(initial, t0_);

    AircraftReport later = positioned("ABC123", 51.0, 1.0);
    later.altitude = 20000;
    auto refuse = [](const Track&) { return false; };
    EXPECT_EQ(store_.applyUpdate(later, t0_ + seconds(20), refuse), UpdateOutcome::LIVENESS_ONLY);

    const Track* track = store_.find("ABC123");
    EXPECT_EQ(track->altitude, 10000);
    EXPECT_DOUBLE_EQ(track->position.latitude, 50.0);
    EXPECT_EQ(track->last_update, t0_ + seconds(20));
}

TEST_F(TrackStoreTest, TrailSamplesAtFixedInterval) {
    store_.upsert(positioned("ABC123", 50.0, 0.0), t0_);

    EXPECT_TRUE(store_.recordTrailSample("ABC123", t0_));
    EXPECT_FALSE(store_.recordTrailSample("ABC123", t0_ + seconds(1)));
    EXPECT_TRUE(store_.recordTrailSample("ABC123", t0_ + seconds(2)));
    EXPECT_EQ(store_.find("ABC123")->trail.size(), 2u);

    EXPECT_FALSE(store_.recordTrailSample("UNKNOWN", t0_));
}

TEST_F(TrackStoreTest, FastSamplingDoesNotGrowTrail) {
    store_.upsert(positioned("ABC123", 50.0, 0.0), t0_);

    for (int i = 0; i < 150; ++i) {
        store_.recordTrailSample("ABC123", t0_ + milliseconds(10 * i));
    }
    EXPECT_EQ(store_.find("ABC123")->trail.size(), 1u);
}

TEST_F(TrackStoreTest, PruneKeepsOnlyRecentPoints) {
    store_.upsert(positioned("ABC123", 50.0, 0.0), t0_);

    for (int s = 0; s <= 400; s += 2) {
        AircraftReport move = positioned("ABC123", 50.0 + s * 0.001, 0.0);
        store_.upsert(move, t0_ + seconds(s));
        store_.recordTrailSamples(t0_ + seconds(s));
    }
    EXPECT_EQ(store_.find("ABC123")->trail.size(), 201u);

    TimePoint now = t0_ + seconds(400);
    store_.pruneTrails(300.0, now);

    const auto& trail = store_.find("ABC123")->trail;
    EXPECT_EQ(trail.size(), 151u);
    for (const auto& point : trail) {
        EXPECT_LE(secondsBetween(point.recorded_at, now), 300.0);
    }
    EXPECT_DOUBLE_EQ(trail.back().position.latitude, 50.4);
}

TEST_F(TrackStoreTest, RemoveAbsentReturnsRemovedIdentifiers) {
    store_.upsert(positioned("AAA111", 50.0, 0.0), t0_);
    store_.upsert(positioned("BBB222", 51.0, 0.0), t0_);
    store_.upsert(positioned("CCC333", 52.0, 0.0), t0_);

    auto removed = store_.removeAbsent({"AAA111", "CCC333"});
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], "BBB222");
    EXPECT_EQ(store_.size(), 2u);
    EXPECT_EQ(store_.find("BBB222"), nullptr);
}

TEST_F(TrackStoreTest, StalenessOpacityCurve) {
    StalenessConfig config;
    EXPECT_FLOAT_EQ(stalenessOpacity(0.0, config), 1.0f);
    EXPECT_FLOAT_EQ(stalenessOpacity(9.9, config), 1.0f);
    EXPECT_FLOAT_EQ(stalenessOpacity(10.0, config), 1.0f);
    EXPECT_FLOAT_EQ(stalenessOpacity(20.0, config), 0.55f);
    EXPECT_FLOAT_EQ(stalenessOpacity(30.0, config), 0.1f);
    EXPECT_FLOAT_EQ(stalenessOpacity(600.0, config), 0.1f);
}

TEST_F(TrackStoreTest, StalenessFromTrackAge) {
    store_.upsert(positioned("ABC123", 50.0, 0.0), t0_);
    const Track& track = *store_.find("ABC123");
    EXPECT_FLOAT_EQ(store_.stalenessOpacity(track, t0_ + seconds(5)), 1.0f);
    EXPECT_FLOAT_EQ(store_.stalenessOpacity(track, t0_ + seconds(25)), 0.325f);
    EXPECT_FLOAT_EQ(store_.stalenessOpacity(track, t0_ + seconds(45)), 0.1f);
}

TEST_F(TrackStoreTest, TrailPointFade) {
    TrailConfig config;
    EXPECT_FLOAT_EQ(trailPointOpacity(100.0, config), 1.0f);
    EXPECT_FLOAT_EQ(trailPointOpacity(262.5, config), 0.5f);
    EXPECT_FLOAT_EQ(trailPointOpacity(300.0, config), 0.0f);
}

TEST_F(TrackStoreTest, RejectsInvalidStalenessConfig) {
    StalenessConfig staleness;
    staleness.start_seconds = 30.0;
    staleness.full_seconds = 10.0;
    EXPECT_THROW(TrackStore(TrailConfig(), staleness), std::invalid_argument);
}

} // namespace test
} // namespace skyview
