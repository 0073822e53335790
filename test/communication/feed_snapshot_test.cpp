#include <gtest/gtest.h>
#include "communication/feed_snapshot.h"
#include <thread>

namespace skyview {
namespace test {

class FeedSnapshotTest : public testing::Test {
protected:
    static AircraftReport aircraft(const std::string& id) {
        AircraftReport report;
        report.identifier = id;
        report.position = GeoPoint{45.0, 7.0};
        return report;
    }

    comm::FeedSnapshot snapshot_;
};

TEST_F(FeedSnapshotTest, StartsEmptyAndDisconnected) {
    comm::FeedData data = snapshot_.read();
    EXPECT_TRUE(data.aircraft.empty());
    EXPECT_EQ(data.state.status, ConnectionStatus::DISCONNECTED);
    EXPECT_EQ(data.sequence, 0u);
}

TEST_F(FeedSnapshotTest, PublishReplacesPreviousValue) {
    snapshot_.publish({aircraft("AAA001"), aircraft("AAA002")}, ConnectionState::connected());
    snapshot_.publish({aircraft("AAA003")}, ConnectionState::connected());

    auto data = snapshot_.tryRead();
    ASSERT_TRUE(data.has_value());
    ASSERT_EQ(data->aircraft.size(), 1u);
    EXPECT_EQ(data->aircraft[0].identifier, "AAA003");
    EXPECT_EQ(data->sequence, 2u);
}

TEST_F(FeedSnapshotTest, StateChangeKeepsAircraftAndSequence) {
    snapshot_.publish({aircraft("AAA001")}, ConnectionState::connected());
    snapshot_.publishState(ConnectionState::error("connection reset"));

    comm::FeedData data = snapshot_.read();
    EXPECT_EQ(data.aircraft.size(), 1u);
    EXPECT_EQ(data.sequence, 1u);
    EXPECT_EQ(data.state, ConnectionState::error("connection reset"));
}

TEST_F(FeedSnapshotTest, ConcurrentWriterAndReader) {
    const int publishes = 2000;
    std::thread writer([this, publishes]() {
        for (int i = 0; i < publishes; ++i) {
            snapshot_.publish({aircraft("AAA" + std::to_string(i))}, ConnectionState::connected());
        }
    });

    uint64_t last_sequence = 0;
    for (int i = 0; i < publishes; ++i) {
        auto data = snapshot_.tryRead();
        if (!data) {
            continue;
        }
        // A single writer never moves the sequence backwards
        EXPECT_GE(data->sequence, last_sequence);
        last_sequence = data->sequence;
    }
    writer.join();

    EXPECT_EQ(snapshot_.sequence(), static_cast<uint64_t>(publishes));
}

} // namespace test
} // namespace skyview
