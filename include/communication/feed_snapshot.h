#ifndef SKYVIEW_FEED_SNAPSHOT_H
#define SKYVIEW_FEED_SNAPSHOT_H

#include "core/aircraft_report.h"
#include "common/types.h"
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace skyview {
namespace comm {

struct FeedData {
    std::vector<AircraftReport> aircraft;
    ConnectionState state;
    uint64_t sequence{0};     // bumped on every aircraft publish
};

// Latest-value cell between one feed worker (writer) and the frame loop
// (reader). Older values are overwritten, never queued.
class FeedSnapshot {
public:
    void publish(std::vector<AircraftReport> aircraft, const ConnectionState& state);
    // Connection state change only; the aircraft list and sequence are kept
    void publishState(const ConnectionState& state);

    // Non-blocking read for the frame loop. nullopt when the writer holds the lock.
    std::optional<FeedData> tryRead() const;
    FeedData read() const;

    ConnectionState state() const;
    uint64_t sequence() const;

private:
    mutable std::mutex mutex_;
    FeedData data_;
};

} // namespace comm
} // namespace skyview

#endif // SKYVIEW_FEED_SNAPSHOT_H
