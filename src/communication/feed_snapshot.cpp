#include "communication/feed_snapshot.h"

namespace skyview {
namespace comm {

void FeedSnapshot::publish(std::vector<AircraftReport> aircraft, const ConnectionState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.aircraft = std::move(aircraft);
    data_.state = state;
    data_.sequence++;
}

void FeedSnapshot::publishState(const ConnectionState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.state = state;
}

std::optional<FeedData> FeedSnapshot::tryRead() const {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return std::nullopt;
    }
    return data_;
}

FeedData FeedSnapshot::read() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

ConnectionState FeedSnapshot::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.state;
}

uint64_t FeedSnapshot::sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.sequence;
}

} // namespace comm
} // namespace skyview
