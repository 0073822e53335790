#ifndef SKYVIEW_FEED_WORKER_H
#define SKYVIEW_FEED_WORKER_H

#include "common/periodic_task.h"
#include "communication/feed_client.h"
#include "communication/feed_snapshot.h"
#include "core/data_source.h"
#include <atomic>
#include <memory>
#include <string>

namespace skyview {
namespace comm {

// Background loop for one feed: connect, consume, publish to the snapshot.
// A dropped or failed connection is logged and retried after a fixed backoff.
class FeedWorker : public PeriodicTask {
public:
    FeedWorker(const DataSourceConfig& config,
               std::shared_ptr<IFeedClient> client,
               std::shared_ptr<FeedSnapshot> snapshot,
               std::chrono::milliseconds period,
               std::chrono::milliseconds retry_backoff);
    ~FeedWorker() override;

    const DataSourceConfig& getConfig() const { return config_; }
    std::shared_ptr<FeedSnapshot> getSnapshot() const { return snapshot_; }
    uint64_t getConnectCount() const { return connect_count_; }

protected:
    void execute() override;

private:
    bool ensureConnected();
    void backOff(const ConnectionState& state);

    DataSourceConfig config_;
    std::shared_ptr<IFeedClient> client_;
    std::shared_ptr<FeedSnapshot> snapshot_;
    std::chrono::milliseconds retry_backoff_;
    bool connected_{false};
    std::atomic<uint64_t> connect_count_{0};
};

} // namespace comm
} // namespace skyview

#endif // SKYVIEW_FEED_WORKER_H
