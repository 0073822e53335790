#ifndef SKYVIEW_MAIN_SYSTEM_H
#define SKYVIEW_MAIN_SYSTEM_H

#include "core/app_config.h"
#include "core/coverage_tracker.h"
#include "core/fusion_engine.h"
#include "core/track_store.h"
#include "core/traffic_statistics.h"
#include "communication/feed_client.h"
#include "communication/feed_snapshot.h"
#include "communication/feed_worker.h"
#include "display/zoom_controller.h"
#include "display/tile_request_sink.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace skyview {

struct SystemMetrics {
    long uptime{0};                   // System uptime in seconds
    uint64_t frames{0};               // Frame ticks executed
    uint64_t reports_processed{0};    // Reports applied to the track store
    uint64_t reports_dropped{0};      // Malformed or positionless-new reports
    uint64_t tracks_created{0};
    uint64_t tracks_removed{0};
    uint64_t skipped_reads{0};        // Snapshot reads skipped due to contention
    std::size_t active_tracks{0};
};

// Worker loop timing for one feed
struct FeedWorkerStats {
    std::string name;
    std::chrono::milliseconds period{0};
    uint64_t executions{0};
    int64_t best_execution_us{0};
    int64_t worst_execution_us{0};
    uint64_t connects{0};
};

// One track as the renderer needs it this frame
struct TrackDisplay {
    std::string identifier;
    std::string label;
    std::string altitude_text;
    PixelPoint screen;
    float opacity;
    bool emergency;
    std::vector<PredictedPoint> predicted_path;   // empty when prediction is off or unknown
};

class MainSystem {
public:
    explicit MainSystem(const AppConfig& config = AppConfig(),
                        std::shared_ptr<ITileRequestSink> tile_sink = nullptr);
    ~MainSystem();

    // System control
    bool initialize();
    void run();
    void shutdown();

    // Feed management
    bool loadFeedSources(const std::string& filename);
    bool addFeed(const DataSourceConfig& config, std::shared_ptr<comm::IFeedClient> client);
    bool attachSnapshot(const DataSourceConfig& config, std::shared_ptr<comm::FeedSnapshot> snapshot);

    // One frame: ingest snapshots, then trails, then coverage
    void tick(TimePoint now);

    std::vector<TrackDisplay> buildDisplayList(TimePoint now) const;

    // Tracks removed by the latest tick (single-source mode only)
    std::vector<std::string> takeRemovedTracks();

    // Components
    const TrackStore& getTrackStore() const { return store_; }
    FusionEngine& getFusionEngine() { return fusion_; }
    const FusionEngine& getFusionEngine() const { return fusion_; }
    CoverageTracker& getCoverage() { return coverage_; }
    ZoomController* getZoomController() { return zoom_.get(); }
    const AppConfig& getConfig() const { return config_; }

    // Applies to every feed worker, running or not. Same range as the config.
    bool setRefreshInterval(std::chrono::milliseconds interval);

    // Status and metrics
    bool isRunning() const { return running_; }
    SystemMetrics getMetrics() const;
    std::vector<FeedWorkerStats> getFeedWorkerStats() const;

private:
    struct Feed {
        DataSourceConfig config;
        std::shared_ptr<comm::FeedSnapshot> snapshot;
        std::unique_ptr<comm::FeedWorker> worker;    // null when fed externally
        uint64_t last_sequence{0};
    };

    bool registerFeed(const DataSourceConfig& config, std::shared_ptr<comm::FeedSnapshot> snapshot,
                      std::unique_ptr<comm::FeedWorker> worker);
    bool initializeFeeds();
    void ingestSingleSource(const std::vector<AircraftReport>& aircraft, TimePoint now);
    void ingestMultiSource(const Feed& feed, const std::vector<AircraftReport>& aircraft, TimePoint now);
    void countOutcome(UpdateOutcome outcome);
    void checkEmergencies();

    // Event handling
    void handleSystemEvents();

    // Performance monitoring
    void updateSystemMetrics();
    void logSystemStatus() const;

    AppConfig config_;
    std::shared_ptr<ITileRequestSink> tile_sink_;

    TrackStore store_;
    FusionEngine fusion_;
    CoverageTracker coverage_;
    std::unique_ptr<ZoomController> zoom_;
    std::vector<Feed> feeds_;

    std::vector<std::string> removed_tracks_;
    std::set<std::string> active_emergencies_;

    // System state
    std::atomic<bool> running_;
    SystemMetrics metrics_;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace skyview

#endif // SKYVIEW_MAIN_SYSTEM_H
