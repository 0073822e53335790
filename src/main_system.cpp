#include "core/main_system.h"
#include "core/traffic_statistics.h"
#include "communication/csv_feed_client.h"
#include "common/logger.h"
#include "common/constants.h"
#include <fstream>
#include <sstream>
#include <csignal>
#include <thread>

namespace {
    std::atomic<bool> g_shutdown_requested(false);

    void signal_handler(int) {
        g_shutdown_requested = true;
    }
}

namespace skyview {

MainSystem::MainSystem(const AppConfig& config, std::shared_ptr<ITileRequestSink> tile_sink)
    : config_(config)
    , tile_sink_(std::move(tile_sink))
    , store_(config.trails, config.staleness)
    , fusion_(store_)
    , coverage_(config.coverageReceiver(), config.coverage_enabled)
    , running_(false)
    , start_time_(std::chrono::steady_clock::now()) {

    if (!tile_sink_) {
        tile_sink_ = std::make_shared<LoggingTileSink>();
    }

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

MainSystem::~MainSystem() {
    shutdown();
}

bool MainSystem::initialize() {
    Logger::getInstance().log("Initializing SkyView " + constants::SYSTEM_VERSION + "...");

    try {
        if (auto error = config_.validate()) {
            Logger::getInstance().error("Invalid configuration: " + *error);
            return false;
        }

        ViewState view = ViewState::defaults();
        view.center = GeoPoint::clamped(config_.map.default_latitude, config_.map.default_longitude);
        view.reference_point = view.center;
        view.zoom_level = config_.map.default_zoom;
        zoom_.reset(new ZoomController(view, config_.viewport, tile_sink_, config_.zoom));

        coverage_.setEnabled(config_.coverage_enabled);
        GeoPoint receiver = config_.coverageReceiver();
        if (receiver.latitude != coverage_.getReceiver().latitude ||
            receiver.longitude != coverage_.getReceiver().longitude) {
            coverage_.setReceiver(receiver);
        }

        if (!initializeFeeds()) {
            Logger::getInstance().error("Failed to initialize feeds");
            return false;
        }

        // Initial tiles around the start position
        zoom_->recenter(view.center);

        running_ = true;
        Logger::getInstance().log("System initialization complete");
        return true;

    } catch (const std::exception& e) {
        Logger::getInstance().error("Initialization error: " + std::string(e.what()));
        return false;
    }
}

bool MainSystem::initializeFeeds() {
    for (const auto& source : config_.sources) {
        if (!source.enabled) {
            Logger::getInstance().log("Source " + source.name + " disabled");
            continue;
        }
        if (fusion_.hasSource(source.name)) {
            continue;
        }

        if (AppConfig::isReplayEndpoint(source.endpoint)) {
            auto client = std::make_shared<comm::CsvFeedClient>(AppConfig::replayPath(source.endpoint));
            if (!addFeed(source, client)) {
                return false;
            }
        } else {
            // Live network clients are plugged in through addFeed()
            Logger::getInstance().warning("No client for endpoint " + source.endpoint +
                                          "; source " + source.name + " registered without a feed");
            fusion_.addSource(source);
        }
    }
    return true;
}

bool MainSystem::addFeed(const DataSourceConfig& config, std::shared_ptr<comm::IFeedClient> client) {
    if (!client) {
        Logger::getInstance().error("Feed " + config.name + " has no client");
        return false;
    }

    auto snapshot = std::make_shared<comm::FeedSnapshot>();
    std::unique_ptr<comm::FeedWorker> worker(new comm::FeedWorker(
        config, std::move(client), snapshot, config_.refresh_interval, config_.retry_backoff));

    return registerFeed(config, snapshot, std::move(worker));
}

bool MainSystem::attachSnapshot(const DataSourceConfig& config,
                                std::shared_ptr<comm::FeedSnapshot> snapshot) {
    if (!snapshot) {
        return false;
    }
    return registerFeed(config, std::move(snapshot), nullptr);
}

bool MainSystem::registerFeed(const DataSourceConfig& config,
                              std::shared_ptr<comm::FeedSnapshot> snapshot,
                              std::unique_ptr<comm::FeedWorker> worker) {
    if (config_.fusion_mode == FusionMode::SINGLE_SOURCE && !feeds_.empty()) {
        Logger::getInstance().error("Single-source mode already has a feed; rejected " + config.name);
        return false;
    }
    if (!fusion_.addSource(config)) {
        return false;
    }

    Feed feed;
    feed.config = config;
    feed.snapshot = std::move(snapshot);
    feed.worker = std::move(worker);

    // Feeds added while running start immediately
    if (running_ && feed.worker) {
        feed.worker->start();
    }
    feeds_.push_back(std::move(feed));
    return true;
}

void MainSystem::run() {
    if (!running_) {
        Logger::getInstance().error("System not properly initialized");
        return;
    }

    Logger::getInstance().log("Starting SkyView with " + std::to_string(feeds_.size()) + " feeds...");

    for (auto& feed : feeds_) {
        if (feed.worker) {
            feed.worker->start();
        }
    }

    auto last_metrics_update = std::chrono::steady_clock::now();

    // Frame loop
    while (running_ && !g_shutdown_requested) {
        try {
            handleSystemEvents();

            auto now = Clock::now();
            tick(now);

            // Update metrics periodically
            if (std::chrono::duration_cast<std::chrono::milliseconds>(
                now - last_metrics_update).count() >= constants::METRICS_LOG_INTERVAL) {
                updateSystemMetrics();
                logSystemStatus();
                last_metrics_update = now;
            }

            std::this_thread::sleep_for(config_.frame_interval);

        } catch (const std::exception& e) {
            Logger::getInstance().error("Error in main loop: " + std::string(e.what()));
        }
    }

    shutdown();
}

void MainSystem::tick(TimePoint now) {
    metrics_.frames++;
    removed_tracks_.clear();

    for (auto& feed : feeds_) {
        // Never wait on a worker; a contended snapshot is picked up next frame
        auto data = feed.snapshot->tryRead();
        if (!data) {
            metrics_.skipped_reads++;
            continue;
        }

        fusion_.updateSourceState(feed.config.name, data->state, data->aircraft.size());

        if (data->sequence == feed.last_sequence) {
            continue;
        }
        feed.last_sequence = data->sequence;

        if (config_.fusion_mode == FusionMode::SINGLE_SOURCE) {
            ingestSingleSource(data->aircraft, now);
        } else {
            ingestMultiSource(feed, data->aircraft, now);
        }
    }

    store_.recordTrailSamples(now);
    store_.pruneTrails(now);

    if (coverage_.isEnabled()) {
        for (const auto& entry : store_.tracks()) {
            coverage_.observe(entry.first, entry.second.position);
        }
    }

    checkEmergencies();
    metrics_.active_tracks = store_.size();
}

void MainSystem::ingestSingleSource(const std::vector<AircraftReport>& aircraft, TimePoint now) {
    std::set<std::string> present;

    for (const auto& report : aircraft) {
        countOutcome(store_.upsert(report, now));
        if (report.isValid()) {
            present.insert(AircraftReport::normalizeIdentifier(report.identifier));
        }
    }

    auto removed = store_.removeAbsent(present);
    for (const auto& identifier : removed) {
        active_emergencies_.erase(identifier);
        removed_tracks_.push_back(identifier);
        Logger::getInstance().debug("Track removed: " + identifier);
    }
    metrics_.tracks_removed += removed.size();
}

void MainSystem::ingestMultiSource(const Feed& feed, const std::vector<AircraftReport>& aircraft,
                                   TimePoint now) {
    for (const auto& report : aircraft) {
        countOutcome(fusion_.mergeReport(SourcedReport{report, feed.config.name, std::nullopt}, now));
    }
}

void MainSystem::countOutcome(UpdateOutcome outcome) {
    switch (outcome) {
        case UpdateOutcome::CREATED:
            metrics_.tracks_created++;
            metrics_.reports_processed++;
            break;
        case UpdateOutcome::UPDATED:
        case UpdateOutcome::LIVENESS_ONLY:
            metrics_.reports_processed++;
            break;
        case UpdateOutcome::DROPPED:
            metrics_.reports_dropped++;
            break;
    }
}

void MainSystem::checkEmergencies() {
    std::set<std::string> current;
    for (const auto& alert : detectEmergencies(store_)) {
        current.insert(alert.identifier);
        if (active_emergencies_.count(alert.identifier) == 0) {
            Logger::getInstance().warning(std::string(emergencyLabel(alert.type)) + ": " + alert.label);
        }
    }
    active_emergencies_.swap(current);
}

std::vector<TrackDisplay> MainSystem::buildDisplayList(TimePoint now) const {
    std::vector<TrackDisplay> display;
    if (!zoom_) {
        return display;
    }

    const Viewport& viewport = zoom_->getViewport();
    for (const auto& entry : store_.tracks()) {
        const Track& track = entry.second;
        PixelPoint screen = zoom_->geoToScreen(track.position);
        if (screen.x < 0.0 || screen.y < 0.0 || screen.x > viewport.width || screen.y > viewport.height) {
            continue;
        }

        bool emergency = track.squawk && classifySquawk(*track.squawk) != EmergencyType::NONE;
        display.push_back(TrackDisplay{
            track.identifier,
            track.displayLabel(),
            formatAltitude(track.altitude),
            screen,
            store_.stalenessOpacity(track, now),
            emergency,
            predictFlightPath(track, config_.prediction)
        });
    }
    return display;
}

std::vector<std::string> MainSystem::takeRemovedTracks() {
    std::vector<std::string> removed;
    removed.swap(removed_tracks_);
    return removed;
}

bool MainSystem::loadFeedSources(const std::string& filename) {
    Logger::getInstance().log("Loading feed sources from: " + filename);

    try {
        std::ifstream file(filename);
        if (!file) {
            Logger::getInstance().error("Failed to open feed source file");
            return false;
        }

        std::string line;
        std::getline(file, line);  // Skip header
        std::size_t loaded = 0;

        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                continue;
            }

            std::istringstream iss(line);
            std::string token;
            std::vector<std::string> tokens;

            while (std::getline(iss, token, ',')) {
                tokens.push_back(token);
            }
            if (line.back() == ',') {
                tokens.push_back("");
            }

            // name,endpoint,enabled,priority,receiver_lat,receiver_lon
            if (tokens.size() != 6) {
                Logger::getInstance().warning("Invalid data format in line: " + line);
                continue;
            }

            try {
                DataSourceConfig source;
                source.name = tokens[0];
                source.endpoint = tokens[1];
                source.enabled = tokens[2] != "0" && tokens[2] != "false";

                int priority = std::stoi(tokens[3]);
                if (priority < 0 || priority > 255) {
                    Logger::getInstance().warning("Priority out of range in line: " + line);
                    continue;
                }
                source.priority = static_cast<uint8_t>(priority);

                if (!tokens[4].empty() && !tokens[5].empty()) {
                    source.receiver_location = GeoPoint{std::stod(tokens[4]), std::stod(tokens[5])};
                }

                config_.sources.push_back(source);
                loaded++;
                Logger::getInstance().log("Added source: " + source.name);

            } catch (const std::exception& e) {
                Logger::getInstance().warning("Error parsing feed source: " + std::string(e.what()));
            }
        }

        Logger::getInstance().log("Successfully loaded " + std::to_string(loaded) + " feed sources");
        return loaded > 0;

    } catch (const std::exception& e) {
        Logger::getInstance().error("Error loading feed sources: " + std::string(e.what()));
        return false;
    }
}

void MainSystem::updateSystemMetrics() {
    auto now = std::chrono::steady_clock::now();
    metrics_.uptime = std::chrono::duration_cast<std::chrono::seconds>(
        now - start_time_).count();
    metrics_.active_tracks = store_.size();
}

void MainSystem::handleSystemEvents() {
    if (g_shutdown_requested) {
        Logger::getInstance().log("Shutdown signal received");
        running_ = false;
    }
}

void MainSystem::shutdown() {
    if (!running_) return;

    Logger::getInstance().log("Initiating system shutdown...");

    for (auto it = feeds_.rbegin(); it != feeds_.rend(); ++it) {
        if (it->worker) {
            it->worker->stop();
        }
    }

    running_ = false;
    Logger::getInstance().log("System shutdown complete");
}

bool MainSystem::setRefreshInterval(std::chrono::milliseconds interval) {
    AppConfig candidate = config_;
    candidate.refresh_interval = interval;
    if (auto error = candidate.validate()) {
        Logger::getInstance().warning("Refresh interval rejected: " + *error);
        return false;
    }

    config_.refresh_interval = interval;
    for (auto& feed : feeds_) {
        if (feed.worker) {
            feed.worker->setPeriod(interval);
        }
    }
    Logger::getInstance().log("Feed refresh interval set to " + std::to_string(interval.count()) + " ms");
    return true;
}

std::vector<FeedWorkerStats> MainSystem::getFeedWorkerStats() const {
    std::vector<FeedWorkerStats> stats;
    for (const auto& feed : feeds_) {
        if (!feed.worker) {
            continue;
        }
        FeedWorkerStats entry;
        entry.name = feed.config.name;
        entry.period = feed.worker->getPeriod();
        entry.executions = feed.worker->getExecutionCount();
        entry.best_execution_us = feed.worker->getBestExecutionTime();
        entry.worst_execution_us = feed.worker->getWorstExecutionTime();
        entry.connects = feed.worker->getConnectCount();
        stats.push_back(entry);
    }
    return stats;
}

void MainSystem::logSystemStatus() const {
    AltitudeBandStats bands = AltitudeBandStats::fromTracks(store_);
    DataSourceStats sources = fusion_.getStats();
    CoverageStats coverage = coverage_.getStats();

    std::ostringstream oss;
    oss << "\n=== System Status Report ===\n"
        << "Uptime: " << metrics_.uptime << " seconds\n"
        << "Frames: " << metrics_.frames << "\n"
        << "Active Tracks: " << metrics_.active_tracks << "\n"
        << "Reports Processed: " << metrics_.reports_processed
        << " (dropped " << metrics_.reports_dropped << ")\n"
        << "Tracks Created/Removed: " << metrics_.tracks_created
        << "/" << metrics_.tracks_removed << "\n"
        << "Altitude Bands: <10k " << bands.below_10k
        << ", 10-25k " << bands.from_10k_to_25k
        << ", 25-40k " << bands.from_25k_to_40k
        << ", 40k+ " << bands.above_40k
        << ", unknown " << bands.unknown << "\n"
        << "Sources: " << sources.connected_sources << "/" << sources.total_sources
        << " connected, " << sources.total_messages << " messages\n"
        << "Coverage: max " << coverage.max_range_nm << " nm, "
        << coverage.active_sectors << "/" << coverage.total_sectors << " sectors\n"
        << "Emergencies: " << active_emergencies_.size() << "\n";

    for (const auto& worker : getFeedWorkerStats()) {
        oss << "Feed " << worker.name << ": " << worker.executions << " polls every "
            << worker.period.count() << " ms, best " << worker.best_execution_us
            << " us, worst " << worker.worst_execution_us << " us, "
            << worker.connects << " connects\n";
    }

    Logger::getInstance().log(oss.str());
}

SystemMetrics MainSystem::getMetrics() const {
    SystemMetrics metrics = metrics_;
    metrics.uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_).count();
    return metrics;
}

} // namespace skyview
