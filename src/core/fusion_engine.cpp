#include "core/fusion_engine.h"
#include "common/logger.h"
#include <algorithm>

namespace skyview {

FusionEngine::FusionEngine(TrackStore& store)
    : store_(store) {}

bool FusionEngine::addSource(const DataSourceConfig& config) {
    if (config.name.empty()) {
        Logger::getInstance().warning("Rejected data source without a name");
        return false;
    }
    if (sources_.count(config.name) > 0) {
        Logger::getInstance().warning("Data source already registered: " + config.name);
        return false;
    }

    sources_.emplace(config.name, SourceEntry{config, DataSourceState()});
    Logger::getInstance().log("Data source added: " + config.name +
                              " (priority " + std::to_string(config.priority) + ")");
    return true;
}

bool FusionEngine::removeSource(const std::string& name) {
    if (sources_.erase(name) == 0) {
        return false;
    }
    Logger::getInstance().log("Data source removed: " + name);
    return true;
}

bool FusionEngine::setSourcePriority(const std::string& name, uint8_t priority) {
    auto it = sources_.find(name);
    if (it == sources_.end()) {
        Logger::getInstance().warning("Cannot set priority of unknown source: " + name);
        return false;
    }
    it->second.config.priority = priority;
    return true;
}

bool FusionEngine::hasSource(const std::string& name) const {
    return sources_.count(name) > 0;
}

std::vector<DataSourceConfig> FusionEngine::getSources() const {
    std::vector<DataSourceConfig> configs;
    configs.reserve(sources_.size());
    for (const auto& entry : sources_) {
        configs.push_back(entry.second.config);
    }
    return configs;
}

uint8_t FusionEngine::resolvePriority(const SourcedReport& sourced) const {
    if (sourced.source_priority) {
        return *sourced.source_priority;
    }
    auto it = sources_.find(sourced.source_name);
    if (it != sources_.end()) {
        return it->second.config.priority;
    }
    return lowestConfiguredPriority();
}

uint8_t FusionEngine::lowestConfiguredPriority() const {
    if (sources_.empty()) {
        return 0;
    }
    uint8_t lowest = sources_.begin()->second.config.priority;
    for (const auto& entry : sources_) {
        lowest = std::min(lowest, entry.second.config.priority);
    }
    return lowest;
}

UpdateOutcome FusionEngine::mergeReport(const SourcedReport& sourced, TimePoint now) {
    uint8_t priority = resolvePriority(sourced);
    const std::string& source = sourced.source_name;

    auto it = sources_.find(source);
    if (it != sources_.end()) {
        it->second.state.messages_received++;
        it->second.state.last_message_time = now;
    }

    // The same source may lower its own priority without losing ownership
    auto may_write = [&](const Track& track) {
        return priority >= track.primary_priority || track.primary_source == source;
    };

    UpdateOutcome outcome = store_.applyUpdate(sourced.report, now, may_write);
    if (outcome == UpdateOutcome::DROPPED) {
        return outcome;
    }

    Track* track = store_.find(sourced.report.identifier);
    if (!track) {
        return outcome;
    }

    TimePoint seen = sourced.report.last_seen ? *sourced.report.last_seen : now;
    track->sources[source] = SourceRecord{priority, seen};

    if (outcome == UpdateOutcome::CREATED || outcome == UpdateOutcome::UPDATED) {
        if (track->primary_source != source && !track->primary_source.empty()) {
            Logger::getInstance().debug("Track " + track->identifier + " primary source " +
                                        track->primary_source + " -> " + source);
        }
        track->primary_source = source;
        track->primary_priority = priority;
    }
    return outcome;
}

void FusionEngine::updateSourceState(const std::string& name,
                                     const ConnectionState& connection,
                                     std::size_t aircraft_count) {
    auto it = sources_.find(name);
    if (it == sources_.end()) {
        return;
    }

    DataSourceState& state = it->second.state;
    if (state.connection != connection) {
        Logger::getInstance().log("Source " + name + ": " + state.connection.toString() +
                                  " -> " + connection.toString());
    }
    state.connection = connection;
    state.aircraft_count = aircraft_count;
}

std::optional<DataSourceState> FusionEngine::getSourceState(const std::string& name) const {
    auto it = sources_.find(name);
    if (it == sources_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

DataSourceStats FusionEngine::getStats() const {
    DataSourceStats stats;
    stats.total_sources = sources_.size();
    // Merged tracks, so an aircraft seen by several feeds counts once
    stats.total_aircraft = store_.size();
    for (const auto& entry : sources_) {
        const DataSourceState& state = entry.second.state;
        if (state.connection.isConnected()) {
            stats.connected_sources++;
        }
        stats.total_messages += state.messages_received;
    }
    return stats;
}

std::vector<std::string> FusionEngine::contributingSources(const std::string& identifier) const {
    std::vector<std::string> names;
    const Track* track = store_.find(identifier);
    if (!track) {
        return names;
    }
    for (const auto& entry : track->sources) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace skyview
