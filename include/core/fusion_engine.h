#ifndef SKYVIEW_FUSION_ENGINE_H
#define SKYVIEW_FUSION_ENGINE_H

#include "core/aircraft_report.h"
#include "core/data_source.h"
#include "core/track_store.h"
#include <map>
#include <string>
#include <vector>

namespace skyview {

/**
 * Merges reports from several configured sources into one TrackStore.
 *
 * A source becomes primary for a track when it writes with a priority at
 * least as high as the current primary's (ties go to the newcomer). Lower
 * priority sources are recorded as contributors and keep the track alive,
 * but do not touch its displayed fields.
 *
 * Tracks are never removed here; stale ones are only dimmed.
 */
class FusionEngine {
public:
    explicit FusionEngine(TrackStore& store);

    // Source configuration
    bool addSource(const DataSourceConfig& config);
    bool removeSource(const std::string& name);
    bool setSourcePriority(const std::string& name, uint8_t priority);
    bool hasSource(const std::string& name) const;
    std::vector<DataSourceConfig> getSources() const;

    UpdateOutcome mergeReport(const SourcedReport& sourced, TimePoint now);

    // Explicit report priority, else configured priority, else the lowest
    // configured one
    uint8_t resolvePriority(const SourcedReport& sourced) const;
    uint8_t lowestConfiguredPriority() const;

    // Source runtime state
    void updateSourceState(const std::string& name,
                           const ConnectionState& connection,
                           std::size_t aircraft_count);
    std::optional<DataSourceState> getSourceState(const std::string& name) const;
    DataSourceStats getStats() const;

    std::vector<std::string> contributingSources(const std::string& identifier) const;

private:
    struct SourceEntry {
        DataSourceConfig config;
        DataSourceState state;
    };

    TrackStore& store_;
    std::map<std::string, SourceEntry> sources_;
};

} // namespace skyview

#endif // SKYVIEW_FUSION_ENGINE_H
