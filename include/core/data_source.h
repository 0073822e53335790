#ifndef SKYVIEW_DATA_SOURCE_H
#define SKYVIEW_DATA_SOURCE_H

#include "common/types.h"
#include "common/constants.h"
#include <cstdint>
#include <optional>
#include <string>

namespace skyview {

struct DataSourceConfig {
    std::string name;
    std::string endpoint;                       // host:port or replay file
    bool enabled{true};
    uint8_t priority{constants::DEFAULT_SOURCE_PRIORITY};   // higher wins
    std::optional<GeoPoint> receiver_location;
};

// Runtime state of one source, as seen by the frame loop
struct DataSourceState {
    ConnectionState connection;
    std::size_t aircraft_count{0};
    uint64_t messages_received{0};
    std::optional<TimePoint> last_message_time;
};

struct DataSourceStats {
    std::size_t total_sources{0};
    std::size_t connected_sources{0};
    std::size_t total_aircraft{0};
    uint64_t total_messages{0};
};

} // namespace skyview

#endif // SKYVIEW_DATA_SOURCE_H
