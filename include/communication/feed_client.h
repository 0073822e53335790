#ifndef SKYVIEW_FEED_CLIENT_H
#define SKYVIEW_FEED_CLIENT_H

#include "core/aircraft_report.h"
#include "common/types.h"
#include <vector>

namespace skyview {
namespace comm {

// Source of aircraft reports. Implementations may block in connect() and
// processNext(); they are only driven from a feed worker thread.
class IFeedClient {
public:
    virtual ~IFeedClient() = default;
    virtual bool connect() = 0;
    // Consume the next batch of input. False when the connection dropped.
    virtual bool processNext() = 0;
    // Full list of aircraft the client currently tracks
    virtual std::vector<AircraftReport> currentAircraft() const = 0;
    virtual ConnectionState connectionState() const = 0;
};

} // namespace comm
} // namespace skyview

#endif // SKYVIEW_FEED_CLIENT_H
