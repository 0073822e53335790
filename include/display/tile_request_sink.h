#ifndef SKYVIEW_TILE_REQUEST_SINK_H
#define SKYVIEW_TILE_REQUEST_SINK_H

#include "common/types.h"
#include <cstddef>

namespace skyview {

struct TileRequest {
    GeoPoint center;
    int zoom_level;
    int radius_in_tiles;
};

// Receives "tiles needed" signals. Implemented by the tile loader.
class ITileRequestSink {
public:
    virtual ~ITileRequestSink() = default;
    virtual void requestTiles(const TileRequest& request) = 0;
};

// Sink that only records requests in the log; used when no loader is attached
class LoggingTileSink : public ITileRequestSink {
public:
    void requestTiles(const TileRequest& request) override;

    std::size_t getRequestCount() const { return request_count_; }

private:
    std::size_t request_count_{0};
};

} // namespace skyview

#endif // SKYVIEW_TILE_REQUEST_SINK_H
