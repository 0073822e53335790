#ifndef SKYVIEW_MOCK_TILE_SINK_H
#define SKYVIEW_MOCK_TILE_SINK_H

#include "display/tile_request_sink.h"
#include <gmock/gmock.h>

namespace skyview {
namespace test {

class MockTileSink : public ITileRequestSink {
public:
    MOCK_METHOD(void, requestTiles, (const TileRequest& request), (override));
};

} // namespace test
} // namespace skyview

#endif // SKYVIEW_MOCK_TILE_SINK_H
