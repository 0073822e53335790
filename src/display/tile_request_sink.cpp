#include "display/tile_request_sink.h"
#include "common/logger.h"
#include <sstream>
#include <iomanip>

namespace skyview {

void LoggingTileSink::requestTiles(const TileRequest& request) {
    ++request_count_;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4)
        << "Tiles requested at (" << request.center.latitude << ", "
        << request.center.longitude << ") zoom " << request.zoom_level
        << " radius " << request.radius_in_tiles;
    Logger::getInstance().debug(oss.str());
}

} // namespace skyview
