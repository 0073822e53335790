#include "common/types.h"
#include "common/constants.h"
#include <algorithm>

namespace skyview {

double clampLatitude(double latitude) {
    return std::clamp(latitude, -constants::MERCATOR_LAT_LIMIT, constants::MERCATOR_LAT_LIMIT);
}

double clampLongitude(double longitude) {
    return std::clamp(longitude, -180.0, 180.0);
}

std::string ConnectionState::toString() const {
    switch (status) {
        case ConnectionStatus::DISCONNECTED: return "Disconnected";
        case ConnectionStatus::CONNECTING:   return "Connecting";
        case ConnectionStatus::CONNECTED:    return "Connected";
        case ConnectionStatus::ERROR:        return "Error(" + message + ")";
        default:                             return "Unknown";
    }
}

} // namespace skyview
