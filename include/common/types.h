#ifndef SKYVIEW_TYPES_H
#define SKYVIEW_TYPES_H

#include <chrono>
#include <cmath>
#include <string>

namespace skyview {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Seconds elapsed between two time points, never negative
inline double secondsBetween(TimePoint earlier, TimePoint later) {
    if (later <= earlier) {
        return 0.0;
    }
    return std::chrono::duration<double>(later - earlier).count();
}

double clampLatitude(double latitude);
double clampLongitude(double longitude);

struct GeoPoint {
    double latitude{0.0};     // degrees, north positive
    double longitude{0.0};    // degrees, east positive

    static GeoPoint clamped(double latitude, double longitude) {
        return GeoPoint{clampLatitude(latitude), clampLongitude(longitude)};
    }

    bool isFinite() const {
        return std::isfinite(latitude) && std::isfinite(longitude);
    }
};

// Planar position in world pixels (x east, y north) or screen pixels (y down)
struct PixelPoint {
    double x{0.0};
    double y{0.0};
};

enum class ConnectionStatus {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    ERROR
};

struct ConnectionState {
    ConnectionStatus status{ConnectionStatus::DISCONNECTED};
    std::string message;    // only meaningful for ERROR

    static ConnectionState disconnected() { return ConnectionState{ConnectionStatus::DISCONNECTED, ""}; }
    static ConnectionState connecting() { return ConnectionState{ConnectionStatus::CONNECTING, ""}; }
    static ConnectionState connected() { return ConnectionState{ConnectionStatus::CONNECTED, ""}; }
    static ConnectionState error(const std::string& message) {
        return ConnectionState{ConnectionStatus::ERROR, message};
    }

    bool isConnected() const { return status == ConnectionStatus::CONNECTED; }

    bool operator==(const ConnectionState& other) const {
        return status == other.status && message == other.message;
    }
    bool operator!=(const ConnectionState& other) const { return !(*this == other); }

    std::string toString() const;
};

} // namespace skyview

#endif // SKYVIEW_TYPES_H
