#ifndef SKYVIEW_CSV_FEED_CLIENT_H
#define SKYVIEW_CSV_FEED_CLIENT_H

#include "communication/feed_client.h"
#include <chrono>
#include <cstdint>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace skyview {
namespace comm {

/**
 * Replays recorded traffic from a CSV file:
 *
 *   time_ms,identifier,lat,lon,altitude,heading,speed,vertical_rate,callsign,squawk
 *
 * Empty cells are "not reported". Rows sharing a time_ms form one batch and
 * each processNext() consumes one batch. Aircraft not heard for longer than
 * the timeout (in recording time) leave the current list. End of file is a
 * dropped connection; the next connect() starts the replay over.
 */
class CsvFeedClient : public IFeedClient {
public:
    explicit CsvFeedClient(const std::string& filename,
                           std::chrono::milliseconds aircraft_timeout = std::chrono::seconds(60));

    bool connect() override;
    bool processNext() override;
    std::vector<AircraftReport> currentAircraft() const override;
    ConnectionState connectionState() const override;

    const std::string& getFilename() const { return filename_; }
    std::size_t getRowsRead() const { return rows_read_; }
    std::size_t getRowsRejected() const { return rows_rejected_; }

private:
    struct Row {
        int64_t time_ms;
        AircraftReport report;
    };

    std::optional<Row> readRow();
    static std::optional<Row> parseRow(const std::string& line);
    void merge(const AircraftReport& report, int64_t time_ms);
    void expire(int64_t now_ms);

    std::string filename_;
    std::chrono::milliseconds aircraft_timeout_;
    std::ifstream file_;
    std::optional<Row> pending_;

    struct Entry {
        AircraftReport report;
        int64_t heard_ms;
    };
    std::map<std::string, Entry> aircraft_;

    mutable std::mutex mutex_;
    ConnectionState state_;
    std::size_t rows_read_{0};
    std::size_t rows_rejected_{0};
};

} // namespace comm
} // namespace skyview

#endif // SKYVIEW_CSV_FEED_CLIENT_H
