#include "communication/csv_feed_client.h"
#include "common/logger.h"
#include <sstream>
#include <stdexcept>
#include <vector>

namespace skyview {
namespace comm {

namespace {
    const std::size_t COLUMN_COUNT = 10;

    std::optional<double> parseDouble(const std::string& token) {
        if (token.empty()) {
            return std::nullopt;
        }
        return std::stod(token);
    }

    std::optional<int> parseInt(const std::string& token) {
        if (token.empty()) {
            return std::nullopt;
        }
        return std::stoi(token);
    }

    std::optional<std::string> parseText(const std::string& token) {
        if (token.empty()) {
            return std::nullopt;
        }
        return token;
    }
}

CsvFeedClient::CsvFeedClient(const std::string& filename, std::chrono::milliseconds aircraft_timeout)
    : filename_(filename)
    , aircraft_timeout_(aircraft_timeout) {}

bool CsvFeedClient::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }
    file_.clear();
    file_.open(filename_);
    pending_.reset();
    aircraft_.clear();

    if (!file_) {
        state_ = ConnectionState::error("cannot open " + filename_);
        return false;
    }

    std::string header;
    std::getline(file_, header);  // Skip header

    state_ = ConnectionState::connected();
    return true;
}

bool CsvFeedClient::processNext() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!file_.is_open()) {
        state_ = ConnectionState::disconnected();
        return false;
    }

    std::optional<Row> row = pending_ ? pending_ : readRow();
    pending_.reset();

    if (!row) {
        Logger::getInstance().log("Replay of " + filename_ + " finished");
        file_.close();
        state_ = ConnectionState::disconnected();
        return false;
    }

    int64_t batch_time = row->time_ms;
    TimePoint heard = Clock::now();

    while (row && row->time_ms == batch_time) {
        row->report.last_seen = heard;
        merge(row->report, batch_time);
        row = readRow();
    }
    pending_ = row;

    expire(batch_time);
    return true;
}

std::optional<CsvFeedClient::Row> CsvFeedClient::readRow() {
    std::string line;
    while (std::getline(file_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        rows_read_++;
        auto row = parseRow(line);
        if (row) {
            return row;
        }
        rows_rejected_++;
        Logger::getInstance().warning("Invalid data format in line: " + line);
    }
    return std::nullopt;
}

std::optional<CsvFeedClient::Row> CsvFeedClient::parseRow(const std::string& line) {
    std::istringstream iss(line);
    std::string token;
    std::vector<std::string> tokens;

    while (std::getline(iss, token, ',')) {
        tokens.push_back(token);
    }
    // getline drops a trailing empty cell
    if (!line.empty() && line.back() == ',') {
        tokens.push_back("");
    }

    if (tokens.size() != COLUMN_COUNT || tokens[1].empty()) {
        return std::nullopt;
    }

    try {
        Row row;
        row.time_ms = std::stoll(tokens[0]);
        row.report.identifier = tokens[1];

        auto lat = parseDouble(tokens[2]);
        auto lon = parseDouble(tokens[3]);
        if (lat && lon) {
            row.report.position = GeoPoint{*lat, *lon};
        }
        row.report.altitude = parseInt(tokens[4]);
        row.report.heading = parseDouble(tokens[5]);
        row.report.ground_speed = parseDouble(tokens[6]);
        row.report.vertical_rate = parseInt(tokens[7]);
        row.report.callsign = parseText(tokens[8]);
        row.report.squawk = parseText(tokens[9]);
        return row;

    } catch (const std::exception&) {
        // stoi/stod failures: malformed numbers reject the row
        return std::nullopt;
    }
}

void CsvFeedClient::merge(const AircraftReport& report, int64_t time_ms) {
    auto clean = sanitizeReport(report);
    if (!clean) {
        return;
    }

    auto it = aircraft_.find(clean->identifier);
    if (it == aircraft_.end()) {
        aircraft_.emplace(clean->identifier, Entry{*clean, time_ms});
        return;
    }

    AircraftReport& current = it->second.report;
    applyPartial(current, *clean);
    current.last_seen = clean->last_seen;
    it->second.heard_ms = time_ms;
}

void CsvFeedClient::expire(int64_t now_ms) {
    for (auto it = aircraft_.begin(); it != aircraft_.end();) {
        if (now_ms - it->second.heard_ms > aircraft_timeout_.count()) {
            it = aircraft_.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<AircraftReport> CsvFeedClient::currentAircraft() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AircraftReport> reports;
    reports.reserve(aircraft_.size());
    for (const auto& entry : aircraft_) {
        reports.push_back(entry.second.report);
    }
    return reports;
}

ConnectionState CsvFeedClient::connectionState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

} // namespace comm
} // namespace skyview
