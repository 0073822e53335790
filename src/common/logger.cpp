// src/common/logger.cpp
#include "common/logger.h"
#include <iostream>
#include <iomanip>
#include <ctime>
#include <chrono>
#include <sstream>

namespace skyview {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : console_output_enabled_(true)
    , minimum_level_(LogLevel::INFO) {
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    log_file_.open(filename, std::ios::out | std::ios::app);
    if (!log_file_) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
    }
}

void Logger::enableConsoleOutput(bool enable) {
    console_output_enabled_ = enable;
}

void Logger::setMinimumLevel(LogLevel level) {
    minimum_level_ = level;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "?";
    }
}

void Logger::log(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(minimum_level_.load())) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    write(level, message);
}

void Logger::write(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm tm_now;
#if defined(_WIN32) || defined(_WIN64)
    localtime_s(&tm_now, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_now);
#endif
    std::ostringstream line;
    line << "[" << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S")
         << "." << std::setfill('0') << std::setw(3) << millis << "] "
         << "[" << levelName(level) << "] " << message;
    const std::string full_message = line.str();

    if (console_output_enabled_) {
        if (level == LogLevel::ERROR || level == LogLevel::WARNING) {
            std::cerr << full_message << std::endl;
        } else {
            std::cout << full_message << std::endl;
        }
    }

    if (log_file_.is_open()) {
        log_file_ << full_message << std::endl;
    }
}

} // namespace skyview
