#ifndef SKYVIEW_LOGGER_H
#define SKYVIEW_LOGGER_H

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>

namespace skyview {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    // Get the singleton instance of the logger
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Log a message at INFO level
    void log(const std::string& message);

    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void warning(const std::string& message) { log(LogLevel::WARNING, message); }
    void error(const std::string& message) { log(LogLevel::ERROR, message); }

    // Set the log file (optional)
    void setLogFile(const std::string& filename);

    // Enable or disable console output
    void enableConsoleOutput(bool enable);

    // Messages below this level are discarded
    void setMinimumLevel(LogLevel level);
    LogLevel getMinimumLevel() const { return minimum_level_; }

    static const char* levelName(LogLevel level);

private:
    Logger();
    ~Logger();

    void write(LogLevel level, const std::string& message);

    std::mutex mutex_;
    std::ofstream log_file_;
    std::atomic<bool> console_output_enabled_;
    std::atomic<LogLevel> minimum_level_;
};

} // namespace skyview

#endif // SKYVIEW_LOGGER_H
