/**
 * @file SecureLogger.hpp
 * @brief Process-wide logging facility with levels, rotation and operator alerts
 */

#pragma once

#include "veilrelay/sdk/constants.hpp"
#include <string>
#include <mutex>
#include <fstream>
#include <chrono>
#include <cstdint>

namespace veilrelay {
namespace sdk {

/**
 * @brief Process-wide logging facility with levels, rotation and operator alerts
 *
 * This is the operator-facing side channel: full error detail is written here,
 * while callers only ever see sanitized messages. Never log secrets or key bytes.
 */
class SecureLogger {
public:
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Get the singleton instance of the logger
     * @return Reference to the singleton instance
     */
    static SecureLogger& instance();

    /**
     * @brief Initialize the logger
     * @param log_path Directory to store log files
     * @param min_level Minimum log level to record
     * @param console Echo every record to stderr as well
     */
    void initialize(const std::string& log_path = constants::LOG_PATH,
                    LogLevel min_level = LogLevel::INFO,
                    bool console = false);

    /**
     * @brief Log a message with a specific level
     */
    void log(LogLevel level, const std::string& message);

    // Convenience methods for different log levels
    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    /**
     * @brief Record a condition that needs a human, e.g. funds left in custody
     */
    void alert(const std::string& message);

    ~SecureLogger();

    LogLevel get_log_level() const { return min_level_; }
    void set_log_level(LogLevel level) { min_level_ = level; }
    bool is_level_enabled(LogLevel level) const { return level >= min_level_; }
    std::string get_log_path() const { return log_path_; }

    /**
     * @brief Number of operator alerts raised since start
     */
    uint64_t alert_count() const;

    /**
     * @brief Parse a level name ("trace" .. "critical"), INFO when unknown
     */
    static LogLevel parse_level(const std::string& name);

    void flush();

private:
    SecureLogger();

    SecureLogger(const SecureLogger&) = delete;
    SecureLogger& operator=(const SecureLogger&) = delete;

    void log_internal(LogLevel level, const std::string& message);

    // Reopen under a new name once the current file passes the size cap
    void check_and_rotate_log();

    void open_log_file();

    static std::string level_to_string(LogLevel level);

    static std::string get_current_timestamp(const char* format = "%Y-%m-%d %H:%M:%S");

    static std::mutex instance_mutex_;
    static SecureLogger* instance_;

    mutable std::mutex log_mutex_;
    std::ofstream log_file_;
    std::string log_path_;
    LogLevel min_level_ = LogLevel::INFO;
    bool initialized_ = false;
    bool console_ = false;
    uint64_t alert_count_ = 0;
    size_t max_log_file_size_ = 10 * 1024 * 1024; // 10 MB
};

} // namespace sdk
} // namespace veilrelay
