#include "veilrelay/sdk/SecureLogger.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <mutex>

namespace veilrelay {
namespace sdk {

std::mutex SecureLogger::instance_mutex_;
SecureLogger* SecureLogger::instance_ = nullptr;

SecureLogger& SecureLogger::instance() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) {
        instance_ = new SecureLogger();
    }
    return *instance_;
}

SecureLogger::SecureLogger()
    : log_path_(constants::LOG_PATH),
      min_level_(LogLevel::INFO),
      initialized_(false) {
}

SecureLogger::~SecureLogger() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void SecureLogger::initialize(const std::string& log_path, LogLevel min_level, bool console) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (initialized_) {
        log_internal(LogLevel::INFO, "Logger already initialized, reinitializing with new parameters");
    }

    log_path_ = log_path;
    min_level_ = min_level;
    console_ = console;

    std::error_code ec;
    std::filesystem::create_directories(log_path_, ec);

    open_log_file();

    initialized_ = true;
    log_internal(LogLevel::INFO, "SecureLogger initialized");
}

void SecureLogger::open_log_file() {
    if (log_file_.is_open()) {
        log_file_.close();
    }

    std::string filename = log_path_ + "/veilrelay_" +
                           get_current_timestamp("%Y%m%d_%H%M%S") + ".log";
    log_file_.open(filename, std::ios::out | std::ios::app);

    if (!log_file_.is_open()) {
        // Fall back to the working directory when the log directory is not writable
        log_file_.open("veilrelay.log", std::ios::out | std::ios::app);
    }
}

void SecureLogger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_internal(level, message);
}

void SecureLogger::trace(const std::string& message) {
    log(LogLevel::TRACE, message);
}

void SecureLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void SecureLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void SecureLogger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void SecureLogger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void SecureLogger::critical(const std::string& message) {
    log(LogLevel::CRITICAL, message);
}

void SecureLogger::alert(const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    ++alert_count_;
    log_internal(LogLevel::CRITICAL, "[OPERATOR-ALERT] " + message);
}

uint64_t SecureLogger::alert_count() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return alert_count_;
}

void SecureLogger::flush() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_file_.is_open()) {
        log_file_.flush();
    }
}

SecureLogger::LogLevel SecureLogger::parse_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::TRACE;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void SecureLogger::log_internal(LogLevel level, const std::string& message) {
    if (level < min_level_) {
        return;
    }

    const std::string line = "[" + get_current_timestamp() + "] [" + level_to_string(level) + "] " + message;

    if (log_file_.is_open()) {
        check_and_rotate_log();
        log_file_ << line << std::endl;
    }

    // Errors always reach stderr, everything else only in console mode
    if (console_ || level >= LogLevel::ERROR) {
        std::cerr << line << std::endl;
    }
}

void SecureLogger::check_and_rotate_log() {
    if (log_file_.tellp() >= static_cast<std::streamoff>(max_log_file_size_)) {
        open_log_file();
    }
}

std::string SecureLogger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string SecureLogger::get_current_timestamp(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    char buffer[128];
    strftime(buffer, sizeof(buffer), format, &tm_now);

    return std::string(buffer);
}

} // namespace sdk
} // namespace veilrelay
