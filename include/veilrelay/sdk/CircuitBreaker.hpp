#pragma once

#include "veilrelay/sdk/types.hpp"
#include "veilrelay/sdk/constants.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"
#include <chrono>
#include <mutex>
#include <string>

namespace veilrelay {
namespace sdk {

/**
 * @brief Circuit breaker pattern implementation for fault tolerance
 *
 * Only transient failures (network, timeouts, rate limits, 5xx) count towards
 * opening the circuit. A permanent rejection proves the endpoint is alive.
 */
class CircuitBreaker {
public:
    enum class State {
        CLOSED,    // Normal operation
        OPEN,      // No operation allowed, failing fast
        HALF_OPEN  // Testing if service is healthy again
    };

    CircuitBreaker(
        size_t failure_threshold = constants::CIRCUIT_BREAKER_THRESHOLD,
        std::chrono::seconds reset_timeout = constants::CIRCUIT_BREAKER_RESET_TIMEOUT,
        std::string name = "upstream");

    /**
     * @brief Run a Result-returning call under circuit breaker protection
     */
    template<typename T, typename F>
    Result<T> call(F&& func) {
        if (!allow_request()) {
            SecureLogger::instance().warning("Circuit open for " + name_ + ", failing fast");
            return {ErrorCode::CIRCUIT_OPEN, name_ + " circuit open, failing fast"};
        }

        Result<T> result = func();

        if (result.is_ok() || !is_transient(result.error())) {
            record_success();
        } else {
            record_failure(result.error_message());
        }
        return result;
    }

    // Whether a request may pass; moves OPEN to HALF_OPEN once the timeout elapsed
    bool allow_request();

    void record_success();

    void record_failure(const std::string& error_message = "Unknown error");

    void reset();

    State get_state() const;

    size_t get_failure_count() const;

private:
    void close_locked();

    size_t failure_threshold_;
    std::chrono::seconds reset_timeout_;
    std::string name_;
    State state_;
    size_t failure_count_;
    std::chrono::steady_clock::time_point last_failure_time_;
    mutable std::mutex mutex_;
};

} // namespace sdk
} // namespace veilrelay
