#include "veilrelay/sdk/CircuitBreaker.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"
#include <chrono>
#include <mutex>

namespace veilrelay {
namespace sdk {

CircuitBreaker::CircuitBreaker(
    size_t failure_threshold,
    std::chrono::seconds reset_timeout,
    std::string name)
    : failure_threshold_(failure_threshold),
      reset_timeout_(reset_timeout),
      name_(std::move(name)),
      state_(State::CLOSED),
      failure_count_(0) {
}

bool CircuitBreaker::allow_request() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != State::OPEN) {
        return true;
    }

    auto now = std::chrono::steady_clock::now();
    if (now - last_failure_time_ >= reset_timeout_) {
        SecureLogger::instance().info("Circuit half-open for " + name_ + ", testing service");
        state_ = State::HALF_OPEN;
        return true;
    }
    return false;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == State::HALF_OPEN) {
        SecureLogger::instance().info("Service " + name_ + " recovered, circuit closed");
    }
    close_locked();
}

void CircuitBreaker::record_failure(const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);

    last_failure_time_ = std::chrono::steady_clock::now();

    if (state_ == State::CLOSED) {
        ++failure_count_;

        if (failure_count_ >= failure_threshold_) {
            SecureLogger::instance().warning("Failure threshold reached for " + name_ +
                                             ", circuit opened due to: " + error_message);
            state_ = State::OPEN;
        }
    } else if (state_ == State::HALF_OPEN) {
        SecureLogger::instance().warning("Service " + name_ + " still failing in half-open state, circuit opened again");
        state_ = State::OPEN;
    }
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

void CircuitBreaker::close_locked() {
    state_ = State::CLOSED;
    failure_count_ = 0;
}

CircuitBreaker::State CircuitBreaker::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t CircuitBreaker::get_failure_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_count_;
}

} // namespace sdk
} // namespace veilrelay
