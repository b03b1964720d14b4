#pragma once

#include "veilrelay/sdk/types.hpp"
#include "veilrelay/sdk/constants.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace veilrelay {
namespace relay {

using sdk::Result;

/**
 * @brief Bounded exponential backoff for provider calls
 *
 * Up to max_retries retries after the first attempt. Permanent errors return
 * at once. A rate-limited attempt doubles the current delay before sleeping,
 * and every sleep multiplies the delay for the next one.
 */
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    struct Options {
        std::chrono::milliseconds base_delay = sdk::constants::RETRY_BASE_DELAY;
        double multiplier = sdk::constants::RETRY_BACKOFF_MULTIPLIER;
        size_t max_retries = sdk::constants::MAX_PROVIDER_RETRIES;
    };

    RetryPolicy();
    explicit RetryPolicy(Options options, Sleeper sleeper = nullptr);

    template<typename T, typename F>
    Result<T> run(const std::string& label, F&& attempt) {
        auto delay = options_.base_delay;
        const size_t total = options_.max_retries + 1;

        for (size_t i = 0; ; ++i) {
            Result<T> result = attempt();
            if (result.is_ok() || !sdk::is_transient(result.error())) {
                return result;
            }

            if (i + 1 >= total) {
                sdk::SecureLogger::instance().error(label + " failed after " + std::to_string(total) +
                                                    " attempts: " + result.error_message());
                return {result.error(), label + " unavailable after " + std::to_string(total) +
                                            " attempts: " + result.error_message()};
            }

            if (result.error() == sdk::ErrorCode::RATE_LIMITED) {
                delay *= 2;
            }

            sdk::SecureLogger::instance().warning(label + " attempt " + std::to_string(i + 1) + "/" +
                                                  std::to_string(total) + " failed (" +
                                                  result.error_message() + "), retrying in " +
                                                  std::to_string(delay.count()) + "ms");
            sleeper_(delay);
            delay = std::chrono::milliseconds(static_cast<int64_t>(delay.count() * options_.multiplier));
        }
    }

    const Options& options() const { return options_; }

private:
    Options options_;
    Sleeper sleeper_;
};

} // namespace relay
} // namespace veilrelay
