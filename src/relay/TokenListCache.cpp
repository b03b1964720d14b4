#include "veilrelay/relay/SwapRouter.hpp"

namespace veilrelay {
namespace relay {

TokenListCache::TokenListCache(std::chrono::milliseconds ttl, Clock clock)
    : ttl_(ttl), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

Result<std::vector<TokenInfo>> TokenListCache::get(const std::function<Result<std::vector<TokenInfo>>()>& fetch) {
    // Held across the fetch so concurrent readers share one refresh
    std::lock_guard<std::mutex> lock(mutex_);

    const auto now = clock_();
    if (fetched_at_ && now - *fetched_at_ < ttl_) {
        return tokens_;
    }

    auto fresh = fetch();
    if (fresh.is_err()) {
        return fresh;
    }

    tokens_ = fresh.value();
    fetched_at_ = now;
    return tokens_;
}

} // namespace relay
} // namespace veilrelay
