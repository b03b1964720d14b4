#include "veilrelay/relay/RetryPolicy.hpp"
#include <thread>

namespace veilrelay {
namespace relay {

RetryPolicy::RetryPolicy() : RetryPolicy(Options()) {
}

RetryPolicy::RetryPolicy(Options options, Sleeper sleeper)
    : options_(options), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

} // namespace relay
} // namespace veilrelay
