#include "veilrelay/sdk/CircuitBreaker.hpp"
#include <gtest/gtest.h>

using namespace veilrelay::sdk;

namespace {

Result<int> fail_with(ErrorCode code) {
    return {code, "boom"};
}

} // namespace

TEST(CircuitBreakerTest, OpensAfterThresholdOfTransientFailures) {
    CircuitBreaker breaker(3, std::chrono::seconds(60), "test");

    for (int i = 0; i < 3; ++i) {
        auto result = breaker.call<int>([] { return fail_with(ErrorCode::NETWORK_ERROR); });
        EXPECT_EQ(result.error(), ErrorCode::NETWORK_ERROR);
    }
    EXPECT_EQ(breaker.get_state(), CircuitBreaker::State::OPEN);

    bool invoked = false;
    auto rejected = breaker.call<int>([&invoked] {
        invoked = true;
        return Result<int>(1);
    });
    EXPECT_FALSE(invoked);
    EXPECT_EQ(rejected.error(), ErrorCode::CIRCUIT_OPEN);
    EXPECT_TRUE(is_transient(rejected.error()));
}

TEST(CircuitBreakerTest, PermanentErrorsDoNotCount) {
    CircuitBreaker breaker(2, std::chrono::seconds(60), "test");

    for (int i = 0; i < 5; ++i) {
        breaker.call<int>([] { return fail_with(ErrorCode::NO_ROUTE); });
    }
    EXPECT_EQ(breaker.get_state(), CircuitBreaker::State::CLOSED);
    EXPECT_EQ(breaker.get_failure_count(), 0u);
}

TEST(CircuitBreakerTest, SuccessResetsFailureCount) {
    CircuitBreaker breaker(3, std::chrono::seconds(60), "test");

    breaker.call<int>([] { return fail_with(ErrorCode::RATE_LIMITED); });
    breaker.call<int>([] { return fail_with(ErrorCode::RATE_LIMITED); });
    EXPECT_EQ(breaker.get_failure_count(), 2u);

    auto ok = breaker.call<int>([] { return Result<int>(7); });
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 7);
    EXPECT_EQ(breaker.get_failure_count(), 0u);
}

TEST(CircuitBreakerTest, HalfOpenProbeClosesOrReopens) {
    CircuitBreaker breaker(1, std::chrono::seconds(0), "test");

    breaker.call<int>([] { return fail_with(ErrorCode::UPSTREAM_UNAVAILABLE); });
    EXPECT_EQ(breaker.get_state(), CircuitBreaker::State::OPEN);

    // Zero reset timeout: the next call is let through as a trial
    breaker.call<int>([] { return fail_with(ErrorCode::UPSTREAM_UNAVAILABLE); });
    EXPECT_EQ(breaker.get_state(), CircuitBreaker::State::OPEN);

    auto ok = breaker.call<int>([] { return Result<int>(1); });
    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(breaker.get_state(), CircuitBreaker::State::CLOSED);
}
