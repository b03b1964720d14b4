#include "veilrelay/relay/RetryPolicy.hpp"
#include <gtest/gtest.h>
#include <vector>

using namespace veilrelay::relay;
using veilrelay::sdk::ErrorCode;

namespace {

class RetryPolicyTest : public ::testing::Test {
protected:
    RetryPolicy make_policy() {
        return RetryPolicy(RetryPolicy::Options(),
                           [this](std::chrono::milliseconds delay) { delays.push_back(delay.count()); });
    }

    std::vector<int64_t> delays;
};

} // namespace

TEST_F(RetryPolicyTest, SuccessNeedsNoRetry) {
    RetryPolicy policy = make_policy();
    int attempts = 0;

    auto result = policy.run<int>("quote", [&]() -> Result<int> {
        ++attempts;
        return 42;
    });

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(attempts, 1);
    EXPECT_TRUE(delays.empty());
}

TEST_F(RetryPolicyTest, BacksOffExponentiallyThenGivesUp) {
    RetryPolicy policy = make_policy();
    int attempts = 0;

    auto result = policy.run<int>("quote", [&]() -> Result<int> {
        ++attempts;
        return {ErrorCode::NETWORK_ERROR, "connection reset"};
    });

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), ErrorCode::NETWORK_ERROR);
    EXPECT_EQ(attempts, 4);
    EXPECT_EQ(delays, (std::vector<int64_t>{1000, 2000, 4000}));
    EXPECT_NE(result.error_message().find("unavailable after 4 attempts"), std::string::npos);
    EXPECT_NE(result.error_message().find("connection reset"), std::string::npos);
}

TEST_F(RetryPolicyTest, RecoversAfterTransientFailure) {
    RetryPolicy policy = make_policy();
    int attempts = 0;

    auto result = policy.run<int>("swap", [&]() -> Result<int> {
        if (++attempts < 3) {
            return ErrorCode::UPSTREAM_UNAVAILABLE;
        }
        return 7;
    });

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 7);
    EXPECT_EQ(delays, (std::vector<int64_t>{1000, 2000}));
}

TEST_F(RetryPolicyTest, RateLimitDoublesTheWait) {
    RetryPolicy policy = make_policy();
    int attempts = 0;

    auto result = policy.run<int>("quote", [&]() -> Result<int> {
        if (++attempts == 1) {
            return ErrorCode::RATE_LIMITED;
        }
        if (attempts == 2) {
            return ErrorCode::NETWORK_ERROR;
        }
        return 1;
    });

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(delays, (std::vector<int64_t>{2000, 4000}));
}

TEST_F(RetryPolicyTest, PermanentErrorsAreNotRetried) {
    RetryPolicy policy = make_policy();
    int attempts = 0;

    auto result = policy.run<int>("quote", [&]() -> Result<int> {
        ++attempts;
        return {ErrorCode::NO_ROUTE, "no route"};
    });

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), ErrorCode::NO_ROUTE);
    EXPECT_EQ(result.error_message(), "no route");
    EXPECT_EQ(attempts, 1);
    EXPECT_TRUE(delays.empty());
}

TEST_F(RetryPolicyTest, HonoursCustomRetryCount) {
    RetryPolicy::Options options;
    options.base_delay = std::chrono::milliseconds(10);
    options.max_retries = 1;
    RetryPolicy policy(options, [this](std::chrono::milliseconds delay) { delays.push_back(delay.count()); });
    int attempts = 0;

    auto result = policy.run<int>("quote", [&]() -> Result<int> {
        ++attempts;
        return ErrorCode::CONNECTION_TIMEOUT;
    });

    EXPECT_EQ(result.error(), ErrorCode::CONNECTION_TIMEOUT);
    EXPECT_EQ(attempts, 2);
    EXPECT_EQ(delays, (std::vector<int64_t>{10}));
}
