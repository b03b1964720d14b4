/**
 * @file SwapRouter.hpp
 * @brief Swap-routing provider capability and the values it exchanges
 */

#pragma once

#include "veilrelay/sdk/types.hpp"
#include "veilrelay/sdk/PublicKey.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace veilrelay {
namespace relay {

using sdk::ByteVector;
using sdk::PublicKey;
using sdk::Result;

/**
 * @brief Priced route from one mint to another, valid for a single saga run
 */
struct Quote {
    std::string input_mint;
    std::string output_mint;
    uint64_t in_amount = 0;
    uint64_t out_amount = 0;
    uint64_t other_amount_threshold = 0;  // minimum received after slippage
    uint32_t slippage_bps = 0;
    std::string price_impact_pct;
    std::string provider;
    std::string raw;                      // provider payload, replayed verbatim on swap
};

struct TokenInfo {
    std::string address;
    std::string symbol;
    std::string name;
    uint8_t decimals = sdk::constants::DEFAULT_MINT_DECIMALS;
    std::optional<std::string> logo_uri;
};

/**
 * @brief Third-party swap aggregator
 *
 * Errors are classified through ErrorCode: RATE_LIMITED, NETWORK_ERROR,
 * CONNECTION_TIMEOUT, UPSTREAM_UNAVAILABLE and CIRCUIT_OPEN are transient,
 * NO_ROUTE, AGGREGATOR_REJECTED, SIMULATION_FAILED, INVALID_PARAMETER and
 * MALFORMED_RESPONSE are permanent.
 */
class SwapRouter {
public:
    virtual ~SwapRouter() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Whether swap output can be delivered to an account the signer does not own
     */
    virtual bool supports_direct_routing() const = 0;

    virtual Result<Quote> get_quote(const std::string& input_mint,
                                    const std::string& output_mint,
                                    uint64_t amount,
                                    uint32_t slippage_bps) = 0;

    /**
     * @brief Unsigned serialized transaction executing the quote for the signer
     * @param recipient_token_account Output destination, direct-routing providers only
     */
    virtual Result<ByteVector> get_swap_transaction(const Quote& quote,
                                                    const PublicKey& signer,
                                                    const std::optional<PublicKey>& recipient_token_account) = 0;

    virtual Result<std::vector<TokenInfo>> get_token_list() = 0;
};

/**
 * @brief Token list cache refreshed lazily on the first read after expiry
 */
class TokenListCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit TokenListCache(std::chrono::milliseconds ttl = sdk::constants::TOKEN_LIST_TTL,
                            Clock clock = nullptr);

    /**
     * @brief Cached list, or the result of fetch when empty or stale
     *
     * A failed refresh is returned as is and leaves the previous entry untouched.
     */
    Result<std::vector<TokenInfo>> get(const std::function<Result<std::vector<TokenInfo>>()>& fetch);

private:
    std::chrono::milliseconds ttl_;
    Clock clock_;
    std::mutex mutex_;
    std::vector<TokenInfo> tokens_;
    std::optional<std::chrono::steady_clock::time_point> fetched_at_;
};

} // namespace relay
} // namespace veilrelay
