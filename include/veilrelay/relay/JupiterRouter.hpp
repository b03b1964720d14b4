#pragma once

#include "veilrelay/relay/SwapRouter.hpp"
#include "veilrelay/relay/AggregatorHttp.hpp"
#include <memory>
#include <string>

namespace veilrelay {
namespace relay {

/**
 * @brief Jupiter aggregator; can deliver output straight to a recipient account
 */
class JupiterRouter : public SwapRouter {
public:
    struct Config {
        std::string api_url = "https://api.jup.ag/swap/v1";
        std::string token_list_url = "https://token.jup.ag/strict";
        uint64_t max_priority_fee_lamports = 1000000;
        std::string priority_level = "veryHigh";
        std::chrono::milliseconds token_list_ttl = sdk::constants::TOKEN_LIST_TTL;
    };

    JupiterRouter(Config config,
                  std::shared_ptr<sdk::HttpTransport> transport,
                  RetryPolicy retry = RetryPolicy());

    std::string name() const override { return "jupiter"; }
    bool supports_direct_routing() const override { return true; }

    Result<Quote> get_quote(const std::string& input_mint,
                            const std::string& output_mint,
                            uint64_t amount,
                            uint32_t slippage_bps) override;

    Result<ByteVector> get_swap_transaction(const Quote& quote,
                                            const PublicKey& signer,
                                            const std::optional<PublicKey>& recipient_token_account) override;

    Result<std::vector<TokenInfo>> get_token_list() override;

private:
    Result<std::vector<TokenInfo>> fetch_token_list();

    Config config_;
    AggregatorHttp http_;
    TokenListCache token_cache_;
};

} // namespace relay
} // namespace veilrelay
