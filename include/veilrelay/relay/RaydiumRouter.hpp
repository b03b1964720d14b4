#pragma once

#include "veilrelay/relay/SwapRouter.hpp"
#include "veilrelay/relay/AggregatorHttp.hpp"
#include <memory>
#include <string>

namespace veilrelay {
namespace relay {

/**
 * @brief Raydium trade API; output always lands in the signer's own token account
 */
class RaydiumRouter : public SwapRouter {
public:
    struct Config {
        std::string api_url = "https://transaction-v1-devnet.raydium.io";
        std::string pools_api_url = "https://api-v3-devnet.raydium.io";
        std::string compute_unit_price_micro_lamports = "1000";
        std::chrono::milliseconds token_list_ttl = sdk::constants::TOKEN_LIST_TTL;
    };

    RaydiumRouter(Config config,
                  std::shared_ptr<sdk::HttpTransport> transport,
                  RetryPolicy retry = RetryPolicy());

    std::string name() const override { return "raydium"; }
    bool supports_direct_routing() const override { return false; }

    Result<Quote> get_quote(const std::string& input_mint,
                            const std::string& output_mint,
                            uint64_t amount,
                            uint32_t slippage_bps) override;

    /**
     * @brief Build the swap for the signer; a recipient account is rejected
     */
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
