/**
 * @file SwapOrchestrator.hpp
 * @brief Unshield-and-swap saga with bounded compensation after funds move
 */

#pragma once

#include "veilrelay/relay/ProofJobManager.hpp"
#include "veilrelay/relay/RelaySigner.hpp"
#include "veilrelay/relay/SwapRouter.hpp"
#include "veilrelay/relay/TokenAccountResolver.hpp"
#include "veilrelay/sdk/ChainRpc.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace veilrelay {
namespace relay {

struct SwapRequest {
    std::string job_id;
    std::string recipient;                 // base58 wallet
    std::string output_mint;               // base58 mint
    std::optional<uint32_t> slippage_bps;
};

/**
 * @brief Result of a saga that got as far as the unshield
 *
 * Steps that were not attempted or did not succeed are empty strings.
 */
struct SwapOutcome {
    std::string unshield_signature;
    std::string swap_signature;
    std::string transfer_signature;
    std::string output_amount = "0";
    std::string output_mint;
    std::string recipient;
    uint64_t fee = 0;
};

/**
 * @brief Runs quote -> unshield -> swap -> verify -> transfer for a completed proof job
 *
 * Errors are only returned before the unshield. After it, every failure ends in
 * a partial outcome and, where custodial funds are left behind, an operator alert.
 */
class SwapOrchestrator {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    struct Options {
        size_t balance_poll_attempts = sdk::constants::BALANCE_POLL_ATTEMPTS;
        std::chrono::milliseconds balance_poll_delay = sdk::constants::BALANCE_POLL_DELAY;
        size_t transfer_attempts = sdk::constants::TRANSFER_ATTEMPTS;
        std::chrono::milliseconds transfer_retry_delay = sdk::constants::TRANSFER_RETRY_DELAY;
        uint64_t fallback_reserve = sdk::constants::FALLBACK_RESERVE_LAMPORTS;
        uint32_t default_slippage_bps = sdk::constants::DEFAULT_SLIPPAGE_BPS;
        Sleeper sleeper;
    };

    SwapOrchestrator(std::shared_ptr<ProofJobManager> jobs,
                     std::shared_ptr<RelaySigner> signer,
                     std::shared_ptr<SwapRouter> router,
                     std::shared_ptr<TokenAccountResolver> resolver,
                     std::shared_ptr<sdk::ChainRpc> rpc);
    SwapOrchestrator(std::shared_ptr<ProofJobManager> jobs,
                     std::shared_ptr<RelaySigner> signer,
                     std::shared_ptr<SwapRouter> router,
                     std::shared_ptr<TokenAccountResolver> resolver,
                     std::shared_ptr<sdk::ChainRpc> rpc,
                     Options options);

    Result<SwapOutcome> execute(const SwapRequest& request);

    const SwapRouter& router() const { return *router_; }

private:
    struct Context {
        SwapRequest request;
        PublicKey recipient;
        PublicKey output_mint;
        uint64_t amount = 0;
        uint64_t fee = 0;
        TokenProgram program = TokenProgram::STANDARD;
        uint8_t decimals = sdk::constants::DEFAULT_MINT_DECIMALS;
        std::optional<PublicKey> recipient_account;
        std::optional<PublicKey> custodial_account;
        std::string unshield_signature;
        std::string swap_signature;             // set once the swap is confirmed
        std::optional<uint64_t> arrived;
    };

    // Everything after the unshield; never fails, only degrades
    SwapOutcome settle(Context& ctx, const Quote& quote);
    SwapOutcome settle_direct(Context& ctx, const Quote& quote);
    SwapOutcome settle_two_transaction(Context& ctx, const Quote& quote);

    // Submit and confirm the provider transaction, empty on failure
    std::string submit_swap(const Context& ctx, const Quote& quote);

    // Token balance of the custodial account, 0 when it does not exist yet
    Result<uint64_t> custodial_token_balance(const PublicKey& account);

    SwapOutcome fallback(const Context& ctx, const std::string& reason);
    // Swap done but output not delivered; the tokens stay in custody
    SwapOutcome stranded(const Context& ctx, const std::string& reason);
    SwapOutcome unshield_only(const Context& ctx) const;

    std::shared_ptr<std::mutex> mint_lock(const std::string& mint);

    std::shared_ptr<ProofJobManager> jobs_;
    std::shared_ptr<RelaySigner> signer_;
    std::shared_ptr<SwapRouter> router_;
    std::shared_ptr<TokenAccountResolver> resolver_;
    std::shared_ptr<sdk::ChainRpc> rpc_;
    Options options_;

    // Serializes fallback sizing and sending against the custodial balance
    std::mutex fallback_mutex_;

    std::mutex mint_locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> mint_locks_;
};

} // namespace relay
} // namespace veilrelay
