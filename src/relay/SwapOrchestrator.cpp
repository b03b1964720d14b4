#include "veilrelay/relay/SwapOrchestrator.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"
#include <algorithm>
#include <thread>

namespace veilrelay {
namespace relay {

using sdk::ErrorCode;
using sdk::SecureLogger;

SwapOrchestrator::SwapOrchestrator(std::shared_ptr<ProofJobManager> jobs,
                                   std::shared_ptr<RelaySigner> signer,
                                   std::shared_ptr<SwapRouter> router,
                                   std::shared_ptr<TokenAccountResolver> resolver,
                                   std::shared_ptr<sdk::ChainRpc> rpc)
    : SwapOrchestrator(std::move(jobs), std::move(signer), std::move(router),
                       std::move(resolver), std::move(rpc), Options()) {
}

SwapOrchestrator::SwapOrchestrator(std::shared_ptr<ProofJobManager> jobs,
                                   std::shared_ptr<RelaySigner> signer,
                                   std::shared_ptr<SwapRouter> router,
                                   std::shared_ptr<TokenAccountResolver> resolver,
                                   std::shared_ptr<sdk::ChainRpc> rpc,
                                   Options options)
    : jobs_(std::move(jobs)),
      signer_(std::move(signer)),
      router_(std::move(router)),
      resolver_(std::move(resolver)),
      rpc_(std::move(rpc)),
      options_(std::move(options)) {
    if (!jobs_ || !signer_ || !router_ || !resolver_ || !rpc_) {
        throw std::invalid_argument("SwapOrchestrator requires all collaborators");
    }
    if (!options_.sleeper) {
        options_.sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

Result<SwapOutcome> SwapOrchestrator::execute(const SwapRequest& request) {
    Context ctx;
    ctx.request = request;

    auto recipient = PublicKey::from_base58(request.recipient);
    if (recipient.is_err()) {
        return {ErrorCode::INVALID_ADDRESS, "Invalid recipient address: " + request.recipient};
    }
    auto output_mint = PublicKey::from_base58(request.output_mint);
    if (output_mint.is_err()) {
        return {ErrorCode::INVALID_ADDRESS, "Invalid output mint: " + request.output_mint};
    }
    ctx.recipient = recipient.value();
    ctx.output_mint = output_mint.value();

    if (!signer_->is_enabled()) {
        return {ErrorCode::SERVICE_DISABLED, "Relayer is disabled"};
    }

    // 1. The proof job must be finished and carry what the pool needs
    auto job = jobs_->get_status(request.job_id);
    if (!job) {
        return {ErrorCode::JOB_NOT_FOUND, "Job not found: " + request.job_id};
    }
    if (job->status != JobStatus::COMPLETED) {
        return {ErrorCode::JOB_NOT_COMPLETE, "Job not complete: " + to_string(job->status)};
    }
    if (!job->result || job->result->proof.empty() || job->result->nullifier.empty()) {
        SecureLogger::instance().error("Completed job " + request.job_id + " has no proof result");
        return {ErrorCode::PROOF_RESULT_MISSING, "Proof or nullifier missing from job result"};
    }

    ctx.amount = job->params.amount;
    ctx.fee = signer_->calculate_fee(ctx.amount);

    // 2. Quote before any funds move so a missing route costs nothing
    const uint32_t slippage = request.slippage_bps.value_or(options_.default_slippage_bps);
    auto quote = router_->get_quote(sdk::constants::WRAPPED_SOL_MINT, request.output_mint, ctx.amount, slippage);
    if (quote.is_err()) {
        SecureLogger::instance().warning("Quote failed for job " + request.job_id + " via " + router_->name() +
                                         ": " + quote.error_message());
        return {quote.error(), quote.error_message()};
    }

    // 3. Destination token program, needed to derive the token accounts
    ctx.program = resolver_->detect_token_program(ctx.output_mint);
    if (!router_->supports_direct_routing()) {
        ctx.decimals = resolver_->detect_mint_decimals(ctx.output_mint);
    }

    auto recipient_account = TokenAccountResolver::derive_account(ctx.recipient, ctx.output_mint, ctx.program);
    if (recipient_account.is_err()) {
        SecureLogger::instance().error("Cannot derive recipient token account: " + recipient_account.error_message());
        return {ErrorCode::INTERNAL_ERROR, "Cannot derive recipient token account"};
    }
    ctx.recipient_account = recipient_account.value();

    // 4. Unshield into custody, never straight to the recipient
    auto unshield = signer_->relay_unshield(job->result->nullifier, signer_->public_key().to_base58(),
                                            ctx.amount, job->result->proof, job->params.denomination);
    if (unshield.is_err()) {
        SecureLogger::instance().error("Unshield failed for job " + request.job_id + ": " + unshield.error_message());
        return {unshield.error(), unshield.error_message()};
    }
    ctx.unshield_signature = unshield.value().signature;
    ctx.fee = unshield.value().fee;

    SecureLogger::instance().info("Job " + request.job_id + " unshielded " + std::to_string(ctx.amount) +
                                  " lamports into custody: " + ctx.unshield_signature);

    try {
        return settle(ctx, quote.value());
    } catch (const std::exception& e) {
        SecureLogger::instance().error("Swap step threw for job " + request.job_id + ": " + e.what());
        if (!ctx.swap_signature.empty()) {
            // The SOL is spent; sending it again from the float would pay twice
            return stranded(ctx, "settlement threw after swap");
        }
        return fallback(ctx, "swap step threw");
    }
}

SwapOutcome SwapOrchestrator::settle(Context& ctx, const Quote& quote) {
    // 5. Best effort; the two-transaction path checks again before transferring
    auto created = resolver_->ensure_account_exists(ctx.recipient, ctx.output_mint, ctx.program);
    if (created.is_err()) {
        SecureLogger::instance().warning("Could not ensure recipient token account " +
                                         ctx.recipient_account->to_base58() + ": " + created.error_message());
    }

    if (router_->supports_direct_routing()) {
        return settle_direct(ctx, quote);
    }
    return settle_two_transaction(ctx, quote);
}

SwapOutcome SwapOrchestrator::settle_direct(Context& ctx, const Quote& quote) {
    const std::string swap_signature = submit_swap(ctx, quote);
    if (swap_signature.empty()) {
        return fallback(ctx, "swap failed");
    }
    ctx.swap_signature = swap_signature;

    SwapOutcome outcome;
    outcome.unshield_signature = ctx.unshield_signature;
    outcome.swap_signature = swap_signature;
    outcome.output_amount = std::to_string(quote.out_amount);
    outcome.output_mint = ctx.request.output_mint;
    outcome.recipient = ctx.request.recipient;
    outcome.fee = ctx.fee;
    return outcome;
}

SwapOutcome SwapOrchestrator::settle_two_transaction(Context& ctx, const Quote& quote) {
    auto custodial_account = TokenAccountResolver::derive_account(signer_->public_key(), ctx.output_mint, ctx.program);
    if (custodial_account.is_err()) {
        return fallback(ctx, "cannot derive custodial token account");
    }
    const PublicKey intermediate = custodial_account.value();
    ctx.custodial_account = intermediate;

    // Only one saga per mint may swap into the shared custodial token account at a time
    auto lock = mint_lock(ctx.request.output_mint);
    std::lock_guard<std::mutex> guard(*lock);

    // The account may hold tokens stranded by earlier sagas, so the baseline must be known
    Result<uint64_t> before = custodial_token_balance(intermediate);
    for (size_t attempt = 1; before.is_err() && attempt < options_.balance_poll_attempts; ++attempt) {
        SecureLogger::instance().warning("Baseline read " + std::to_string(attempt) + " failed: " +
                                         before.error_message());
        options_.sleeper(options_.balance_poll_delay);
        before = custodial_token_balance(intermediate);
    }
    if (before.is_err()) {
        SecureLogger::instance().error("Custodial token balance of " + intermediate.to_base58() +
                                       " unreadable before swap: " + before.error_message());
        return fallback(ctx, "custodial token balance unknown");
    }
    const uint64_t baseline = before.value();

    const std::string swap_signature = submit_swap(ctx, quote);
    if (swap_signature.empty()) {
        return fallback(ctx, "swap failed");
    }
    ctx.swap_signature = swap_signature;

    // 7. The confirmed swap may not be visible to balance reads yet
    uint64_t arrived = 0;
    for (size_t attempt = 1; attempt <= options_.balance_poll_attempts; ++attempt) {
        auto balance = custodial_token_balance(intermediate);
        if (balance.is_ok() && balance.value() > baseline) {
            arrived = balance.value() - baseline;
            break;
        }
        if (balance.is_err()) {
            SecureLogger::instance().warning("Balance poll " + std::to_string(attempt) + " failed: " +
                                             balance.error_message());
        }
        if (attempt < options_.balance_poll_attempts) {
            options_.sleeper(options_.balance_poll_delay);
        }
    }

    if (arrived == 0) {
        SecureLogger::instance().error("Swap " + swap_signature + " confirmed but nothing arrived in " +
                                       intermediate.to_base58());
        return fallback(ctx, "swap output not observed");
    }

    ctx.arrived = arrived;
    SecureLogger::instance().info("Swap " + swap_signature + " delivered " + std::to_string(arrived) +
                                  " (quoted " + std::to_string(quote.out_amount) + ")");

    SwapOutcome outcome;
    outcome.unshield_signature = ctx.unshield_signature;
    outcome.swap_signature = swap_signature;
    outcome.output_amount = std::to_string(arrived);
    outcome.output_mint = ctx.request.output_mint;
    outcome.recipient = ctx.request.recipient;
    outcome.fee = ctx.fee;

    // 8. Destination may have failed to materialize earlier
    auto recheck = resolver_->ensure_account_exists(ctx.recipient, ctx.output_mint, ctx.program);
    if (recheck.is_err()) {
        SecureLogger::instance().warning("Recipient token account re-check failed: " + recheck.error_message());
    }

    const sdk::Instruction transfer = TokenAccountResolver::build_transfer_instruction(
        intermediate, *ctx.recipient_account, signer_->public_key(), arrived,
        ctx.program, ctx.output_mint, ctx.decimals);

    for (size_t attempt = 1; attempt <= options_.transfer_attempts; ++attempt) {
        auto signature = signer_->submit_instructions({transfer});
        if (signature.is_ok()) {
            auto confirmed = signer_->confirm(signature.value());
            if (confirmed.is_ok()) {
                outcome.transfer_signature = signature.value();
                return outcome;
            }
            if (confirmed.error() == ErrorCode::CONFIRMATION_TIMEOUT) {
                // Resubmitting could double-spend if the first one lands
                SecureLogger::instance().warning("Transfer " + signature.value() +
                                                 " not confirmed in time, reporting as submitted");
                outcome.transfer_signature = signature.value();
                return outcome;
            }
            SecureLogger::instance().warning("Transfer attempt " + std::to_string(attempt) + " failed on chain: " +
                                             confirmed.error_message());
        } else {
            SecureLogger::instance().warning("Transfer attempt " + std::to_string(attempt) + " failed: " +
                                             signature.error_message());
        }

        if (attempt < options_.transfer_attempts) {
            options_.sleeper(options_.transfer_retry_delay);
        }
    }

    return stranded(ctx, "transfer attempts exhausted");
}

std::string SwapOrchestrator::submit_swap(const Context& ctx, const Quote& quote) {
    std::optional<PublicKey> destination;
    if (router_->supports_direct_routing()) {
        destination = ctx.recipient_account;
    }

    auto transaction = router_->get_swap_transaction(quote, signer_->public_key(), destination);
    if (transaction.is_err()) {
        SecureLogger::instance().error("Swap transaction unavailable from " + router_->name() + ": " +
                                       transaction.error_message());
        return "";
    }

    auto signature = signer_->sign_and_submit_provider_transaction(transaction.value());
    if (signature.is_err()) {
        SecureLogger::instance().error("Swap submission failed: " + signature.error_message());
        return "";
    }

    auto confirmed = signer_->confirm(signature.value());
    if (confirmed.is_err()) {
        SecureLogger::instance().error("Swap " + signature.value() + " not confirmed: " + confirmed.error_message());
        return "";
    }

    SecureLogger::instance().info("Swap confirmed via " + router_->name() + ": " + signature.value());
    return signature.value();
}

Result<uint64_t> SwapOrchestrator::custodial_token_balance(const PublicKey& account) {
    auto balance = rpc_->get_token_account_balance(account);
    if (balance.is_err() && balance.error() == ErrorCode::ACCOUNT_NOT_FOUND) {
        return uint64_t{0};
    }
    return balance;
}

SwapOutcome SwapOrchestrator::fallback(const Context& ctx, const std::string& reason) {
    SecureLogger::instance().warning("Falling back to native transfer for job " + ctx.request.job_id + ": " + reason);

    std::lock_guard<std::mutex> lock(fallback_mutex_);

    auto balance = signer_->get_balance();
    if (balance.is_err()) {
        SecureLogger::instance().alert("Fallback skipped, custodial balance unreadable (" + balance.error_message() +
                                       "). " + std::to_string(ctx.amount) + " lamports for " +
                                       ctx.request.recipient + " remain with " + signer_->public_key().to_base58() +
                                       " (job " + ctx.request.job_id + ")");
        return unshield_only(ctx);
    }

    const uint64_t intended = ctx.amount > ctx.fee ? ctx.amount - ctx.fee : 0;
    const uint64_t available = balance.value() > options_.fallback_reserve
                                   ? balance.value() - options_.fallback_reserve : 0;
    const uint64_t amount = std::min(intended, available);

    if (amount == 0) {
        SecureLogger::instance().alert("Fallback skipped, nothing sendable (intended " + std::to_string(intended) +
                                       ", available " + std::to_string(available) + "). Funds for " +
                                       ctx.request.recipient + " remain with " + signer_->public_key().to_base58() +
                                       " (job " + ctx.request.job_id + ")");
        return unshield_only(ctx);
    }

    auto signature = signer_->send_native(ctx.recipient, amount);
    Result<void> confirmed = signature.is_ok() ? signer_->confirm(signature.value())
                                               : Result<void>(signature.error(), signature.error_message());
    if (signature.is_ok() && confirmed.is_err() && confirmed.error() == ErrorCode::CONFIRMATION_TIMEOUT) {
        // Accepted by the node and may still land
        SecureLogger::instance().warning("Fallback " + signature.value() +
                                         " not confirmed in time, reporting as submitted");
    } else if (confirmed.is_err()) {
        SecureLogger::instance().alert("Swap and fallback both failed (" + confirmed.error_message() + "). " +
                                       std::to_string(amount) + " lamports for " + ctx.request.recipient +
                                       " remain with " + signer_->public_key().to_base58() +
                                       " (job " + ctx.request.job_id + ", unshield " +
                                       ctx.unshield_signature + ")");
        return unshield_only(ctx);
    } else {
        SecureLogger::instance().info("Fallback sent " + std::to_string(amount) + " lamports to " +
                                      ctx.request.recipient + ": " + signature.value());
    }

    SwapOutcome outcome;
    outcome.unshield_signature = ctx.unshield_signature;
    outcome.transfer_signature = signature.value();
    outcome.output_amount = std::to_string(amount);
    outcome.output_mint = sdk::constants::WRAPPED_SOL_MINT;
    outcome.recipient = ctx.request.recipient;
    outcome.fee = ctx.fee;
    return outcome;
}

SwapOutcome SwapOrchestrator::stranded(const Context& ctx, const std::string& reason) {
    SwapOutcome outcome;
    outcome.unshield_signature = ctx.unshield_signature;
    outcome.swap_signature = ctx.swap_signature;
    outcome.output_amount = ctx.arrived ? std::to_string(*ctx.arrived) : "0";
    outcome.output_mint = ctx.request.output_mint;
    outcome.recipient = ctx.request.recipient;
    outcome.fee = ctx.fee;

    const std::string held_in = ctx.custodial_account ? ctx.custodial_account->to_base58()
                                                      : signer_->public_key().to_base58();
    SecureLogger::instance().alert("Tokens stranded in custody (" + reason + "): " +
                                   (ctx.arrived ? outcome.output_amount : std::string("unknown amount")) +
                                   " of " + ctx.request.output_mint + " in " + held_in + " owed to " +
                                   ctx.request.recipient + " (job " + ctx.request.job_id + ", swap " +
                                   ctx.swap_signature + ")");
    return outcome;
}

SwapOutcome SwapOrchestrator::unshield_only(const Context& ctx) const {
    SwapOutcome outcome;
    outcome.unshield_signature = ctx.unshield_signature;
    outcome.output_amount = "0";
    outcome.output_mint = ctx.request.output_mint;
    outcome.recipient = ctx.request.recipient;
    outcome.fee = ctx.fee;
    return outcome;
}

std::shared_ptr<std::mutex> SwapOrchestrator::mint_lock(const std::string& mint) {
    std::lock_guard<std::mutex> lock(mint_locks_mutex_);
    auto& entry = mint_locks_[mint];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

} // namespace relay
} // namespace veilrelay
