#include "veilrelay/relay/RelaySigner.hpp"
#include "veilrelay/sdk/Encoding.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"
#include <algorithm>

namespace veilrelay {
namespace relay {

using sdk::AccountMeta;
using sdk::Encoding;
using sdk::ErrorCode;
using sdk::Instruction;
using sdk::SecureLogger;

namespace {

ByteVector unshield_discriminator() {
    const std::string& preimage = sdk::constants::UNSHIELD_SOL_DISCRIMINATOR_PREIMAGE;
    sdk::Hash32 digest = sdk::sha256({ByteVector(preimage.begin(), preimage.end())});
    return ByteVector(digest.begin(), digest.begin() + 8);
}

ByteVector seed(const std::string& text) {
    return ByteVector(text.begin(), text.end());
}

} // namespace

RelaySigner::RelaySigner(std::shared_ptr<sdk::Keypair> keypair,
                         std::shared_ptr<sdk::ChainRpc> rpc,
                         Config config)
    : keypair_(std::move(keypair)), rpc_(std::move(rpc)), config_(std::move(config)) {
    if (!keypair_ || !rpc_) {
        throw std::invalid_argument("RelaySigner requires a keypair and an RPC client");
    }
    if (PublicKey::from_base58(config_.program_id).is_err()) {
        throw std::invalid_argument("Invalid pool program id: " + config_.program_id);
    }

    SecureLogger::instance().info("Relay signer " + keypair_->public_key().to_base58() +
                                  (config_.enabled ? " enabled" : " disabled") +
                                  ", fee " + std::to_string(config_.fee_bps) + " bps");
}

uint64_t RelaySigner::calculate_fee(uint64_t amount) const {
    // floor(amount * bps / 10000) without forming amount * bps
    const uint64_t fee = (amount / 10000) * config_.fee_bps + (amount % 10000) * config_.fee_bps / 10000;
    return std::max(fee, config_.min_fee);
}

uint64_t RelaySigner::calculate_amount_after_fee(uint64_t amount) const {
    const uint64_t fee = calculate_fee(amount);
    return amount > fee ? amount - fee : 0;
}

Result<Instruction> RelaySigner::build_unshield_instruction(const PublicKey& program_id,
                                                            const PublicKey& relayer,
                                                            const ByteVector& nullifier,
                                                            const PublicKey& recipient,
                                                            uint64_t amount,
                                                            const ByteVector& proof,
                                                            uint64_t denomination) {
    ByteVector denomination_seed;
    Encoding::append_u64_le(denomination_seed, denomination);

    auto pool = PublicKey::find_program_address({seed(sdk::constants::POOL_SEED), denomination_seed}, program_id);
    if (pool.is_err()) {
        return {pool.error(), pool.error_message()};
    }
    const PublicKey pool_address = pool.value().first;

    auto vault = PublicKey::find_program_address({seed(sdk::constants::VAULT_SEED), pool_address.to_vector()},
                                                 program_id);
    if (vault.is_err()) {
        return {vault.error(), vault.error_message()};
    }

    auto marker = PublicKey::find_program_address(
        {seed(sdk::constants::NULLIFIER_SEED), pool_address.to_vector(), nullifier}, program_id);
    if (marker.is_err()) {
        return {marker.error(), marker.error_message()};
    }

    static const PublicKey system_program = PublicKey::from_base58(sdk::constants::SYSTEM_PROGRAM_ID).value();

    Instruction ix;
    ix.program_id = program_id;
    ix.accounts = {
        AccountMeta::writable(pool_address),
        AccountMeta::writable(marker.value().first),
        AccountMeta::writable(vault.value().first),
        AccountMeta::writable(recipient),
        AccountMeta::writable(relayer, true),
        AccountMeta::readonly(system_program)
    };

    ix.data = unshield_discriminator();
    ix.data.insert(ix.data.end(), nullifier.begin(), nullifier.end());
    Encoding::append_u64_le(ix.data, amount);
    Encoding::append_u32_le(ix.data, static_cast<uint32_t>(proof.size()));
    ix.data.insert(ix.data.end(), proof.begin(), proof.end());

    return ix;
}

Result<RelayResult> RelaySigner::relay_unshield(const ByteVector& nullifier,
                                                const std::string& recipient,
                                                uint64_t amount,
                                                const ByteVector& proof,
                                                uint64_t denomination) {
    if (!config_.enabled) {
        return {ErrorCode::SERVICE_DISABLED, "Relayer is disabled"};
    }

    if (nullifier.size() != sdk::constants::NULLIFIER_SIZE) {
        return {ErrorCode::INVALID_NULLIFIER, "Invalid nullifier length"};
    }

    auto recipient_key = PublicKey::from_base58(recipient);
    if (recipient_key.is_err()) {
        return {ErrorCode::INVALID_ADDRESS, "Invalid recipient address: " + recipient};
    }

    if (proof.empty()) {
        return {ErrorCode::INVALID_PARAMETER, "Proof is empty"};
    }

    const uint64_t fee = calculate_fee(amount);
    const PublicKey program_id = PublicKey::from_base58(config_.program_id).value();

    auto ix = build_unshield_instruction(program_id, public_key(), nullifier, recipient_key.value(),
                                         amount, proof, denomination);
    if (ix.is_err()) {
        SecureLogger::instance().error("Failed to build unshield instruction: " + ix.error_message());
        return {ErrorCode::INTERNAL_ERROR, "Failed to build unshield instruction"};
    }

    auto signature = submit_instructions({ix.value()});
    if (signature.is_err()) {
        SecureLogger::instance().error("Unshield submission failed: " + signature.error_message());
        if (signature.error() == ErrorCode::CHAIN_REJECTED) {
            return {ErrorCode::CHAIN_REJECTED, "Failed to submit transaction: " + signature.error_message()};
        }
        return {signature.error(), signature.error_message()};
    }

    auto confirmed = confirm(signature.value());
    if (confirmed.is_err()) {
        if (confirmed.error() == ErrorCode::CHAIN_REJECTED) {
            SecureLogger::instance().error("Unshield " + signature.value() + " failed on chain");
            return {ErrorCode::CHAIN_REJECTED, "Unshield transaction failed on chain"};
        }
        // Accepted by the node, so the withdrawal may still land
        SecureLogger::instance().warning("Unshield " + signature.value() +
                                         " not confirmed yet (" + confirmed.error_message() +
                                         "), reporting as submitted");
    }

    SecureLogger::instance().info("Unshield relayed: " + signature.value() + " amount " +
                                  std::to_string(amount) + " fee " + std::to_string(fee));

    RelayResult result;
    result.signature = signature.value();
    result.fee = fee;
    result.amount_sent = amount;
    result.recipient = recipient;
    return result;
}

Result<uint64_t> RelaySigner::get_balance() {
    return rpc_->get_balance(public_key());
}

RelayerInfo RelaySigner::info() {
    RelayerInfo info;
    info.enabled = config_.enabled;
    info.public_key = public_key().to_base58();
    info.fee_bps = config_.fee_bps;

    auto balance = get_balance();
    if (balance.is_ok()) {
        info.balance = balance.value();
    } else {
        SecureLogger::instance().warning("Relayer balance unavailable: " + balance.error_message());
    }
    return info;
}

Result<std::string> RelaySigner::submit_instructions(const std::vector<Instruction>& instructions) {
    auto blockhash = rpc_->get_latest_blockhash();
    if (blockhash.is_err()) {
        return {blockhash.error(), blockhash.error_message()};
    }

    auto transaction = sdk::Transaction::build_signed(*keypair_, instructions, blockhash.value());
    if (transaction.is_err()) {
        return {transaction.error(), transaction.error_message()};
    }

    return rpc_->send_transaction(transaction.value());
}

Result<std::string> RelaySigner::sign_and_submit_provider_transaction(const ByteVector& transaction) {
    auto signed_tx = sdk::Transaction::sign_serialized(transaction, *keypair_);
    if (signed_tx.is_err()) {
        SecureLogger::instance().error("Cannot sign provider transaction: " + signed_tx.error_message());
        return {signed_tx.error(), signed_tx.error_message()};
    }

    return rpc_->send_transaction(signed_tx.value());
}

Result<void> RelaySigner::confirm(const std::string& signature) {
    return rpc_->confirm_transaction(signature, config_.confirmation_timeout);
}

Result<std::string> RelaySigner::send_native(const PublicKey& recipient, uint64_t lamports) {
    return submit_instructions({sdk::Transaction::system_transfer(public_key(), recipient, lamports)});
}

} // namespace relay
} // namespace veilrelay
