/**
 * @file RelaySigner.hpp
 * @brief Custodial relayer key: fees, unshield submission and custodial transfers
 */

#pragma once

#include "veilrelay/sdk/ChainRpc.hpp"
#include "veilrelay/sdk/Keypair.hpp"
#include "veilrelay/sdk/Transaction.hpp"
#include "veilrelay/sdk/constants.hpp"
#include <memory>
#include <string>
#include <vector>

namespace veilrelay {
namespace relay {

using sdk::ByteVector;
using sdk::PublicKey;
using sdk::Result;

struct RelayResult {
    std::string signature;
    uint64_t fee = 0;
    uint64_t amount_sent = 0;   // full requested amount, the fee is accounted off-chain
    std::string recipient;
};

struct RelayerInfo {
    bool enabled = false;
    std::string public_key;
    uint32_t fee_bps = 0;
    uint64_t balance = 0;       // 0 when the balance could not be read
};

/**
 * @brief Signs and submits transactions with the custodial relayer key
 *
 * Every transaction the relay puts on chain goes through here and is signed by
 * this key alone. Nothing partially signed is ever returned.
 */
class RelaySigner {
public:
    struct Config {
        bool enabled = true;
        uint32_t fee_bps = sdk::constants::DEFAULT_FEE_BPS;
        uint64_t min_fee = sdk::constants::MIN_RELAY_FEE_LAMPORTS;
        std::string program_id = sdk::constants::DEFAULT_POOL_PROGRAM_ID;
        std::chrono::milliseconds confirmation_timeout = sdk::constants::CONFIRMATION_TIMEOUT;
    };

    RelaySigner(std::shared_ptr<sdk::Keypair> keypair,
                std::shared_ptr<sdk::ChainRpc> rpc,
                Config config);

    bool is_enabled() const { return config_.enabled; }
    const PublicKey& public_key() const { return keypair_->public_key(); }
    uint32_t fee_bps() const { return config_.fee_bps; }

    /**
     * @brief max(floor(amount * fee_bps / 10000), min_fee)
     */
    uint64_t calculate_fee(uint64_t amount) const;

    /**
     * @brief amount - fee, floored at zero
     */
    uint64_t calculate_amount_after_fee(uint64_t amount) const;

    /**
     * @brief Submit the pool withdrawal for a verified proof
     *
     * An accepted transaction that is not confirmed in time is still reported
     * as success, since the funds may already have moved.
     */
    Result<RelayResult> relay_unshield(const ByteVector& nullifier,
                                       const std::string& recipient,
                                       uint64_t amount,
                                       const ByteVector& proof,
                                       uint64_t denomination);

    Result<uint64_t> get_balance();

    RelayerInfo info();

    /**
     * @brief Sign with a fresh blockhash and send, without waiting for confirmation
     */
    Result<std::string> submit_instructions(const std::vector<sdk::Instruction>& instructions);

    /**
     * @brief Add the custodial signature to a provider-built transaction and send it
     */
    Result<std::string> sign_and_submit_provider_transaction(const ByteVector& transaction);

    Result<void> confirm(const std::string& signature);

    /**
     * @brief Native transfer from the custodial account, sent without waiting for confirmation
     */
    Result<std::string> send_native(const PublicKey& recipient, uint64_t lamports);

    /**
     * @brief The pool program's unshield_sol instruction
     */
    static Result<sdk::Instruction> build_unshield_instruction(const PublicKey& program_id,
                                                               const PublicKey& relayer,
                                                               const ByteVector& nullifier,
                                                               const PublicKey& recipient,
                                                               uint64_t amount,
                                                               const ByteVector& proof,
                                                               uint64_t denomination);

private:
    std::shared_ptr<sdk::Keypair> keypair_;
    std::shared_ptr<sdk::ChainRpc> rpc_;
    Config config_;
};

} // namespace relay
} // namespace veilrelay
