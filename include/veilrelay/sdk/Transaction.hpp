/**
 * @file Transaction.hpp
 * @brief Solana instruction model and wire codec for the transactions the relay signs
 */

#pragma once

#include "veilrelay/sdk/types.hpp"
#include "veilrelay/sdk/PublicKey.hpp"
#include "veilrelay/sdk/Keypair.hpp"
#include <string>
#include <vector>

namespace veilrelay {
namespace sdk {

struct AccountMeta {
    PublicKey pubkey;
    bool is_signer = false;
    bool is_writable = false;

    static AccountMeta writable(const PublicKey& key, bool signer = false) { return {key, signer, true}; }
    static AccountMeta readonly(const PublicKey& key, bool signer = false) { return {key, signer, false}; }
};

struct Instruction {
    PublicKey program_id;
    std::vector<AccountMeta> accounts;
    ByteVector data;
};

/**
 * @brief Builds, signs and inspects transactions
 *
 * Everything the relay builds itself is a legacy message paid for and signed by
 * the custodial key alone. Provider-built transactions may be versioned; for
 * those only the custodial signature slot is filled in.
 */
class Transaction {
public:
    /**
     * @brief Compile a legacy message
     *
     * Accounts are ordered signer-writable, signer-readonly, writable,
     * readonly, with the fee payer first. Flags of repeated keys are merged.
     */
    static Result<ByteVector> compile_message(const PublicKey& fee_payer,
                                              const std::vector<Instruction>& instructions,
                                              const std::string& recent_blockhash);

    /**
     * @brief Compile, sign with the payer and serialize
     */
    static Result<ByteVector> build_signed(const Keypair& payer,
                                           const std::vector<Instruction>& instructions,
                                           const std::string& recent_blockhash);

    /**
     * @brief Insert the signer's signature into a serialized transaction built elsewhere
     *
     * The signer must be one of the message's required signers. Other signature
     * slots are left as they are.
     */
    static Result<ByteVector> sign_serialized(const ByteVector& transaction, const Keypair& signer);

    /**
     * @brief Base58 of the first signature, which is the transaction id
     */
    static Result<std::string> first_signature(const ByteVector& transaction);

    /**
     * @brief System program transfer of native lamports
     */
    static Instruction system_transfer(const PublicKey& from, const PublicKey& to, uint64_t lamports);
};

} // namespace sdk
} // namespace veilrelay
