/**
 * @file TokenAccountResolver.hpp
 * @brief Token program detection, associated token accounts and token transfers
 */

#pragma once

#include "veilrelay/relay/RelaySigner.hpp"
#include "veilrelay/sdk/ChainRpc.hpp"
#include "veilrelay/sdk/Transaction.hpp"
#include <memory>

namespace veilrelay {
namespace relay {

enum class TokenProgram {
    STANDARD,   // original token program
    EXTENDED    // Token-2022
};

inline std::string to_string(TokenProgram program) {
    return program == TokenProgram::EXTENDED ? "token-2022" : "token";
}

const PublicKey& token_program_id(TokenProgram program);

/**
 * @brief Resolves where a mint's tokens live for an owner and how to move them
 *
 * Account creation is paid for and signed by the custodial key.
 */
class TokenAccountResolver {
public:
    TokenAccountResolver(std::shared_ptr<sdk::ChainRpc> rpc,
                         std::shared_ptr<RelaySigner> signer);

    /**
     * @brief Program owning the mint; STANDARD when the lookup fails
     */
    TokenProgram detect_token_program(const PublicKey& mint);

    /**
     * @brief Decimals stored in the mint account, 9 when unreadable
     */
    uint8_t detect_mint_decimals(const PublicKey& mint);

    /**
     * @brief Associated token account of owner for mint, no network access
     */
    static Result<PublicKey> derive_account(const PublicKey& owner,
                                            const PublicKey& mint,
                                            TokenProgram program);

    /**
     * @brief Create the associated token account when missing
     * @return true when an account was created, false when it already existed
     */
    Result<bool> ensure_account_exists(const PublicKey& owner,
                                       const PublicKey& mint,
                                       TokenProgram program);

    /**
     * @brief Token transfer; EXTENDED uses the checked form carrying mint and decimals
     */
    static sdk::Instruction build_transfer_instruction(const PublicKey& source,
                                                       const PublicKey& destination,
                                                       const PublicKey& authority,
                                                       uint64_t amount,
                                                       TokenProgram program,
                                                       const PublicKey& mint,
                                                       uint8_t decimals);

    static sdk::Instruction build_create_account_instruction(const PublicKey& payer,
                                                             const PublicKey& account,
                                                             const PublicKey& owner,
                                                             const PublicKey& mint,
                                                             TokenProgram program);

private:
    std::shared_ptr<sdk::ChainRpc> rpc_;
    std::shared_ptr<RelaySigner> signer_;
};

} // namespace relay
} // namespace veilrelay
