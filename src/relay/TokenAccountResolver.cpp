#include "veilrelay/relay/TokenAccountResolver.hpp"
#include "veilrelay/sdk/Encoding.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"

namespace veilrelay {
namespace relay {

using sdk::AccountMeta;
using sdk::ErrorCode;
using sdk::Instruction;
using sdk::SecureLogger;

namespace {

constexpr uint8_t TRANSFER_OPCODE = 3;
constexpr uint8_t TRANSFER_CHECKED_OPCODE = 12;

const PublicKey& well_known(const std::string& address) {
    // Only ever called with the constants below, which are valid
    static const PublicKey token = PublicKey::from_base58(sdk::constants::TOKEN_PROGRAM_ID).value();
    static const PublicKey token_2022 = PublicKey::from_base58(sdk::constants::TOKEN_2022_PROGRAM_ID).value();
    static const PublicKey ata = PublicKey::from_base58(sdk::constants::ASSOCIATED_TOKEN_PROGRAM_ID).value();
    static const PublicKey system = PublicKey::from_base58(sdk::constants::SYSTEM_PROGRAM_ID).value();

    if (address == sdk::constants::TOKEN_2022_PROGRAM_ID) return token_2022;
    if (address == sdk::constants::ASSOCIATED_TOKEN_PROGRAM_ID) return ata;
    if (address == sdk::constants::SYSTEM_PROGRAM_ID) return system;
    return token;
}

} // namespace

const PublicKey& token_program_id(TokenProgram program) {
    return program == TokenProgram::EXTENDED ? well_known(sdk::constants::TOKEN_2022_PROGRAM_ID)
                                             : well_known(sdk::constants::TOKEN_PROGRAM_ID);
}

TokenAccountResolver::TokenAccountResolver(std::shared_ptr<sdk::ChainRpc> rpc,
                                           std::shared_ptr<RelaySigner> signer)
    : rpc_(std::move(rpc)), signer_(std::move(signer)) {
    if (!rpc_ || !signer_) {
        throw std::invalid_argument("TokenAccountResolver requires an RPC client and a signer");
    }
}

TokenProgram TokenAccountResolver::detect_token_program(const PublicKey& mint) {
    auto account = rpc_->get_account_info(mint);
    if (account.is_err()) {
        SecureLogger::instance().warning("Mint lookup failed for " + mint.to_base58() + ": " +
                                         account.error_message() + ", assuming standard token program");
        return TokenProgram::STANDARD;
    }
    if (!account.value()) {
        SecureLogger::instance().warning("Mint " + mint.to_base58() + " not found, assuming standard token program");
        return TokenProgram::STANDARD;
    }

    if (account.value()->owner == token_program_id(TokenProgram::EXTENDED)) {
        return TokenProgram::EXTENDED;
    }
    return TokenProgram::STANDARD;
}

uint8_t TokenAccountResolver::detect_mint_decimals(const PublicKey& mint) {
    auto account = rpc_->get_account_info(mint);
    if (account.is_err() || !account.value() ||
        account.value()->data.size() <= sdk::constants::MINT_DECIMALS_OFFSET) {
        SecureLogger::instance().warning("Cannot read decimals of " + mint.to_base58() + ", using default");
        return sdk::constants::DEFAULT_MINT_DECIMALS;
    }
    return account.value()->data[sdk::constants::MINT_DECIMALS_OFFSET];
}

Result<PublicKey> TokenAccountResolver::derive_account(const PublicKey& owner,
                                                       const PublicKey& mint,
                                                       TokenProgram program) {
    auto address = PublicKey::find_program_address(
        {owner.to_vector(), token_program_id(program).to_vector(), mint.to_vector()},
        well_known(sdk::constants::ASSOCIATED_TOKEN_PROGRAM_ID));
    if (address.is_err()) {
        return {address.error(), address.error_message()};
    }
    return address.value().first;
}

Instruction TokenAccountResolver::build_create_account_instruction(const PublicKey& payer,
                                                                   const PublicKey& account,
                                                                   const PublicKey& owner,
                                                                   const PublicKey& mint,
                                                                   TokenProgram program) {
    Instruction ix;
    ix.program_id = well_known(sdk::constants::ASSOCIATED_TOKEN_PROGRAM_ID);
    ix.accounts = {
        AccountMeta::writable(payer, true),
        AccountMeta::writable(account),
        AccountMeta::readonly(owner),
        AccountMeta::readonly(mint),
        AccountMeta::readonly(well_known(sdk::constants::SYSTEM_PROGRAM_ID)),
        AccountMeta::readonly(token_program_id(program))
    };
    return ix;
}

Result<bool> TokenAccountResolver::ensure_account_exists(const PublicKey& owner,
                                                         const PublicKey& mint,
                                                         TokenProgram program) {
    auto account = derive_account(owner, mint, program);
    if (account.is_err()) {
        return {account.error(), account.error_message()};
    }

    auto existing = rpc_->get_account_info(account.value());
    if (existing.is_err()) {
        return {existing.error(), existing.error_message()};
    }
    if (existing.value()) {
        return false;
    }

    SecureLogger::instance().info("Creating " + to_string(program) + " account " + account.value().to_base58() +
                                  " for " + owner.to_base58());

    auto signature = signer_->submit_instructions(
        {build_create_account_instruction(signer_->public_key(), account.value(), owner, mint, program)});
    if (signature.is_err()) {
        return {signature.error(), signature.error_message()};
    }

    auto confirmed = signer_->confirm(signature.value());
    if (confirmed.is_err()) {
        return {confirmed.error(), confirmed.error_message()};
    }
    return true;
}

Instruction TokenAccountResolver::build_transfer_instruction(const PublicKey& source,
                                                             const PublicKey& destination,
                                                             const PublicKey& authority,
                                                             uint64_t amount,
                                                             TokenProgram program,
                                                             const PublicKey& mint,
                                                             uint8_t decimals) {
    Instruction ix;
    ix.program_id = token_program_id(program);

    if (program == TokenProgram::EXTENDED) {
        ix.accounts = {
            AccountMeta::writable(source),
            AccountMeta::readonly(mint),
            AccountMeta::writable(destination),
            AccountMeta::readonly(authority, true)
        };
        ix.data.push_back(TRANSFER_CHECKED_OPCODE);
        sdk::Encoding::append_u64_le(ix.data, amount);
        ix.data.push_back(decimals);
    } else {
        ix.accounts = {
            AccountMeta::writable(source),
            AccountMeta::writable(destination),
            AccountMeta::readonly(authority, true)
        };
        ix.data.push_back(TRANSFER_OPCODE);
        sdk::Encoding::append_u64_le(ix.data, amount);
    }
    return ix;
}

} // namespace relay
} // namespace veilrelay
