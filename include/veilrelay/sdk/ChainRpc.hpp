#pragma once

#include "veilrelay/sdk/types.hpp"
#include "veilrelay/sdk/PublicKey.hpp"
#include <optional>
#include <string>

namespace veilrelay {
namespace sdk {

struct AccountInfo {
    PublicKey owner;
    ByteVector data;
    uint64_t lamports = 0;
    bool executable = false;
};

/**
 * @brief Chain access used by the relay, at "confirmed" commitment
 */
class ChainRpc {
public:
    virtual ~ChainRpc() = default;

    // nullopt when the account does not exist
    virtual Result<std::optional<AccountInfo>> get_account_info(const PublicKey& account) = 0;

    virtual Result<uint64_t> get_balance(const PublicKey& account) = 0;

    virtual Result<std::string> get_latest_blockhash() = 0;

    /**
     * @brief Submit a signed transaction with preflight checks
     * @return The transaction signature
     */
    virtual Result<std::string> send_transaction(const ByteVector& signed_transaction) = 0;

    /**
     * @brief Wait until the signature reaches "confirmed" or the timeout passes
     *
     * CHAIN_REJECTED when the transaction landed with an error,
     * CONFIRMATION_TIMEOUT when it was not seen in time.
     */
    virtual Result<void> confirm_transaction(const std::string& signature,
                                             std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Raw token amount held by a token account
     */
    virtual Result<uint64_t> get_token_account_balance(const PublicKey& token_account) = 0;
};

} // namespace sdk
} // namespace veilrelay
