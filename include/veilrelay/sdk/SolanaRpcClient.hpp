#pragma once

#include "veilrelay/sdk/ChainRpc.hpp"
#include "veilrelay/sdk/HttpClient.hpp"
#include "veilrelay/sdk/CircuitBreaker.hpp"
#include "veilrelay/sdk/Json.hpp"
#include <atomic>
#include <functional>
#include <memory>

namespace veilrelay {
namespace sdk {

/**
 * @brief Solana JSON-RPC 2.0 client
 */
class SolanaRpcClient : public ChainRpc {
public:
    struct Options {
        std::string commitment = "confirmed";
        std::chrono::milliseconds poll_interval = constants::CONFIRMATION_POLL_INTERVAL;
        std::function<void(std::chrono::milliseconds)> sleeper;
    };

    SolanaRpcClient(std::string rpc_url, std::shared_ptr<HttpTransport> transport);
    SolanaRpcClient(std::string rpc_url, std::shared_ptr<HttpTransport> transport, Options options);

    Result<std::optional<AccountInfo>> get_account_info(const PublicKey& account) override;
    Result<uint64_t> get_balance(const PublicKey& account) override;
    Result<std::string> get_latest_blockhash() override;
    Result<std::string> send_transaction(const ByteVector& signed_transaction) override;
    Result<void> confirm_transaction(const std::string& signature,
                                     std::chrono::milliseconds timeout) override;
    Result<uint64_t> get_token_account_balance(const PublicKey& token_account) override;

    const std::string& url() const { return rpc_url_; }

private:
    /**
     * @brief Perform one call and return its "result" node
     * @param params_json JSON array text for "params"
     */
    Result<json::Tree> call(const std::string& method, const std::string& params_json);

    std::string commitment_config() const;

    std::string rpc_url_;
    std::shared_ptr<HttpTransport> transport_;
    Options options_;
    CircuitBreaker circuit_breaker_;
    std::atomic<uint64_t> next_id_{1};
};

} // namespace sdk
} // namespace veilrelay
