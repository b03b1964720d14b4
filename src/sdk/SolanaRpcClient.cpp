#include "veilrelay/sdk/SolanaRpcClient.hpp"
#include "veilrelay/sdk/Encoding.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"
#include <thread>

namespace veilrelay {
namespace sdk {

namespace {

// JSON-RPC error codes the node uses for a failed preflight and a missing account
constexpr int RPC_SEND_TRANSACTION_PREFLIGHT_FAILURE = -32002;
constexpr int RPC_INVALID_PARAMS = -32602;

} // namespace

SolanaRpcClient::SolanaRpcClient(std::string rpc_url, std::shared_ptr<HttpTransport> transport)
    : SolanaRpcClient(std::move(rpc_url), std::move(transport), Options()) {
}

SolanaRpcClient::SolanaRpcClient(std::string rpc_url, std::shared_ptr<HttpTransport> transport, Options options)
    : rpc_url_(std::move(rpc_url)),
      transport_(std::move(transport)),
      options_(std::move(options)),
      circuit_breaker_(constants::CIRCUIT_BREAKER_THRESHOLD, constants::CIRCUIT_BREAKER_RESET_TIMEOUT, "solana-rpc") {
    if (!options_.sleeper) {
        options_.sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

std::string SolanaRpcClient::commitment_config() const {
    return "{\"commitment\":" + json::quote(options_.commitment) + "}";
}

Result<json::Tree> SolanaRpcClient::call(const std::string& method, const std::string& params_json) {
    const uint64_t id = next_id_++;
    const std::string body = "{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id) +
                             ",\"method\":" + json::quote(method) +
                             ",\"params\":" + params_json + "}";

    return circuit_breaker_.call<json::Tree>([&]() -> Result<json::Tree> {
        auto response = transport_->post_json(rpc_url_, body);
        if (response.is_err()) {
            SecureLogger::instance().warning("RPC " + method + " transport failure: " + response.error_message());
            return {response.error(), response.error_message()};
        }

        const HttpResponse& http = response.value();
        if (!http.ok()) {
            ErrorCode code = classify_http_status(http.status);
            if (code == ErrorCode::AGGREGATOR_REJECTED) {
                code = ErrorCode::RPC_ERROR;
            }
            return {code, "RPC " + method + " returned HTTP " + std::to_string(http.status)};
        }

        auto parsed = json::parse(http.body);
        if (parsed.is_err()) {
            return {ErrorCode::RPC_ERROR, "RPC " + method + " returned invalid JSON"};
        }

        const json::Tree& tree = parsed.value();
        if (auto error = tree.get_child_optional("error")) {
            const std::string message = json::get_string(*error, "message");
            const int code = error->get<int>("code", 0);

            if (method == "sendTransaction" && code == RPC_SEND_TRANSACTION_PREFLIGHT_FAILURE) {
                return {ErrorCode::CHAIN_REJECTED, message};
            }
            if (code == RPC_INVALID_PARAMS && message.find("could not find account") != std::string::npos) {
                return {ErrorCode::ACCOUNT_NOT_FOUND, message};
            }
            return {ErrorCode::RPC_ERROR, "RPC " + method + " error " + std::to_string(code) + ": " + message};
        }

        auto result = tree.get_child_optional("result");
        if (!result) {
            return {ErrorCode::RPC_ERROR, "RPC " + method + " response has no result"};
        }
        return *result;
    });
}

Result<std::optional<AccountInfo>> SolanaRpcClient::get_account_info(const PublicKey& account) {
    const std::string params = "[" + json::quote(account.to_base58()) +
                               ",{\"encoding\":\"base64\",\"commitment\":" + json::quote(options_.commitment) + "}]";

    auto result = call("getAccountInfo", params);
    if (result.is_err()) {
        return {result.error(), result.error_message()};
    }

    auto value = result.value().get_child_optional("value");
    if (!value || json::is_null(*value)) {
        return std::optional<AccountInfo>();
    }

    AccountInfo info;

    auto owner = PublicKey::from_base58(json::get_string(*value, "owner"));
    if (owner.is_err()) {
        return {ErrorCode::RPC_ERROR, "Account owner is not a valid address"};
    }
    info.owner = owner.value();

    auto lamports = json::get_u64(*value, "lamports");
    if (lamports.is_err()) {
        return {ErrorCode::RPC_ERROR, lamports.error_message()};
    }
    info.lamports = lamports.value();
    info.executable = json::get_string(*value, "executable") == "true";

    // data is ["<base64>", "base64"]
    auto data = value->get_child_optional("data");
    if (data && !data->empty()) {
        auto decoded = Encoding::base64_decode(data->front().second.data());
        if (decoded.is_err()) {
            return {ErrorCode::RPC_ERROR, "Account data is not valid base64"};
        }
        info.data = std::move(decoded.value());
    }

    return std::optional<AccountInfo>(std::move(info));
}

Result<uint64_t> SolanaRpcClient::get_balance(const PublicKey& account) {
    auto result = call("getBalance", "[" + json::quote(account.to_base58()) + "," + commitment_config() + "]");
    if (result.is_err()) {
        return {result.error(), result.error_message()};
    }

    auto lamports = json::get_u64(result.value(), "value");
    if (lamports.is_err()) {
        return {ErrorCode::RPC_ERROR, lamports.error_message()};
    }
    return lamports.value();
}

Result<std::string> SolanaRpcClient::get_latest_blockhash() {
    auto result = call("getLatestBlockhash", "[" + commitment_config() + "]");
    if (result.is_err()) {
        return {result.error(), result.error_message()};
    }

    std::string blockhash = json::get_string(result.value(), "value.blockhash");
    if (blockhash.empty()) {
        return {ErrorCode::RPC_ERROR, "getLatestBlockhash returned no blockhash"};
    }
    return blockhash;
}

Result<std::string> SolanaRpcClient::send_transaction(const ByteVector& signed_transaction) {
    const std::string params = "[" + json::quote(Encoding::base64_encode(signed_transaction)) +
                               ",{\"encoding\":\"base64\",\"skipPreflight\":false,\"preflightCommitment\":" +
                               json::quote(options_.commitment) + "}]";

    auto result = call("sendTransaction", params);
    if (result.is_err()) {
        if (result.error() == ErrorCode::CHAIN_REJECTED) {
            SecureLogger::instance().warning("Transaction rejected in preflight: " + result.error_message());
        }
        return {result.error(), result.error_message()};
    }

    std::string signature = result.value().data();
    if (signature.empty()) {
        return {ErrorCode::RPC_ERROR, "sendTransaction returned no signature"};
    }
    return signature;
}

Result<void> SolanaRpcClient::confirm_transaction(const std::string& signature,
                                                  std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const std::string params = "[[" + json::quote(signature) + "],{\"searchTransactionHistory\":true}]";

    while (true) {
        auto result = call("getSignatureStatuses", params);
        if (result.is_ok()) {
            auto value = result.value().get_child_optional("value");
            if (value && !value->empty()) {
                const json::Tree& status = value->front().second;
                if (!json::is_null(status)) {
                    auto err = status.get_child_optional("err");
                    if (err && !json::is_null(*err)) {
                        return {ErrorCode::CHAIN_REJECTED, "Transaction " + signature + " failed on chain"};
                    }

                    const std::string level = json::get_string(status, "confirmationStatus");
                    if (level == "confirmed" || level == "finalized") {
                        return {};
                    }
                }
            }
        } else {
            SecureLogger::instance().debug("Signature status poll failed: " + result.error_message());
        }

        if (std::chrono::steady_clock::now() + options_.poll_interval > deadline) {
            break;
        }
        options_.sleeper(options_.poll_interval);
    }

    return {ErrorCode::CONFIRMATION_TIMEOUT, "Transaction " + signature + " not confirmed in time"};
}

Result<uint64_t> SolanaRpcClient::get_token_account_balance(const PublicKey& token_account) {
    auto result = call("getTokenAccountBalance",
                       "[" + json::quote(token_account.to_base58()) + "," + commitment_config() + "]");
    if (result.is_err()) {
        return {result.error(), result.error_message()};
    }

    auto amount = json::get_u64(result.value(), "value.amount");
    if (amount.is_err()) {
        return {ErrorCode::RPC_ERROR, amount.error_message()};
    }
    return amount.value();
}

} // namespace sdk
} // namespace veilrelay
