#include "veilrelay/relay/ProofGenerator.hpp"
#include "veilrelay/sdk/Encoding.hpp"
#include "veilrelay/sdk/Json.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"

namespace veilrelay {
namespace relay {

using sdk::ErrorCode;
using sdk::SecureLogger;
namespace json = sdk::json;

RemoteProverClient::RemoteProverClient(std::string prover_url, std::shared_ptr<sdk::HttpTransport> transport)
    : prover_url_(std::move(prover_url)), transport_(std::move(transport)) {
    while (!prover_url_.empty() && prover_url_.back() == '/') {
        prover_url_.pop_back();
    }
}

Result<ProofResult> RemoteProverClient::generate_proof(const ProofJobParams& params) {
    if (sdk::Encoding::hex_decode(params.commitment).is_err()) {
        return {ErrorCode::INVALID_PARAMETER, "Invalid hex encoding for commitment"};
    }
    if (sdk::Encoding::hex_decode(params.secret).is_err()) {
        return {ErrorCode::INVALID_PARAMETER, "Invalid hex encoding for secret"};
    }

    const std::string body =
        "{\"commitment\":" + json::quote(params.commitment) +
        ",\"secret\":" + json::quote(params.secret) +
        ",\"amount\":" + std::to_string(params.amount) +
        ",\"recipient\":" + json::quote(params.recipient) +
        ",\"denomination\":" + std::to_string(params.denomination) + "}";

    auto response = transport_->post_json(prover_url_ + "/prove", body);
    if (response.is_err()) {
        return {response.error(), "Prover unreachable: " + response.error_message()};
    }

    auto parsed = json::parse(response.value().body);

    if (!response.value().ok()) {
        const int status = response.value().status;
        std::string message = parsed.is_ok() ? json::get_string(parsed.value(), "error") : "";

        // 4xx means the prover refused these inputs, which is reportable as is
        if (status >= 400 && status < 500 && !message.empty()) {
            return {ErrorCode::PROOF_GENERATION_FAILED, message};
        }
        return {sdk::classify_http_status(status), "Prover returned HTTP " + std::to_string(status)};
    }

    if (parsed.is_err()) {
        return {ErrorCode::MALFORMED_RESPONSE, "Prover returned invalid JSON"};
    }

    const json::Tree& tree = parsed.value();
    ProofResult result;

    auto proof = sdk::Encoding::hex_decode(json::get_string(tree, "proof"));
    auto nullifier = sdk::Encoding::hex_decode(json::get_string(tree, "nullifier"));
    if (proof.is_err() || nullifier.is_err()) {
        return {ErrorCode::MALFORMED_RESPONSE, "Prover response has malformed proof or nullifier"};
    }
    result.proof = std::move(proof.value());
    result.nullifier = std::move(nullifier.value());

    if (auto inputs = tree.get_child_optional("publicInputs")) {
        for (const auto& entry : *inputs) {
            result.public_inputs[entry.first] = entry.second.data();
        }
    }
    result.verified = json::get_string(tree, "verified") != "false";

    SecureLogger::instance().debug("Prover returned " + std::to_string(result.proof.size()) + "-byte proof");
    return result;
}

} // namespace relay
} // namespace veilrelay
