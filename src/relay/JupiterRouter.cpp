#include "veilrelay/relay/JupiterRouter.hpp"
#include "veilrelay/sdk/Encoding.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"

namespace veilrelay {
namespace relay {

using sdk::ErrorCode;
using sdk::SecureLogger;
namespace json = sdk::json;

namespace {

bool is_no_route_message(const std::string& message) {
    return message.find("COULD_NOT_FIND_ANY_ROUTE") != std::string::npos ||
           message.find("NO_ROUTES_FOUND") != std::string::npos ||
           message.find("No routes found") != std::string::npos;
}

} // namespace

JupiterRouter::JupiterRouter(Config config,
                             std::shared_ptr<sdk::HttpTransport> transport,
                             RetryPolicy retry)
    : config_(std::move(config)),
      http_("Jupiter", std::move(transport), std::move(retry)),
      token_cache_(config_.token_list_ttl) {
    while (!config_.api_url.empty() && config_.api_url.back() == '/') {
        config_.api_url.pop_back();
    }
}

Result<Quote> JupiterRouter::get_quote(const std::string& input_mint,
                                       const std::string& output_mint,
                                       uint64_t amount,
                                       uint32_t slippage_bps) {
    const std::string url = config_.api_url + "/quote?inputMint=" + sdk::url_encode(input_mint) +
                            "&outputMint=" + sdk::url_encode(output_mint) +
                            "&amount=" + std::to_string(amount) +
                            "&slippageBps=" + std::to_string(slippage_bps) +
                            "&restrictIntermediateTokens=true";

    auto response = http_.get_json(url);
    if (response.is_err()) {
        if (response.error() == ErrorCode::AGGREGATOR_REJECTED && is_no_route_message(response.error_message())) {
            return {ErrorCode::NO_ROUTE, "No swap route found from " + input_mint + " to " + output_mint};
        }
        return {response.error(), response.error_message()};
    }

    const json::Tree& tree = response.value().tree;

    Quote quote;
    quote.provider = name();
    quote.input_mint = json::get_string(tree, "inputMint");
    quote.output_mint = json::get_string(tree, "outputMint");
    quote.price_impact_pct = json::get_string(tree, "priceImpactPct");
    if (quote.price_impact_pct.empty()) {
        quote.price_impact_pct = "0";
    }
    quote.raw = response.value().text;

    auto in_amount = json::get_u64(tree, "inAmount");
    auto out_amount = json::get_u64(tree, "outAmount");
    auto threshold = json::get_u64(tree, "otherAmountThreshold");
    auto slippage = json::get_u64(tree, "slippageBps");
    if (quote.input_mint.empty() || quote.output_mint.empty() ||
        in_amount.is_err() || out_amount.is_err() || threshold.is_err() || slippage.is_err()) {
        SecureLogger::instance().error("Jupiter quote response missing fields");
        return {ErrorCode::MALFORMED_RESPONSE, "Jupiter quote response is malformed"};
    }

    quote.in_amount = in_amount.value();
    quote.out_amount = out_amount.value();
    quote.other_amount_threshold = threshold.value();
    quote.slippage_bps = static_cast<uint32_t>(slippage.value());

    if (quote.out_amount == 0) {
        return {ErrorCode::NO_ROUTE, "Jupiter quote has no output"};
    }

    SecureLogger::instance().info("Jupiter quote " + std::to_string(quote.in_amount) + " " + quote.input_mint +
                                  " -> " + std::to_string(quote.out_amount) + " " + quote.output_mint);
    return quote;
}

Result<ByteVector> JupiterRouter::get_swap_transaction(const Quote& quote,
                                                       const PublicKey& signer,
                                                       const std::optional<PublicKey>& recipient_token_account) {
    if (quote.raw.empty()) {
        return {ErrorCode::INVALID_PARAMETER, "Quote carries no provider payload"};
    }

    std::string body = "{\"quoteResponse\":" + quote.raw +
                       ",\"userPublicKey\":" + json::quote(signer.to_base58()) +
                       ",\"wrapAndUnwrapSol\":true"
                       ",\"dynamicComputeUnitLimit\":true"
                       ",\"dynamicSlippage\":true"
                       ",\"prioritizationFeeLamports\":{\"priorityLevelWithMaxLamports\":{\"maxLamports\":" +
                       std::to_string(config_.max_priority_fee_lamports) +
                       ",\"priorityLevel\":" + json::quote(config_.priority_level) + "}}";
    if (recipient_token_account) {
        body += ",\"destinationTokenAccount\":" + json::quote(recipient_token_account->to_base58());
    }
    body += "}";

    auto response = http_.post_json(config_.api_url + "/swap", body);
    if (response.is_err()) {
        return {response.error(), response.error_message()};
    }

    const json::Tree& tree = response.value().tree;

    auto simulation_error = tree.get_child_optional("simulationError");
    if (simulation_error && !json::is_null(*simulation_error)) {
        std::string detail = simulation_error->empty() ? simulation_error->data()
                                                       : json::get_string(*simulation_error, "error");
        SecureLogger::instance().warning("Jupiter swap simulation failed: " + detail);
        return {ErrorCode::SIMULATION_FAILED, "Swap simulation failed: " + detail};
    }

    auto transaction = sdk::Encoding::base64_decode(json::get_string(tree, "swapTransaction"));
    if (transaction.is_err() || transaction.value().empty()) {
        return {ErrorCode::MALFORMED_RESPONSE, "Jupiter swap response has no transaction"};
    }
    return transaction.value();
}

Result<std::vector<TokenInfo>> JupiterRouter::get_token_list() {
    return token_cache_.get([this] { return fetch_token_list(); });
}

Result<std::vector<TokenInfo>> JupiterRouter::fetch_token_list() {
    auto response = http_.get_json(config_.token_list_url);
    if (response.is_err()) {
        return {response.error(), response.error_message()};
    }

    std::vector<TokenInfo> tokens;
    for (const auto& entry : response.value().tree) {
        const json::Tree& token = entry.second;

        TokenInfo info;
        info.address = json::get_string(token, "address");
        info.symbol = json::get_string(token, "symbol");
        info.name = json::get_string(token, "name");
        if (info.address.empty()) {
            continue;
        }

        auto decimals = json::get_u64(token, "decimals");
        info.decimals = decimals.is_ok() ? static_cast<uint8_t>(decimals.value())
                                         : sdk::constants::DEFAULT_MINT_DECIMALS;

        std::string logo = json::get_string(token, "logoURI");
        if (!logo.empty()) {
            info.logo_uri = logo;
        }
        tokens.push_back(std::move(info));
    }

    SecureLogger::instance().info("Loaded " + std::to_string(tokens.size()) + " Jupiter tokens");
    return tokens;
}

} // namespace relay
} // namespace veilrelay
