#include "veilrelay/relay/RaydiumRouter.hpp"
#include "veilrelay/sdk/Encoding.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"
#include <set>

namespace veilrelay {
namespace relay {

using sdk::ErrorCode;
using sdk::SecureLogger;
namespace json = sdk::json;

namespace {

void trim_trailing_slash(std::string& url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
}

// Raydium wraps every answer as {"success": bool, "msg": "...", "data": ...}
bool envelope_succeeded(const json::Tree& tree) {
    auto data = tree.get_child_optional("data");
    return json::get_string(tree, "success") == "true" && data && !json::is_null(*data) &&
           !(data->empty() && data->data().empty());
}

} // namespace

RaydiumRouter::RaydiumRouter(Config config,
                             std::shared_ptr<sdk::HttpTransport> transport,
                             RetryPolicy retry)
    : config_(std::move(config)),
      http_("Raydium", std::move(transport), std::move(retry)),
      token_cache_(config_.token_list_ttl) {
    trim_trailing_slash(config_.api_url);
    trim_trailing_slash(config_.pools_api_url);
}

Result<Quote> RaydiumRouter::get_quote(const std::string& input_mint,
                                       const std::string& output_mint,
                                       uint64_t amount,
                                       uint32_t slippage_bps) {
    const std::string url = config_.api_url + "/compute/swap-base-in?inputMint=" + sdk::url_encode(input_mint) +
                            "&outputMint=" + sdk::url_encode(output_mint) +
                            "&amount=" + std::to_string(amount) +
                            "&slippageBps=" + std::to_string(slippage_bps) +
                            "&txVersion=V0";

    auto response = http_.get_json(url);
    if (response.is_err()) {
        return {response.error(), response.error_message()};
    }

    const json::Tree& tree = response.value().tree;
    if (!envelope_succeeded(tree)) {
        std::string message = json::get_string(tree, "msg");
        if (message.empty()) {
            message = "Raydium quote failed - no route found";
        }
        return {ErrorCode::NO_ROUTE, message};
    }

    const json::Tree& data = tree.get_child("data");

    Quote quote;
    quote.provider = name();
    quote.input_mint = json::get_string(data, "inputMint");
    quote.output_mint = json::get_string(data, "outputMint");
    quote.price_impact_pct = json::get_string(data, "priceImpactPct");
    if (quote.price_impact_pct.empty()) {
        quote.price_impact_pct = "0";
    }
    // The whole envelope is what the transaction endpoint expects back
    quote.raw = response.value().text;

    auto in_amount = json::get_u64(data, "inputAmount");
    auto out_amount = json::get_u64(data, "outputAmount");
    auto threshold = json::get_u64(data, "otherAmountThreshold");
    auto slippage = json::get_u64(data, "slippageBps");
    if (quote.input_mint.empty() || quote.output_mint.empty() ||
        in_amount.is_err() || out_amount.is_err() || threshold.is_err() || slippage.is_err()) {
        SecureLogger::instance().error("Raydium quote response missing fields");
        return {ErrorCode::MALFORMED_RESPONSE, "Raydium quote response is malformed"};
    }

    quote.in_amount = in_amount.value();
    quote.out_amount = out_amount.value();
    quote.other_amount_threshold = threshold.value();
    quote.slippage_bps = static_cast<uint32_t>(slippage.value());

    SecureLogger::instance().info("Raydium quote " + std::to_string(quote.in_amount) + " " + quote.input_mint +
                                  " -> " + std::to_string(quote.out_amount) + " " + quote.output_mint);
    return quote;
}

Result<ByteVector> RaydiumRouter::get_swap_transaction(const Quote& quote,
                                                       const PublicKey& signer,
                                                       const std::optional<PublicKey>& recipient_token_account) {
    if (recipient_token_account) {
        return {ErrorCode::INVALID_PARAMETER, "Raydium cannot route swap output to a third-party account"};
    }
    if (quote.raw.empty()) {
        return {ErrorCode::INVALID_PARAMETER, "Quote carries no provider payload"};
    }

    const std::string body = "{\"computeUnitPriceMicroLamports\":" +
                             json::quote(config_.compute_unit_price_micro_lamports) +
                             ",\"swapResponse\":" + quote.raw +
                             ",\"wallet\":" + json::quote(signer.to_base58()) +
                             ",\"txVersion\":\"V0\""
                             ",\"wrapSol\":true"
                             ",\"unwrapSol\":false}";

    auto response = http_.post_json(config_.api_url + "/transaction/swap-base-in", body);
    if (response.is_err()) {
        return {response.error(), response.error_message()};
    }

    const json::Tree& tree = response.value().tree;
    if (!envelope_succeeded(tree)) {
        std::string message = json::get_string(tree, "msg");
        if (message.empty()) {
            message = "Failed to build Raydium swap transaction";
        }
        return {ErrorCode::AGGREGATOR_REJECTED, message};
    }

    const json::Tree& data = tree.get_child("data");
    if (data.empty()) {
        return {ErrorCode::MALFORMED_RESPONSE, "Raydium swap response has no transaction"};
    }

    if (data.size() > 1) {
        SecureLogger::instance().warning("Raydium returned " + std::to_string(data.size()) +
                                         " transactions, using the first");
    }

    auto transaction = sdk::Encoding::base64_decode(json::get_string(data.front().second, "transaction"));
    if (transaction.is_err() || transaction.value().empty()) {
        return {ErrorCode::MALFORMED_RESPONSE, "Raydium swap response has no transaction"};
    }
    return transaction.value();
}

Result<std::vector<TokenInfo>> RaydiumRouter::get_token_list() {
    return token_cache_.get([this] { return fetch_token_list(); });
}

Result<std::vector<TokenInfo>> RaydiumRouter::fetch_token_list() {
    const std::string& sol = sdk::constants::WRAPPED_SOL_MINT;
    const std::string url = config_.pools_api_url + "/pools/info/mint?mint1=" + sol +
                            "&poolType=all&poolSortField=liquidity&sortType=desc&pageSize=100&page=1";

    auto response = http_.get_json(url);
    if (response.is_err()) {
        return {response.error(), response.error_message()};
    }

    std::vector<TokenInfo> tokens;
    std::set<std::string> seen;

    auto pools = response.value().tree.get_child_optional("data.data");
    if (!pools) {
        return tokens;
    }

    for (const auto& entry : *pools) {
        const json::Tree& pool = entry.second;

        const json::Tree empty;
        const json::Tree& mint_a = pool.get_child("mintA", empty);
        const json::Tree& mint_b = pool.get_child("mintB", empty);
        const json::Tree& other = json::get_string(mint_a, "address") == sol ? mint_b : mint_a;

        TokenInfo info;
        info.address = json::get_string(other, "address");
        info.symbol = json::get_string(other, "symbol");

        if (info.address.empty() || info.symbol.empty() || info.address == sol || seen.count(info.address)) {
            continue;
        }
        seen.insert(info.address);

        info.name = json::get_string(other, "name");
        if (info.name.empty()) {
            info.name = info.symbol;
        }

        auto decimals = json::get_u64(other, "decimals");
        info.decimals = decimals.is_ok() ? static_cast<uint8_t>(decimals.value())
                                         : sdk::constants::DEFAULT_MINT_DECIMALS;

        std::string logo = json::get_string(other, "logoURI");
        if (!logo.empty()) {
            info.logo_uri = logo;
        }
        tokens.push_back(std::move(info));
    }

    SecureLogger::instance().info("Loaded " + std::to_string(tokens.size()) + " Raydium tokens");
    return tokens;
}

} // namespace relay
} // namespace veilrelay
