#include "veilrelay/relay/AggregatorHttp.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"

namespace veilrelay {
namespace relay {

using sdk::ErrorCode;

namespace {

constexpr size_t MAX_ERROR_BODY = 200;

} // namespace

AggregatorHttp::AggregatorHttp(std::string provider,
                               std::shared_ptr<sdk::HttpTransport> transport,
                               RetryPolicy retry)
    : provider_(std::move(provider)),
      transport_(std::move(transport)),
      retry_(std::move(retry)),
      circuit_breaker_(sdk::constants::CIRCUIT_BREAKER_THRESHOLD,
                       sdk::constants::CIRCUIT_BREAKER_RESET_TIMEOUT,
                       provider_) {
}

Result<JsonResponse> AggregatorHttp::get_json(const std::string& url) {
    sdk::HttpRequest req;
    req.method = "GET";
    req.url = url;
    return request(req);
}

Result<JsonResponse> AggregatorHttp::post_json(const std::string& url, const std::string& body) {
    sdk::HttpRequest req;
    req.method = "POST";
    req.url = url;
    req.body = body;
    req.headers["Content-Type"] = "application/json";
    return request(req);
}

Result<JsonResponse> AggregatorHttp::request(const sdk::HttpRequest& req) {
    return retry_.run<JsonResponse>(provider_ + " API", [&]() {
        return circuit_breaker_.call<JsonResponse>([&]() -> Result<JsonResponse> {
            auto response = transport_->send(req);
            if (response.is_err()) {
                return {response.error(), response.error_message()};
            }

            const sdk::HttpResponse& http = response.value();
            if (!http.ok()) {
                const ErrorCode code = sdk::classify_http_status(http.status);
                std::string message = provider_ + " API error: " + std::to_string(http.status);
                if (code == ErrorCode::AGGREGATOR_REJECTED && !http.body.empty()) {
                    message += " - " + http.body.substr(0, MAX_ERROR_BODY);
                }
                return {code, message};
            }

            auto parsed = sdk::json::parse(http.body);
            if (parsed.is_err()) {
                return {ErrorCode::MALFORMED_RESPONSE, provider_ + " returned invalid JSON"};
            }

            JsonResponse json;
            json.tree = std::move(parsed.value());
            json.text = http.body;
            return json;
        });
    });
}

} // namespace relay
} // namespace veilrelay
