#pragma once

#include "veilrelay/relay/RetryPolicy.hpp"
#include "veilrelay/sdk/CircuitBreaker.hpp"
#include "veilrelay/sdk/HttpClient.hpp"
#include "veilrelay/sdk/Json.hpp"
#include <memory>
#include <string>

namespace veilrelay {
namespace relay {

/**
 * @brief Parsed JSON body together with its original text
 */
struct JsonResponse {
    sdk::json::Tree tree;
    std::string text;
};

/**
 * @brief HTTP plumbing shared by the aggregator clients
 *
 * Each request runs under the retry policy, and each attempt under the
 * provider's circuit breaker. Non-2xx answers are classified by status.
 */
class AggregatorHttp {
public:
    AggregatorHttp(std::string provider,
                   std::shared_ptr<sdk::HttpTransport> transport,
                   RetryPolicy retry);

    Result<JsonResponse> get_json(const std::string& url);
    Result<JsonResponse> post_json(const std::string& url, const std::string& body);

    sdk::CircuitBreaker& circuit_breaker() { return circuit_breaker_; }

private:
    Result<JsonResponse> request(const sdk::HttpRequest& request);

    std::string provider_;
    std::shared_ptr<sdk::HttpTransport> transport_;
    RetryPolicy retry_;
    sdk::CircuitBreaker circuit_breaker_;
};

} // namespace relay
} // namespace veilrelay
