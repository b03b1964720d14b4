#pragma once

#include "veilrelay/sdk/types.hpp"
#include "veilrelay/sdk/constants.hpp"
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <map>
#include <string>

namespace veilrelay {
namespace sdk {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::string body;
    std::map<std::string, std::string> headers;
};

struct HttpResponse {
    int status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Blocking HTTP capability used by the RPC, prover and aggregator clients
 *
 * Transport failures come back as errors. Any response that arrived, whatever
 * its status, comes back as a value so the caller can classify it.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;

    Result<HttpResponse> get(const std::string& url);
    Result<HttpResponse> post_json(const std::string& url, const std::string& body);
};

/**
 * @brief Map a non-2xx HTTP status onto an error code
 *
 * 429 is rate limiting, 5xx is an unavailable upstream, any other status is a
 * rejection of the request itself.
 */
ErrorCode classify_http_status(int status);

/**
 * @brief Components of an http(s) URL
 */
struct ParsedUrl {
    bool tls = true;
    std::string host;
    std::string port;
    std::string target;
};

Result<ParsedUrl> parse_url(const std::string& url);

/**
 * @brief Percent-encode a query parameter value
 */
std::string url_encode(const std::string& value);

/**
 * @brief Boost.Beast HTTP/1.1 client with TLS, SNI and per-request timeouts
 */
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(std::chrono::seconds request_timeout = constants::HTTP_REQUEST_TIMEOUT,
                        std::chrono::seconds connect_timeout = constants::HTTP_CONNECT_TIMEOUT);

    Result<HttpResponse> send(const HttpRequest& request) override;

private:
    Result<HttpResponse> send_plain(const ParsedUrl& url, const HttpRequest& request);
    Result<HttpResponse> send_tls(const ParsedUrl& url, const HttpRequest& request);

    std::chrono::seconds request_timeout_;
    std::chrono::seconds connect_timeout_;
    boost::asio::ssl::context ssl_ctx_;
};

} // namespace sdk
} // namespace veilrelay
