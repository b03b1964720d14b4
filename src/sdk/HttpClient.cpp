#include "veilrelay/sdk/HttpClient.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace veilrelay {
namespace sdk {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

const std::string USER_AGENT = "veilrelay/" BOOST_BEAST_VERSION_STRING;

ErrorCode classify_transport_error(const beast::error_code& ec) {
    if (ec == beast::error::timeout || ec == net::error::timed_out) {
        return ErrorCode::CONNECTION_TIMEOUT;
    }
    if (ec.category() == net::error::get_ssl_category() ||
        ec == ssl::error::stream_truncated) {
        return ErrorCode::SSL_ERROR;
    }
    return ErrorCode::NETWORK_ERROR;
}

http::verb to_verb(const std::string& method) {
    http::verb verb = http::string_to_verb(method);
    return verb == http::verb::unknown ? http::verb::get : verb;
}

template<typename Stream>
Result<HttpResponse> exchange(Stream& stream, const ParsedUrl& url, const HttpRequest& request,
                              beast::tcp_stream& timer_stream, std::chrono::seconds timeout) {
    http::request<http::string_body> req{to_verb(request.method), url.target, 11};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, USER_AGENT);
    req.set(http::field::accept, "application/json");
    for (const auto& header : request.headers) {
        req.set(header.first, header.second);
    }
    if (!request.body.empty() || req.method() == http::verb::post) {
        if (req.find(http::field::content_type) == req.end()) {
            req.set(http::field::content_type, "application/json");
        }
        req.body() = request.body;
        req.prepare_payload();
    }

    beast::error_code ec;

    timer_stream.expires_after(timeout);
    http::write(stream, req, ec);
    if (ec) {
        return {classify_transport_error(ec), "HTTP write failed: " + ec.message()};
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(constants::MAX_HTTP_RESPONSE_SIZE);

    timer_stream.expires_after(timeout);
    http::read(stream, buffer, parser, ec);
    if (ec) {
        return {classify_transport_error(ec), "HTTP read failed: " + ec.message()};
    }

    HttpResponse response;
    response.status = static_cast<int>(parser.get().result_int());
    response.body = parser.get().body();
    return response;
}

} // namespace

Result<HttpResponse> HttpTransport::get(const std::string& url) {
    HttpRequest request;
    request.method = "GET";
    request.url = url;
    return send(request);
}

Result<HttpResponse> HttpTransport::post_json(const std::string& url, const std::string& body) {
    HttpRequest request;
    request.method = "POST";
    request.url = url;
    request.body = body;
    request.headers["Content-Type"] = "application/json";
    return send(request);
}

ErrorCode classify_http_status(int status) {
    if (status >= 200 && status < 300) {
        return ErrorCode::SUCCESS;
    }
    if (status == 429) {
        return ErrorCode::RATE_LIMITED;
    }
    if (status >= 500) {
        return ErrorCode::UPSTREAM_UNAVAILABLE;
    }
    return ErrorCode::AGGREGATOR_REJECTED;
}

Result<ParsedUrl> parse_url(const std::string& url) {
    ParsedUrl parsed;

    std::string rest;
    if (url.rfind("https://", 0) == 0) {
        parsed.tls = true;
        rest = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        parsed.tls = false;
        rest = url.substr(7);
    } else {
        return {ErrorCode::INVALID_PARAMETER, "Unsupported URL scheme: " + url};
    }

    auto path_pos = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_pos);
    parsed.target = path_pos == std::string::npos ? "/" : rest.substr(path_pos);
    if (!parsed.target.empty() && parsed.target[0] == '?') {
        parsed.target = "/" + parsed.target;
    }

    auto port_pos = authority.rfind(':');
    if (port_pos != std::string::npos) {
        parsed.host = authority.substr(0, port_pos);
        parsed.port = authority.substr(port_pos + 1);
    } else {
        parsed.host = authority;
        parsed.port = parsed.tls ? "443" : "80";
    }

    if (parsed.host.empty() || parsed.port.empty() ||
        parsed.port.find_first_not_of("0123456789") != std::string::npos) {
        return {ErrorCode::INVALID_PARAMETER, "Malformed URL: " + url};
    }

    return parsed;
}

std::string url_encode(const std::string& value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return encoded.str();
}

HttpClient::HttpClient(std::chrono::seconds request_timeout, std::chrono::seconds connect_timeout)
    : request_timeout_(request_timeout),
      connect_timeout_(connect_timeout),
      ssl_ctx_(ssl::context::tls_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
    ssl_ctx_.set_options(ssl::context::default_workarounds |
                         ssl::context::no_sslv2 |
                         ssl::context::no_sslv3 |
                         ssl::context::no_tlsv1 |
                         ssl::context::no_tlsv1_1);
}

Result<HttpResponse> HttpClient::send(const HttpRequest& request) {
    auto url = parse_url(request.url);
    if (url.is_err()) {
        return {url.error(), url.error_message()};
    }

    try {
        return url.value().tls ? send_tls(url.value(), request)
                               : send_plain(url.value(), request);
    } catch (const std::exception& e) {
        SecureLogger::instance().error("HTTP " + request.method + " to " + url.value().host +
                                       " failed: " + e.what());
        return {ErrorCode::NETWORK_ERROR, std::string("HTTP request failed: ") + e.what()};
    }
}

Result<HttpResponse> HttpClient::send_plain(const ParsedUrl& url, const HttpRequest& request) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    auto endpoints = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        return {ErrorCode::NETWORK_ERROR, "Failed to resolve " + url.host + ": " + ec.message()};
    }

    stream.expires_after(connect_timeout_);
    stream.connect(endpoints, ec);
    if (ec) {
        return {classify_transport_error(ec), "Failed to connect to " + url.host + ": " + ec.message()};
    }

    auto response = exchange(stream, url, request, stream, request_timeout_);

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return response;
}

Result<HttpResponse> HttpClient::send_tls(const ParsedUrl& url, const HttpRequest& request) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx_);
    beast::error_code ec;

    // SNI is required by most hosted endpoints
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        return {ErrorCode::SSL_ERROR, "Failed to set SNI host name for " + url.host};
    }
    stream.set_verify_callback(ssl::host_name_verification(url.host));

    auto endpoints = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        return {ErrorCode::NETWORK_ERROR, "Failed to resolve " + url.host + ": " + ec.message()};
    }

    auto& lowest = beast::get_lowest_layer(stream);
    lowest.expires_after(connect_timeout_);
    lowest.connect(endpoints, ec);
    if (ec) {
        return {classify_transport_error(ec), "Failed to connect to " + url.host + ": " + ec.message()};
    }

    lowest.expires_after(connect_timeout_);
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        return {ErrorCode::SSL_ERROR, "TLS handshake with " + url.host + " failed: " + ec.message()};
    }

    auto response = exchange(stream, url, request, lowest, request_timeout_);

    // Many servers drop the connection without close_notify
    lowest.expires_after(std::chrono::seconds(2));
    stream.shutdown(ec);
    return response;
}

} // namespace sdk
} // namespace veilrelay
