#include "veilrelay/sdk/HttpClient.hpp"
#include "veilrelay/sdk/Json.hpp"
#include <gtest/gtest.h>

using namespace veilrelay::sdk;

TEST(HttpTest, StatusClassification) {
    EXPECT_EQ(classify_http_status(200), ErrorCode::SUCCESS);
    EXPECT_EQ(classify_http_status(204), ErrorCode::SUCCESS);
    EXPECT_EQ(classify_http_status(429), ErrorCode::RATE_LIMITED);
    EXPECT_EQ(classify_http_status(500), ErrorCode::UPSTREAM_UNAVAILABLE);
    EXPECT_EQ(classify_http_status(503), ErrorCode::UPSTREAM_UNAVAILABLE);
    EXPECT_EQ(classify_http_status(400), ErrorCode::AGGREGATOR_REJECTED);
    EXPECT_EQ(classify_http_status(404), ErrorCode::AGGREGATOR_REJECTED);
}

TEST(HttpTest, ErrorCategoriesDriveStatus) {
    EXPECT_TRUE(is_transient(ErrorCode::RATE_LIMITED));
    EXPECT_TRUE(is_transient(ErrorCode::CONNECTION_TIMEOUT));
    EXPECT_FALSE(is_transient(ErrorCode::NO_ROUTE));
    EXPECT_FALSE(is_transient(ErrorCode::INVALID_PARAMETER));

    EXPECT_EQ(recommended_status(ErrorCode::INVALID_ADDRESS), 400);
    EXPECT_EQ(recommended_status(ErrorCode::JOB_NOT_COMPLETE), 400);
    EXPECT_EQ(recommended_status(ErrorCode::JOB_NOT_FOUND), 404);
    EXPECT_EQ(recommended_status(ErrorCode::PROOF_RESULT_MISSING), 500);
    EXPECT_EQ(recommended_status(ErrorCode::CHAIN_REJECTED), 502);
    EXPECT_EQ(recommended_status(ErrorCode::NO_ROUTE), 502);
    EXPECT_EQ(recommended_status(ErrorCode::RATE_LIMITED), 503);
    EXPECT_EQ(recommended_status(ErrorCode::SERVICE_DISABLED), 503);
    EXPECT_EQ(recommended_status(ErrorCode::INTERNAL_ERROR), 500);
}

TEST(HttpTest, ParseHttpsUrl) {
    auto url = parse_url("https://api.jup.ag/swap/v1/quote?amount=1");
    ASSERT_TRUE(url.is_ok());
    EXPECT_TRUE(url.value().tls);
    EXPECT_EQ(url.value().host, "api.jup.ag");
    EXPECT_EQ(url.value().port, "443");
    EXPECT_EQ(url.value().target, "/swap/v1/quote?amount=1");
}

TEST(HttpTest, ParsePlainUrlWithPort) {
    auto url = parse_url("http://127.0.0.1:8090");
    ASSERT_TRUE(url.is_ok());
    EXPECT_FALSE(url.value().tls);
    EXPECT_EQ(url.value().host, "127.0.0.1");
    EXPECT_EQ(url.value().port, "8090");
    EXPECT_EQ(url.value().target, "/");
}

TEST(HttpTest, ParseRejectsOtherSchemes) {
    EXPECT_TRUE(parse_url("ftp://example.com").is_err());
    EXPECT_TRUE(parse_url("example.com/path").is_err());
    EXPECT_TRUE(parse_url("https://").is_err());
}

TEST(HttpTest, UrlEncode) {
    EXPECT_EQ(url_encode("So11111111111111111111111111111111111111112"),
              "So11111111111111111111111111111111111111112");
    EXPECT_EQ(url_encode("a b&c=d"), "a%20b%26c%3Dd");
}

TEST(JsonTest, ParseAndRead) {
    auto tree = json::parse(R"({"a":{"b":"text","n":42,"s":"17","z":null},"ok":true})");
    ASSERT_TRUE(tree.is_ok());
    EXPECT_EQ(json::get_string(tree.value(), "a.b"), "text");
    EXPECT_EQ(json::get_string(tree.value(), "a.z"), "");
    EXPECT_EQ(json::get_string(tree.value(), "missing"), "");
    EXPECT_EQ(json::get_string(tree.value(), "ok"), "true");
    EXPECT_EQ(json::get_u64(tree.value(), "a.n").value(), 42u);
    EXPECT_EQ(json::get_u64(tree.value(), "a.s").value(), 17u);
    EXPECT_EQ(json::get_u64(tree.value(), "a.b").error(), ErrorCode::MALFORMED_RESPONSE);
    EXPECT_TRUE(json::is_null(tree.value().get_child("a.z")));
}

TEST(JsonTest, MalformedInput) {
    auto tree = json::parse("{not json");
    ASSERT_TRUE(tree.is_err());
    EXPECT_EQ(tree.error(), ErrorCode::MALFORMED_RESPONSE);
}

TEST(JsonTest, QuoteEscapes) {
    EXPECT_EQ(json::quote("plain"), "\"plain\"");
    EXPECT_EQ(json::quote("a\"b\\c\n"), "\"a\\\"b\\\\c\\n\"");
}
