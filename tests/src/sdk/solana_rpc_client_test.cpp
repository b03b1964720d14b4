#include "veilrelay/sdk/SolanaRpcClient.hpp"
#include "veilrelay/testing/fakes.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace veilrelay::sdk;
using veilrelay::testing::FakeHttpTransport;
using veilrelay::testing::make_key;

namespace {

const std::string RPC_URL = "http://127.0.0.1:8899";

class SolanaRpcClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<FakeHttpTransport>();

        SolanaRpcClient::Options options;
        options.poll_interval = std::chrono::milliseconds(5);
        options.sleeper = [this](std::chrono::milliseconds delay) {
            ++sleeps;
            std::this_thread::sleep_for(delay);
        };
        client = std::make_unique<SolanaRpcClient>(RPC_URL, transport, options);
    }

    void respond(const std::string& result_json) {
        transport->push(200, "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":" + result_json + "}");
    }

    void respond_error(int code, const std::string& message) {
        transport->push(200, "{\"jsonrpc\":\"2.0\",\"id\":1,\"error\":{\"code\":" + std::to_string(code) +
                                 ",\"message\":\"" + message + "\"}}");
    }

    std::shared_ptr<FakeHttpTransport> transport;
    std::unique_ptr<SolanaRpcClient> client;
    int sleeps = 0;
};

} // namespace

TEST_F(SolanaRpcClientTest, SendsJsonRpcEnvelope) {
    respond("{\"context\":{\"slot\":1},\"value\":{\"blockhash\":\"" + veilrelay::testing::TEST_BLOCKHASH +
            "\",\"lastValidBlockHeight\":10}}");

    auto blockhash = client->get_latest_blockhash();
    ASSERT_TRUE(blockhash.is_ok());
    EXPECT_EQ(blockhash.value(), veilrelay::testing::TEST_BLOCKHASH);

    ASSERT_EQ(transport->requests.size(), 1u);
    const HttpRequest& request = transport->requests[0];
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.url, RPC_URL);
    EXPECT_EQ(request.headers.at("Content-Type"), "application/json");
    EXPECT_NE(request.body.find("\"jsonrpc\":\"2.0\""), std::string::npos);
    EXPECT_NE(request.body.find("\"method\":\"getLatestBlockhash\""), std::string::npos);
    EXPECT_NE(request.body.find("\"commitment\":\"confirmed\""), std::string::npos);
}

TEST_F(SolanaRpcClientTest, ReadsBalance) {
    respond("{\"context\":{\"slot\":1},\"value\":1500000000}");

    auto balance = client->get_balance(make_key(1));
    ASSERT_TRUE(balance.is_ok());
    EXPECT_EQ(balance.value(), 1500000000u);
}

TEST_F(SolanaRpcClientTest, DecodesAccountInfo) {
    const PublicKey owner = PublicKey::from_base58(constants::TOKEN_PROGRAM_ID).value();
    respond("{\"context\":{\"slot\":1},\"value\":{\"data\":[\"AQID\",\"base64\"],\"executable\":false,"
            "\"lamports\":2039280,\"owner\":\"" + owner.to_base58() + "\",\"rentEpoch\":0}}");

    auto info = client->get_account_info(make_key(1));
    ASSERT_TRUE(info.is_ok());
    ASSERT_TRUE(info.value().has_value());
    EXPECT_EQ(info.value()->owner, owner);
    EXPECT_EQ(info.value()->lamports, 2039280u);
    EXPECT_FALSE(info.value()->executable);
    EXPECT_EQ(info.value()->data, (ByteVector{1, 2, 3}));
}

TEST_F(SolanaRpcClientTest, MissingAccountIsEmptyNotError) {
    respond("{\"context\":{\"slot\":1},\"value\":null}");

    auto info = client->get_account_info(make_key(1));
    ASSERT_TRUE(info.is_ok());
    EXPECT_FALSE(info.value().has_value());
}

TEST_F(SolanaRpcClientTest, ReadsTokenAccountAmount) {
    respond("{\"context\":{\"slot\":1},\"value\":{\"amount\":\"297000000\",\"decimals\":6,"
            "\"uiAmountString\":\"297\"}}");

    auto amount = client->get_token_account_balance(make_key(1));
    ASSERT_TRUE(amount.is_ok());
    EXPECT_EQ(amount.value(), 297000000u);
}

TEST_F(SolanaRpcClientTest, MapsUnknownTokenAccountToAccountNotFound) {
    respond_error(-32602, "Invalid param: could not find account");

    auto amount = client->get_token_account_balance(make_key(1));
    ASSERT_TRUE(amount.is_err());
    EXPECT_EQ(amount.error(), ErrorCode::ACCOUNT_NOT_FOUND);
}

TEST_F(SolanaRpcClientTest, SendTransactionReturnsSignature) {
    respond("\"5VERv8NMvzbJMEkV8xnrLkEaWRtSz9CosKDYjCJjBRnbJLgp8uirBgmQpjKhoR4tjF3ZpRzrFmBV6UjKdiSZkQUW\"");

    auto signature = client->send_transaction(ByteVector(10, 1));
    ASSERT_TRUE(signature.is_ok());
    EXPECT_EQ(signature.value().substr(0, 8), "5VERv8NM");
    EXPECT_NE(transport->requests[0].body.find("\"encoding\":\"base64\""), std::string::npos);
}

TEST_F(SolanaRpcClientTest, PreflightFailureIsChainRejection) {
    respond_error(-32002, "Transaction simulation failed: Error processing Instruction 0");

    auto signature = client->send_transaction(ByteVector(10, 1));
    ASSERT_TRUE(signature.is_err());
    EXPECT_EQ(signature.error(), ErrorCode::CHAIN_REJECTED);
    EXPECT_NE(signature.error_message().find("simulation failed"), std::string::npos);
}

TEST_F(SolanaRpcClientTest, OtherRpcErrorsAreRpcErrors) {
    respond_error(-32005, "Node is behind");

    auto balance = client->get_balance(make_key(1));
    ASSERT_TRUE(balance.is_err());
    EXPECT_EQ(balance.error(), ErrorCode::RPC_ERROR);
    EXPECT_NE(balance.error_message().find("-32005"), std::string::npos);
}

TEST_F(SolanaRpcClientTest, HttpStatusesAreClassified) {
    transport->push(503, "unavailable");
    auto unavailable = client->get_balance(make_key(1));
    EXPECT_EQ(unavailable.error(), ErrorCode::UPSTREAM_UNAVAILABLE);

    transport->push(400, "bad request");
    auto rejected = client->get_balance(make_key(1));
    EXPECT_EQ(rejected.error(), ErrorCode::RPC_ERROR);

    transport->push(200, "not json");
    auto garbage = client->get_balance(make_key(1));
    EXPECT_EQ(garbage.error(), ErrorCode::RPC_ERROR);
}

TEST_F(SolanaRpcClientTest, ConfirmWaitsForConfirmedStatus) {
    respond("{\"context\":{\"slot\":1},\"value\":[null]}");
    respond("{\"context\":{\"slot\":1},\"value\":[{\"slot\":2,\"confirmations\":0,\"err\":null,"
            "\"confirmationStatus\":\"processed\"}]}");
    respond("{\"context\":{\"slot\":1},\"value\":[{\"slot\":2,\"confirmations\":1,\"err\":null,"
            "\"confirmationStatus\":\"confirmed\"}]}");

    auto confirmed = client->confirm_transaction("sig", std::chrono::seconds(5));
    EXPECT_TRUE(confirmed.is_ok());
    EXPECT_EQ(transport->requests.size(), 3u);
    EXPECT_EQ(sleeps, 2);
}

TEST_F(SolanaRpcClientTest, ConfirmReportsOnChainFailure) {
    respond("{\"context\":{\"slot\":1},\"value\":[{\"slot\":2,\"confirmations\":1,"
            "\"err\":{\"InstructionError\":[0,{\"Custom\":1}]},\"confirmationStatus\":\"confirmed\"}]}");

    auto confirmed = client->confirm_transaction("sig", std::chrono::seconds(5));
    ASSERT_TRUE(confirmed.is_err());
    EXPECT_EQ(confirmed.error(), ErrorCode::CHAIN_REJECTED);
}

TEST_F(SolanaRpcClientTest, ConfirmTimesOut) {
    for (int i = 0; i < 50; ++i) {
        respond("{\"context\":{\"slot\":1},\"value\":[null]}");
    }

    auto confirmed = client->confirm_transaction("sig", std::chrono::milliseconds(30));
    ASSERT_TRUE(confirmed.is_err());
    EXPECT_EQ(confirmed.error(), ErrorCode::CONFIRMATION_TIMEOUT);
    EXPECT_GE(transport->requests.size(), 1u);
}
