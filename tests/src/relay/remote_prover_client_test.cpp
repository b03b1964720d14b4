#include "veilrelay/relay/ProofGenerator.hpp"
#include "veilrelay/testing/fakes.hpp"
#include <gtest/gtest.h>

using namespace veilrelay::relay;
using namespace veilrelay::testing;
using veilrelay::sdk::ErrorCode;

namespace {

ProofJobParams params() {
    ProofJobParams p;
    p.commitment = "0a0b0c";
    p.secret = "deadbeef";
    p.amount = 2000000000ull;
    p.recipient = make_key(9).to_base58();
    p.denomination = 0;
    return p;
}

class RemoteProverClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<FakeHttpTransport>();
        client = std::make_unique<RemoteProverClient>("http://127.0.0.1:8090/", transport);
    }

    std::shared_ptr<FakeHttpTransport> transport;
    std::unique_ptr<RemoteProverClient> client;
};

} // namespace

TEST_F(RemoteProverClientTest, PostsInputsAndDecodesProof) {
    transport->push(200, "{\"proof\":\"abab\",\"nullifier\":\"" + std::string(64, '1') +
                             "\",\"publicInputs\":{\"root\":\"00ff\"},\"verified\":true}");

    auto result = client->generate_proof(params());
    ASSERT_TRUE(result.is_ok()) << result.error_message();
    EXPECT_EQ(result.value().proof, (ByteVector{0xab, 0xab}));
    EXPECT_EQ(result.value().nullifier, ByteVector(32, 0x11));
    EXPECT_EQ(result.value().public_inputs.at("root"), "00ff");
    EXPECT_TRUE(result.value().verified);

    ASSERT_EQ(transport->requests.size(), 1u);
    const auto& request = transport->requests[0];
    EXPECT_EQ(request.url, "http://127.0.0.1:8090/prove");
    EXPECT_NE(request.body.find("\"amount\":2000000000"), std::string::npos);
    EXPECT_NE(request.body.find("\"denomination\":0"), std::string::npos);
}

TEST_F(RemoteProverClientTest, RejectsNonHexInputsLocally) {
    ProofJobParams bad = params();
    bad.secret = "not hex";

    auto result = client->generate_proof(bad);
    EXPECT_EQ(result.error(), ErrorCode::INVALID_PARAMETER);
    EXPECT_TRUE(transport->requests.empty());
}

TEST_F(RemoteProverClientTest, RefusalKeepsProverMessage) {
    transport->push(422, "{\"error\":\"Commitment not found in tree\"}");

    auto result = client->generate_proof(params());
    EXPECT_EQ(result.error(), ErrorCode::PROOF_GENERATION_FAILED);
    EXPECT_EQ(result.error_message(), "Commitment not found in tree");
}

TEST_F(RemoteProverClientTest, ServerFailureIsClassified) {
    transport->push(500, "panic at prover.rs:12");

    auto result = client->generate_proof(params());
    EXPECT_EQ(result.error(), ErrorCode::UPSTREAM_UNAVAILABLE);
    EXPECT_EQ(result.error_message().find("panic"), std::string::npos);
}

TEST_F(RemoteProverClientTest, UnreachableProver) {
    transport->push_error(ErrorCode::CONNECTION_TIMEOUT);

    EXPECT_EQ(client->generate_proof(params()).error(), ErrorCode::CONNECTION_TIMEOUT);
}

TEST_F(RemoteProverClientTest, GarbledResponseIsMalformed) {
    transport->push(200, "{\"proof\":\"zz\",\"nullifier\":\"11\"}");
    EXPECT_EQ(client->generate_proof(params()).error(), ErrorCode::MALFORMED_RESPONSE);

    transport->push(200, "<html>");
    EXPECT_EQ(client->generate_proof(params()).error(), ErrorCode::MALFORMED_RESPONSE);
}
