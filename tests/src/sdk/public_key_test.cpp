#include "veilrelay/sdk/PublicKey.hpp"
#include "veilrelay/sdk/Keypair.hpp"
#include "veilrelay/testing/fakes.hpp"
#include <gtest/gtest.h>

using namespace veilrelay::sdk;
using veilrelay::testing::make_key;
using veilrelay::testing::make_keypair;

namespace {

ByteVector seed(const std::string& text) {
    return ByteVector(text.begin(), text.end());
}

PublicKey program() {
    return PublicKey::from_base58(constants::DEFAULT_POOL_PROGRAM_ID).value();
}

} // namespace

TEST(PublicKeyTest, Base58RoundTripOfWellKnownIds) {
    for (const auto& id : {constants::SYSTEM_PROGRAM_ID, constants::TOKEN_PROGRAM_ID,
                           constants::TOKEN_2022_PROGRAM_ID, constants::ASSOCIATED_TOKEN_PROGRAM_ID,
                           constants::WRAPPED_SOL_MINT}) {
        auto key = PublicKey::from_base58(id);
        ASSERT_TRUE(key.is_ok()) << id;
        EXPECT_EQ(key.value().to_base58(), id);
    }
    EXPECT_EQ(PublicKey::from_base58(constants::SYSTEM_PROGRAM_ID).value(), PublicKey());
}

TEST(PublicKeyTest, RejectsMalformedAddresses) {
    EXPECT_EQ(PublicKey::from_base58("not-an-address").error(), ErrorCode::INVALID_ADDRESS);
    EXPECT_EQ(PublicKey::from_base58("2NEpo7TZRRrLZSi2U").error(), ErrorCode::INVALID_ADDRESS);
    EXPECT_EQ(PublicKey::from_base58("").error(), ErrorCode::INVALID_ADDRESS);
    EXPECT_FALSE(PublicKey::is_valid("0OIl"));
    EXPECT_TRUE(PublicKey::is_valid(constants::TOKEN_PROGRAM_ID));
    EXPECT_EQ(PublicKey::from_bytes(ByteVector(31, 1)).error(), ErrorCode::INVALID_ADDRESS);
}

TEST(PublicKeyTest, CurveMembership) {
    auto keypair = make_keypair();
    EXPECT_TRUE(PublicKey::is_on_curve(keypair->public_key().bytes()));

    PublicKey::Bytes identity{};
    identity[0] = 1;
    EXPECT_TRUE(PublicKey::is_on_curve(identity));

    EXPECT_TRUE(PublicKey::is_on_curve(PublicKey().bytes()));
}

TEST(PublicKeyTest, ProgramAddressIsOffCurveAndReproducible) {
    auto found = PublicKey::find_program_address({seed("pool"), ByteVector(8, 0)}, program());
    ASSERT_TRUE(found.is_ok());

    const PublicKey address = found.value().first;
    const uint8_t bump = found.value().second;
    EXPECT_FALSE(PublicKey::is_on_curve(address.bytes()));

    auto again = PublicKey::find_program_address({seed("pool"), ByteVector(8, 0)}, program());
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().first, address);
    EXPECT_EQ(again.value().second, bump);

    auto direct = PublicKey::create_program_address({seed("pool"), ByteVector(8, 0), ByteVector{bump}}, program());
    ASSERT_TRUE(direct.is_ok());
    EXPECT_EQ(direct.value(), address);
}

TEST(PublicKeyTest, ProgramAddressDependsOnSeedsAndProgram) {
    auto a = PublicKey::find_program_address({seed("vault"), make_key(1).to_vector()}, program());
    auto b = PublicKey::find_program_address({seed("vault"), make_key(2).to_vector()}, program());
    auto c = PublicKey::find_program_address({seed("vault"), make_key(1).to_vector()}, make_key(9));
    ASSERT_TRUE(a.is_ok() && b.is_ok() && c.is_ok());
    EXPECT_NE(a.value().first, b.value().first);
    EXPECT_NE(a.value().first, c.value().first);
}

TEST(PublicKeyTest, SeedLimits) {
    auto too_long = PublicKey::find_program_address({ByteVector(33, 1)}, program());
    ASSERT_TRUE(too_long.is_err());
    EXPECT_EQ(too_long.error(), ErrorCode::INVALID_PARAMETER);

    std::vector<ByteVector> many(16, seed("x"));
    EXPECT_EQ(PublicKey::find_program_address(many, program()).error(), ErrorCode::INVALID_PARAMETER);
}
