#include "veilrelay/sdk/Encoding.hpp"
#include <gtest/gtest.h>

using namespace veilrelay::sdk;

namespace {

ByteVector bytes_of(const std::string& text) {
    return ByteVector(text.begin(), text.end());
}

ByteVector compact(uint16_t value) {
    ByteVector out;
    Encoding::append_compact_u16(out, value);
    return out;
}

} // namespace

TEST(EncodingTest, Base58KnownVectors) {
    EXPECT_EQ(Encoding::base58_encode(bytes_of("Hello World!")), "2NEpo7TZRRrLZSi2U");
    EXPECT_EQ(Encoding::base58_encode(ByteVector{0, 0, 1}), "112");
    EXPECT_EQ(Encoding::base58_encode(ByteVector(32, 0)), std::string(32, '1'));
    EXPECT_EQ(Encoding::base58_encode(ByteVector{}), "");
}

TEST(EncodingTest, Base58DecodeKeepsLeadingZeros) {
    auto decoded = Encoding::base58_decode("112");
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), (ByteVector{0, 0, 1}));

    auto text = Encoding::base58_decode("2NEpo7TZRRrLZSi2U");
    ASSERT_TRUE(text.is_ok());
    EXPECT_EQ(text.value(), bytes_of("Hello World!"));
}

TEST(EncodingTest, Base58RejectsCharactersOutsideAlphabet) {
    for (const std::string bad : {"0abc", "Oabc", "Iabc", "labc", "ab+c"}) {
        auto decoded = Encoding::base58_decode(bad);
        ASSERT_TRUE(decoded.is_err()) << bad;
        EXPECT_EQ(decoded.error(), ErrorCode::INVALID_PARAMETER);
    }
}

TEST(EncodingTest, Base64) {
    EXPECT_EQ(Encoding::base64_encode(bytes_of("hello")), "aGVsbG8=");

    auto decoded = Encoding::base64_decode("aGVsbG8=");
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), bytes_of("hello"));

    auto bad = Encoding::base64_decode("a*b");
    ASSERT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error(), ErrorCode::MALFORMED_RESPONSE);
}

TEST(EncodingTest, Hex) {
    EXPECT_EQ(Encoding::hex_encode(ByteVector{0xde, 0xad, 0xbe, 0xef}), "deadbeef");

    auto decoded = Encoding::hex_decode("DEADbeef");
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), (ByteVector{0xde, 0xad, 0xbe, 0xef}));

    EXPECT_EQ(Encoding::hex_decode("abc").error(), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(Encoding::hex_decode("zz").error(), ErrorCode::INVALID_PARAMETER);
}

TEST(EncodingTest, LittleEndianIntegers) {
    ByteVector out;
    Encoding::append_u64_le(out, 0x0102030405060708ULL);
    EXPECT_EQ(out, (ByteVector{8, 7, 6, 5, 4, 3, 2, 1}));
    EXPECT_EQ(Encoding::read_u64_le(out.data()), 0x0102030405060708ULL);

    ByteVector u32;
    Encoding::append_u32_le(u32, 2);
    EXPECT_EQ(u32, (ByteVector{2, 0, 0, 0}));
}

TEST(EncodingTest, CompactU16) {
    EXPECT_EQ(compact(0), (ByteVector{0x00}));
    EXPECT_EQ(compact(0x7f), (ByteVector{0x7f}));
    EXPECT_EQ(compact(0x80), (ByteVector{0x80, 0x01}));
    EXPECT_EQ(compact(0x3fff), (ByteVector{0xff, 0x7f}));
    EXPECT_EQ(compact(0x4000), (ByteVector{0x80, 0x80, 0x01}));

    ByteVector data{0x80, 0x80, 0x01, 0x05};
    size_t offset = 0;
    auto value = Encoding::read_compact_u16(data, offset);
    ASSERT_TRUE(value.is_ok());
    EXPECT_EQ(value.value(), 0x4000);
    EXPECT_EQ(offset, 3u);
}

TEST(EncodingTest, CompactU16Truncated) {
    ByteVector data{0x80};
    size_t offset = 0;
    EXPECT_TRUE(Encoding::read_compact_u16(data, offset).is_err());
}
