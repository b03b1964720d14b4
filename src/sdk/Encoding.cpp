#include "veilrelay/sdk/Encoding.hpp"
#include <sodium.h>
#include <algorithm>
#include <array>

namespace veilrelay {
namespace sdk {

namespace {

const char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

std::array<int8_t, 128> build_base58_index() {
    std::array<int8_t, 128> index;
    index.fill(-1);
    for (int8_t i = 0; i < 58; ++i) {
        index[static_cast<uint8_t>(BASE58_ALPHABET[i])] = i;
    }
    return index;
}

} // namespace

std::string Encoding::base58_encode(const ByteVector& data) {
    size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) {
        ++zeros;
    }

    // log(256) / log(58) ~ 1.37
    std::vector<uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
    size_t length = 0;

    for (size_t i = zeros; i < data.size(); ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + (digits.size() - length);
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string result(zeros, '1');
    for (; it != digits.end(); ++it) {
        result += BASE58_ALPHABET[*it];
    }
    return result;
}

Result<ByteVector> Encoding::base58_decode(const std::string& text) {
    static const std::array<int8_t, 128> index = build_base58_index();

    if (text.empty()) {
        return {ErrorCode::INVALID_PARAMETER, "Empty base58 string"};
    }

    size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') {
        ++zeros;
    }

    // log(58) / log(256) ~ 0.733
    std::vector<uint8_t> bytes((text.size() - zeros) * 733 / 1000 + 1, 0);
    size_t length = 0;

    for (size_t i = zeros; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c >= 128 || index[c] < 0) {
            return {ErrorCode::INVALID_PARAMETER, "Invalid base58 character"};
        }

        int carry = index[c];
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = bytes.begin() + (bytes.size() - length);
    while (it != bytes.end() && *it == 0) {
        ++it;
    }

    ByteVector result(zeros, 0);
    result.insert(result.end(), it, bytes.end());
    return result;
}

std::string Encoding::base64_encode(const ByteVector& data) {
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string encoded(encoded_len, '\0');
    sodium_bin2base64(&encoded[0], encoded_len, data.data(), data.size(), sodium_base64_VARIANT_ORIGINAL);
    encoded.resize(encoded_len - 1); // drop the terminator
    return encoded;
}

Result<ByteVector> Encoding::base64_decode(const std::string& text) {
    ByteVector decoded(text.size() / 4 * 3 + 3);
    size_t decoded_len = 0;

    if (sodium_base642bin(decoded.data(), decoded.size(), text.data(), text.size(),
                          nullptr, &decoded_len, nullptr, sodium_base64_VARIANT_ORIGINAL) != 0) {
        return {ErrorCode::MALFORMED_RESPONSE, "Invalid base64 payload"};
    }

    decoded.resize(decoded_len);
    return decoded;
}

std::string Encoding::hex_encode(const ByteVector& data) {
    std::string encoded(data.size() * 2 + 1, '\0');
    sodium_bin2hex(&encoded[0], encoded.size(), data.data(), data.size());
    encoded.resize(data.size() * 2);
    return encoded;
}

Result<ByteVector> Encoding::hex_decode(const std::string& text) {
    if (text.size() % 2 != 0) {
        return {ErrorCode::INVALID_PARAMETER, "Hex string has odd length"};
    }

    ByteVector decoded(text.size() / 2);
    size_t decoded_len = 0;
    const char* end = nullptr;

    if (sodium_hex2bin(decoded.data(), decoded.size(), text.data(), text.size(),
                       nullptr, &decoded_len, &end) != 0 ||
        end != text.data() + text.size()) {
        return {ErrorCode::INVALID_PARAMETER, "Invalid hex string"};
    }

    decoded.resize(decoded_len);
    return decoded;
}

void Encoding::append_u64_le(ByteVector& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

void Encoding::append_u32_le(ByteVector& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

uint64_t Encoding::read_u64_le(const uint8_t* data) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | data[i];
    }
    return value;
}

void Encoding::append_compact_u16(ByteVector& out, uint16_t value) {
    uint32_t remaining = value;
    while (true) {
        uint8_t byte = remaining & 0x7F;
        remaining >>= 7;
        if (remaining == 0) {
            out.push_back(byte);
            return;
        }
        out.push_back(byte | 0x80);
    }
}

Result<uint16_t> Encoding::read_compact_u16(const ByteVector& data, size_t& offset) {
    uint32_t value = 0;
    for (int shift = 0; shift < 21; shift += 7) {
        if (offset >= data.size()) {
            return {ErrorCode::MALFORMED_RESPONSE, "Truncated compact-u16"};
        }
        uint8_t byte = data[offset++];
        value |= static_cast<uint32_t>(byte & 0x7F) << shift;
        if ((byte & 0x80) == 0) {
            if (value > 0xFFFF) {
                return {ErrorCode::MALFORMED_RESPONSE, "compact-u16 overflow"};
            }
            return static_cast<uint16_t>(value);
        }
    }
    return {ErrorCode::MALFORMED_RESPONSE, "compact-u16 too long"};
}

} // namespace sdk
} // namespace veilrelay
