#pragma once

#include "veilrelay/sdk/types.hpp"
#include <string>

namespace veilrelay {
namespace sdk {

/**
 * @brief Text encodings used on the Solana wire and in provider APIs
 */
class Encoding {
public:
    // Bitcoin-alphabet base58, leading zero bytes map to leading '1's
    static std::string base58_encode(const ByteVector& data);
    static Result<ByteVector> base58_decode(const std::string& text);

    // Standard base64 with padding
    static std::string base64_encode(const ByteVector& data);
    static Result<ByteVector> base64_decode(const std::string& text);

    static std::string hex_encode(const ByteVector& data);
    static Result<ByteVector> hex_decode(const std::string& text);

    // Little-endian integer helpers for instruction data
    static void append_u64_le(ByteVector& out, uint64_t value);
    static void append_u32_le(ByteVector& out, uint32_t value);
    static uint64_t read_u64_le(const uint8_t* data);

    // Solana short-vec length prefix
    static void append_compact_u16(ByteVector& out, uint16_t value);
    static Result<uint16_t> read_compact_u16(const ByteVector& data, size_t& offset);
};

} // namespace sdk
} // namespace veilrelay
