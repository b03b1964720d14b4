/**
 * @file PublicKey.hpp
 * @brief Solana account addresses and program-derived address math
 */

#pragma once

#include "veilrelay/sdk/types.hpp"
#include <array>
#include <string>
#include <vector>

namespace veilrelay {
namespace sdk {

/**
 * @brief 32-byte account address
 */
class PublicKey {
public:
    using Bytes = std::array<uint8_t, constants::PUBLIC_KEY_SIZE>;

    PublicKey() { bytes_.fill(0); }
    explicit PublicKey(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * @brief Parse a base58 address, rejecting anything that is not 32 bytes
     */
    static Result<PublicKey> from_base58(const std::string& address);

    static Result<PublicKey> from_bytes(const ByteVector& bytes);

    /**
     * @brief Whether the text decodes as a 32-byte address
     */
    static bool is_valid(const std::string& address);

    std::string to_base58() const;

    const Bytes& bytes() const { return bytes_; }
    ByteVector to_vector() const { return ByteVector(bytes_.begin(), bytes_.end()); }

    bool operator==(const PublicKey& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const PublicKey& other) const { return bytes_ != other.bytes_; }
    bool operator<(const PublicKey& other) const { return bytes_ < other.bytes_; }

    /**
     * @brief Whether the bytes decompress to a point on the ed25519 curve
     *
     * Same acceptance rule as the runtime: the sign bit is ignored, y is taken
     * modulo p, and the point is valid when (y^2 - 1) / (d*y^2 + 1) is a square.
     * Small-order points count as on curve.
     */
    static bool is_on_curve(const Bytes& bytes);

    /**
     * @brief sha256(seeds || program_id || "ProgramDerivedAddress"), rejected when on curve
     */
    static Result<PublicKey> create_program_address(const std::vector<ByteVector>& seeds,
                                                    const PublicKey& program_id);

    /**
     * @brief Search bumps 255..0 for the first off-curve derived address
     * @return The address and the bump seed that produced it
     */
    static Result<std::pair<PublicKey, uint8_t>> find_program_address(const std::vector<ByteVector>& seeds,
                                                                      const PublicKey& program_id);

private:
    Bytes bytes_;
};

/**
 * @brief SHA-256 over the concatenation of the given parts
 */
Hash32 sha256(const std::vector<ByteVector>& parts);

} // namespace sdk
} // namespace veilrelay
