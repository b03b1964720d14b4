#pragma once

#include "veilrelay/sdk/types.hpp"
#include "veilrelay/sdk/PublicKey.hpp"
#include <string>
#include <memory>

namespace veilrelay {
namespace sdk {

/**
 * @brief ed25519 signing key held in locked, zeroed-on-free memory
 */
class Keypair {
public:
    /**
     * @brief Generate a fresh random keypair
     */
    static Result<std::shared_ptr<Keypair>> generate();

    /**
     * @brief Build from 64 bytes (seed || public key) or a 32-byte seed
     */
    static Result<std::shared_ptr<Keypair>> from_bytes(const ByteVector& bytes);

    /**
     * @brief Load a keypair file holding a JSON array of 64 byte values
     */
    static Result<std::shared_ptr<Keypair>> load_file(const std::string& path);

    const PublicKey& public_key() const { return public_key_; }

    /**
     * @brief Detached ed25519 signature over the message
     */
    Result<ByteVector> sign(const ByteVector& message) const;

    Keypair(const Keypair&) = delete;
    Keypair& operator=(const Keypair&) = delete;

private:
    Keypair(SecureBytes secret_key, const PublicKey& public_key);

    SecureBytes secret_key_;
    PublicKey public_key_;
};

/**
 * @brief Initialize libsodium once for the process
 */
Result<void> initialize_crypto();

} // namespace sdk
} // namespace veilrelay
