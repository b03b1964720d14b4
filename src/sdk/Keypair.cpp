#include "veilrelay/sdk/Keypair.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <sodium.h>
#include <filesystem>
#include <fstream>
#include <cstring>

namespace veilrelay {
namespace sdk {

namespace pt = boost::property_tree;

Result<void> initialize_crypto() {
    if (sodium_init() < 0) {
        SecureLogger::instance().critical("Failed to initialize libsodium");
        return ErrorCode::INTERNAL_ERROR;
    }
    return {};
}

Keypair::Keypair(SecureBytes secret_key, const PublicKey& public_key)
    : secret_key_(std::move(secret_key)), public_key_(public_key) {
}

Result<std::shared_ptr<Keypair>> Keypair::generate() {
    auto init = initialize_crypto();
    if (init.is_err()) {
        return {init.error(), init.error_message()};
    }

    SecureBytes secret(crypto_sign_SECRETKEYBYTES);
    PublicKey::Bytes pk;
    if (crypto_sign_keypair(pk.data(), secret.data()) != 0) {
        return {ErrorCode::INTERNAL_ERROR, "Key generation failed"};
    }

    return std::shared_ptr<Keypair>(new Keypair(std::move(secret), PublicKey(pk)));
}

Result<std::shared_ptr<Keypair>> Keypair::from_bytes(const ByteVector& bytes) {
    auto init = initialize_crypto();
    if (init.is_err()) {
        return {init.error(), init.error_message()};
    }

    if (bytes.size() != crypto_sign_SECRETKEYBYTES && bytes.size() != crypto_sign_SEEDBYTES) {
        return {ErrorCode::INVALID_PARAMETER, "Keypair must be 64 bytes or a 32-byte seed"};
    }

    // Always re-derive from the seed so a mismatched public half is caught
    SecureBytes secret(crypto_sign_SECRETKEYBYTES);
    PublicKey::Bytes pk;
    if (crypto_sign_seed_keypair(pk.data(), secret.data(), bytes.data()) != 0) {
        return {ErrorCode::INTERNAL_ERROR, "Key derivation failed"};
    }

    if (bytes.size() == crypto_sign_SECRETKEYBYTES &&
        std::memcmp(pk.data(), bytes.data() + crypto_sign_SEEDBYTES, pk.size()) != 0) {
        return {ErrorCode::INVALID_PARAMETER, "Keypair public half does not match its seed"};
    }

    return std::shared_ptr<Keypair>(new Keypair(std::move(secret), PublicKey(pk)));
}

Result<std::shared_ptr<Keypair>> Keypair::load_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return {ErrorCode::FILE_IO_ERROR, "Keypair file not found: " + path};
    }

    SecureBytes raw(crypto_sign_SECRETKEYBYTES);
    size_t count = 0;

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return {ErrorCode::FILE_IO_ERROR, "Cannot open keypair file: " + path};
        }

        pt::ptree tree;
        pt::read_json(file, tree);

        // A top-level JSON array parses into unnamed children
        for (const auto& child : tree) {
            if (!child.first.empty()) {
                return {ErrorCode::CONFIG_ERROR, "Keypair file must be a JSON array"};
            }
            if (count >= raw.size()) {
                return {ErrorCode::CONFIG_ERROR, "Keypair file holds more than 64 bytes"};
            }
            int value = child.second.get_value<int>();
            if (value < 0 || value > 255) {
                return {ErrorCode::CONFIG_ERROR, "Keypair byte out of range"};
            }
            raw.data()[count++] = static_cast<uint8_t>(value);
        }
    } catch (const pt::ptree_error& e) {
        SecureLogger::instance().error("Failed to parse keypair file " + path + ": " + e.what());
        return {ErrorCode::CONFIG_ERROR, "Malformed keypair file: " + path};
    }

    if (count != crypto_sign_SECRETKEYBYTES) {
        return {ErrorCode::CONFIG_ERROR, "Keypair file must hold exactly 64 bytes"};
    }

    ByteVector bytes(raw.data(), raw.data() + count);
    auto keypair = from_bytes(bytes);
    sodium_memzero(bytes.data(), bytes.size());
    return keypair;
}

Result<ByteVector> Keypair::sign(const ByteVector& message) const {
    ByteVector signature(crypto_sign_BYTES);
    unsigned long long signature_len = 0;

    if (crypto_sign_detached(signature.data(), &signature_len,
                             message.data(), message.size(),
                             secret_key_.data()) != 0) {
        return {ErrorCode::SIGNATURE_FAILED, "Failed to sign message"};
    }

    signature.resize(static_cast<size_t>(signature_len));
    return signature;
}

} // namespace sdk
} // namespace veilrelay
