#include "veilrelay/sdk/PublicKey.hpp"
#include "veilrelay/sdk/Encoding.hpp"
#include <openssl/bn.h>
#include <sodium.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace veilrelay {
namespace sdk {

namespace {

const std::string PDA_MARKER = "ProgramDerivedAddress";
constexpr size_t MAX_SEED_LENGTH = 32;
constexpr size_t MAX_SEEDS = 16;

using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;

BignumPtr make_bn() {
    BignumPtr bn(BN_new(), &BN_free);
    if (!bn) {
        throw std::bad_alloc();
    }
    return bn;
}

/**
 * @brief Field constants for curve25519, built once
 */
struct FieldConstants {
    BignumPtr p = make_bn();
    BignumPtr d = make_bn();
    BignumPtr euler_exponent = make_bn(); // (p - 1) / 2

    FieldConstants() {
        BnCtxPtr ctx(BN_CTX_new(), &BN_CTX_free);
        if (!ctx) {
            throw std::bad_alloc();
        }

        // p = 2^255 - 19
        BN_set_bit(p.get(), 255);
        BN_sub_word(p.get(), 19);

        // d = -121665 / 121666 mod p
        auto numerator = make_bn();
        auto denominator = make_bn();
        BN_set_word(numerator.get(), 121665);
        BN_sub(numerator.get(), p.get(), numerator.get());
        BN_set_word(denominator.get(), 121666);
        if (!BN_mod_inverse(denominator.get(), denominator.get(), p.get(), ctx.get())) {
            throw std::runtime_error("Failed to invert curve constant");
        }
        BN_mod_mul(d.get(), numerator.get(), denominator.get(), p.get(), ctx.get());

        BN_copy(euler_exponent.get(), p.get());
        BN_sub_word(euler_exponent.get(), 1);
        BN_rshift1(euler_exponent.get(), euler_exponent.get());
    }
};

const FieldConstants& field() {
    static const FieldConstants constants;
    return constants;
}

} // namespace

Hash32 sha256(const std::vector<ByteVector>& parts) {
    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);
    for (const auto& part : parts) {
        crypto_hash_sha256_update(&state, part.data(), part.size());
    }

    Hash32 digest;
    crypto_hash_sha256_final(&state, digest.data());
    return digest;
}

Result<PublicKey> PublicKey::from_base58(const std::string& address) {
    auto decoded = Encoding::base58_decode(address);
    if (decoded.is_err()) {
        return {ErrorCode::INVALID_ADDRESS, "Invalid address: " + address};
    }
    if (decoded.value().size() != constants::PUBLIC_KEY_SIZE) {
        return {ErrorCode::INVALID_ADDRESS, "Invalid address length: " + address};
    }
    return from_bytes(decoded.value());
}

Result<PublicKey> PublicKey::from_bytes(const ByteVector& bytes) {
    if (bytes.size() != constants::PUBLIC_KEY_SIZE) {
        return {ErrorCode::INVALID_ADDRESS, "Public key must be 32 bytes"};
    }
    Bytes raw;
    std::copy(bytes.begin(), bytes.end(), raw.begin());
    return PublicKey(raw);
}

bool PublicKey::is_valid(const std::string& address) {
    return from_base58(address).is_ok();
}

std::string PublicKey::to_base58() const {
    return Encoding::base58_encode(to_vector());
}

bool PublicKey::is_on_curve(const Bytes& bytes) {
    const FieldConstants& f = field();

    BnCtxPtr ctx(BN_CTX_new(), &BN_CTX_free);
    if (!ctx) {
        throw std::bad_alloc();
    }

    // y is little-endian with the x sign in the top bit
    Bytes y_bytes = bytes;
    y_bytes[31] &= 0x7F;

    auto y = make_bn();
    BN_lebin2bn(y_bytes.data(), static_cast<int>(y_bytes.size()), y.get());
    BN_nnmod(y.get(), y.get(), f.p.get(), ctx.get());

    auto y2 = make_bn();
    BN_mod_sqr(y2.get(), y.get(), f.p.get(), ctx.get());

    // u = y^2 - 1
    auto one = make_bn();
    BN_one(one.get());
    auto u = make_bn();
    BN_mod_sub(u.get(), y2.get(), one.get(), f.p.get(), ctx.get());

    if (BN_is_zero(u.get())) {
        return true;
    }

    // v = d*y^2 + 1
    auto v = make_bn();
    BN_mod_mul(v.get(), f.d.get(), y2.get(), f.p.get(), ctx.get());
    BN_mod_add(v.get(), v.get(), one.get(), f.p.get(), ctx.get());

    if (BN_is_zero(v.get())) {
        return false;
    }

    auto v_inv = make_bn();
    if (!BN_mod_inverse(v_inv.get(), v.get(), f.p.get(), ctx.get())) {
        return false;
    }

    auto x2 = make_bn();
    BN_mod_mul(x2.get(), u.get(), v_inv.get(), f.p.get(), ctx.get());

    // Euler's criterion: x2 is a square iff x2^((p-1)/2) == 1
    auto legendre = make_bn();
    BN_mod_exp(legendre.get(), x2.get(), f.euler_exponent.get(), f.p.get(), ctx.get());

    return BN_is_one(legendre.get());
}

Result<PublicKey> PublicKey::create_program_address(const std::vector<ByteVector>& seeds,
                                                    const PublicKey& program_id) {
    if (seeds.size() > MAX_SEEDS) {
        return {ErrorCode::INVALID_PARAMETER, "Too many seeds"};
    }

    std::vector<ByteVector> parts;
    parts.reserve(seeds.size() + 2);
    for (const auto& seed : seeds) {
        if (seed.size() > MAX_SEED_LENGTH) {
            return {ErrorCode::INVALID_PARAMETER, "Seed exceeds 32 bytes"};
        }
        parts.push_back(seed);
    }
    parts.push_back(program_id.to_vector());
    parts.emplace_back(PDA_MARKER.begin(), PDA_MARKER.end());

    Hash32 digest = sha256(parts);
    if (is_on_curve(digest)) {
        return {ErrorCode::INVALID_PARAMETER, "Derived address is on curve"};
    }
    return PublicKey(digest);
}

Result<std::pair<PublicKey, uint8_t>> PublicKey::find_program_address(const std::vector<ByteVector>& seeds,
                                                                      const PublicKey& program_id) {
    if (seeds.size() >= MAX_SEEDS) {
        return {ErrorCode::INVALID_PARAMETER, "Too many seeds"};
    }
    for (const auto& seed : seeds) {
        if (seed.size() > MAX_SEED_LENGTH) {
            return {ErrorCode::INVALID_PARAMETER, "Seed exceeds 32 bytes"};
        }
    }

    std::vector<ByteVector> with_bump = seeds;
    with_bump.push_back(ByteVector{0});

    // Seeds are valid here, so a failure only means the hash landed on the curve
    for (int bump = 255; bump >= 0; --bump) {
        with_bump.back()[0] = static_cast<uint8_t>(bump);

        auto address = create_program_address(with_bump, program_id);
        if (address.is_ok()) {
            return std::make_pair(address.value(), static_cast<uint8_t>(bump));
        }
    }

    return {ErrorCode::INTERNAL_ERROR, "No viable program address bump found"};
}

} // namespace sdk
} // namespace veilrelay
