#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <array>

namespace veilrelay {
namespace sdk {

/**
 * @brief Constants for the relay SDK
 */
namespace constants {
    // Key and hash sizes
    constexpr size_t PUBLIC_KEY_SIZE = 32;
    constexpr size_t SECRET_KEY_SIZE = 64;       // ed25519 seed || public key
    constexpr size_t SIGNATURE_SIZE = 64;
    constexpr size_t HASH_SIZE = 32;
    constexpr size_t NULLIFIER_SIZE = 32;
    constexpr size_t MINT_DECIMALS_OFFSET = 44;  // option(4) + authority(32) + supply(8)
    constexpr uint8_t DEFAULT_MINT_DECIMALS = 9;

    // Well-known program and mint addresses
    const std::string SYSTEM_PROGRAM_ID = "11111111111111111111111111111111";
    const std::string TOKEN_PROGRAM_ID = "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";
    const std::string TOKEN_2022_PROGRAM_ID = "TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb";
    const std::string ASSOCIATED_TOKEN_PROGRAM_ID = "ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL";
    const std::string WRAPPED_SOL_MINT = "So11111111111111111111111111111111111111112";
    const std::string DEFAULT_POOL_PROGRAM_ID = "3qhVPvz8T1WiozCLEfhUuv8WZHDPpEfnAzq2iSatULc7";

    // Pool seeds (must match the on-chain program)
    const std::string POOL_SEED = "pool";
    const std::string VAULT_SEED = "vault";
    const std::string NULLIFIER_SEED = "nullifier";
    const std::string UNSHIELD_SOL_DISCRIMINATOR_PREIMAGE = "global:unshield_sol";

    // Denominations in lamports, 0 selects the variable-amount pool
    constexpr uint64_t CUSTOM_DENOMINATION = 0;
    constexpr std::array<uint64_t, 5> FIXED_DENOMINATIONS = {
        1000000000ULL,      // 1 SOL
        10000000000ULL,     // 10 SOL
        100000000000ULL,    // 100 SOL
        1000000000000ULL,   // 1K SOL
        10000000000000ULL   // 10K SOL
    };

    // Relay economics
    constexpr uint32_t DEFAULT_FEE_BPS = 30;          // 0.3%
    constexpr uint64_t MIN_RELAY_FEE_LAMPORTS = 5000; // covers the signature fee
    constexpr uint64_t FALLBACK_RESERVE_LAMPORTS = 5000;
    constexpr uint32_t DEFAULT_SLIPPAGE_BPS = 100;

    // Proof job timing
    constexpr auto PROOF_STAGE_DELAY = std::chrono::milliseconds(300);
    constexpr auto JOB_RETENTION = std::chrono::hours(1);
    constexpr auto JOB_SWEEP_INTERVAL = std::chrono::minutes(5);

    // Swap provider timing
    constexpr auto TOKEN_LIST_TTL = std::chrono::minutes(5);
    constexpr auto RETRY_BASE_DELAY = std::chrono::milliseconds(1000);
    constexpr double RETRY_BACKOFF_MULTIPLIER = 2.0;
    constexpr size_t MAX_PROVIDER_RETRIES = 3;

    // Saga timing
    constexpr size_t BALANCE_POLL_ATTEMPTS = 5;
    constexpr auto BALANCE_POLL_DELAY = std::chrono::milliseconds(500);
    constexpr size_t TRANSFER_ATTEMPTS = 3;
    constexpr auto TRANSFER_RETRY_DELAY = std::chrono::milliseconds(1000);

    // Network timing
    constexpr auto HTTP_REQUEST_TIMEOUT = std::chrono::seconds(30);
    constexpr auto HTTP_CONNECT_TIMEOUT = std::chrono::seconds(10);
    constexpr auto CONFIRMATION_TIMEOUT = std::chrono::seconds(60);
    constexpr auto CONFIRMATION_POLL_INTERVAL = std::chrono::milliseconds(500);
    constexpr auto CIRCUIT_BREAKER_RESET_TIMEOUT = std::chrono::seconds(60);

    // Size constants
    constexpr size_t DEFAULT_THREAD_POOL_SIZE = 8;
    constexpr size_t CIRCUIT_BREAKER_THRESHOLD = 5;
    constexpr size_t MAX_HTTP_RESPONSE_SIZE = 16 * 1024 * 1024;

    // Path constants
    const std::string LOG_PATH = "/var/log/veilrelay/";
    const std::string DEFAULT_KEYPAIR_PATH = "relayer-keypair.json";
}

} // namespace sdk
} // namespace veilrelay
