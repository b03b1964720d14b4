/**
 * @file RelayConfig.hpp
 * @brief Daemon settings loaded from a key = value file
 */

#pragma once

#include "veilrelay/sdk/types.hpp"
#include "veilrelay/sdk/constants.hpp"
#include <string>
#include <vector>

namespace veilrelay {
namespace relay {

using sdk::Result;

struct RelayConfig {
    std::string rpc_url = "https://api.devnet.solana.com";
    std::string program_id = sdk::constants::DEFAULT_POOL_PROGRAM_ID;
    std::string keypair_path = sdk::constants::DEFAULT_KEYPAIR_PATH;
    bool relayer_enabled = true;
    uint32_t fee_bps = sdk::constants::DEFAULT_FEE_BPS;
    uint64_t min_fee = sdk::constants::MIN_RELAY_FEE_LAMPORTS;

    std::string provider = "raydium";   // "jupiter" or "raydium"
    std::string jupiter_api_url = "https://api.jup.ag/swap/v1";
    std::string jupiter_token_list_url = "https://token.jup.ag/strict";
    std::string raydium_api_url = "https://transaction-v1-devnet.raydium.io";
    std::string raydium_pools_api_url = "https://api-v3-devnet.raydium.io";
    uint32_t default_slippage_bps = sdk::constants::DEFAULT_SLIPPAGE_BPS;

    std::string prover_url = "http://127.0.0.1:8090";

    std::string log_path = sdk::constants::LOG_PATH;
    std::string log_level = "info";
    size_t worker_threads = sdk::constants::DEFAULT_THREAD_POOL_SIZE;

    /**
     * @brief Read a configuration file over the defaults
     *
     * Lines are "key = value"; blank lines and lines starting with '#' are
     * skipped. Unknown keys are logged and ignored.
     */
    static Result<RelayConfig> load(const std::string& path);

    /**
     * @brief First existing file of the default search path, empty if none
     */
    static std::string find_default_path();

    static const std::vector<std::string>& search_path();

    /**
     * @brief Apply one setting; CONFIG_ERROR on a malformed value
     */
    Result<void> set(const std::string& key, const std::string& value);

    Result<void> validate() const;
};

} // namespace relay
} // namespace veilrelay
