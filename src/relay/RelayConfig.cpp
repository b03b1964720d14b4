#include "veilrelay/relay/RelayConfig.hpp"
#include "veilrelay/sdk/HttpClient.hpp"
#include "veilrelay/sdk/PublicKey.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"
#include <filesystem>
#include <fstream>
#include <limits>

namespace veilrelay {
namespace relay {

using sdk::ErrorCode;
using sdk::SecureLogger;

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

Result<uint64_t> parse_number(const std::string& key, const std::string& value, uint64_t max) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return {ErrorCode::CONFIG_ERROR, "Invalid number for " + key + ": " + value};
    }
    try {
        const unsigned long long parsed = std::stoull(value);
        if (parsed > max) {
            return {ErrorCode::CONFIG_ERROR, "Value out of range for " + key + ": " + value};
        }
        return static_cast<uint64_t>(parsed);
    } catch (const std::out_of_range&) {
        return {ErrorCode::CONFIG_ERROR, "Value out of range for " + key + ": " + value};
    }
}

Result<bool> parse_bool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "yes" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "0") {
        return false;
    }
    return {ErrorCode::CONFIG_ERROR, "Invalid boolean for " + key + ": " + value};
}

} // namespace

const std::vector<std::string>& RelayConfig::search_path() {
    static const std::vector<std::string> paths = {
        "/etc/veilrelay/veilrelay.conf",
        "./veilrelay.conf"
    };
    return paths;
}

std::string RelayConfig::find_default_path() {
    for (const auto& path : search_path()) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            return path;
        }
    }
    return "";
}

Result<RelayConfig> RelayConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return {ErrorCode::FILE_IO_ERROR, "Cannot open configuration file: " + path};
    }

    RelayConfig config;
    std::string line;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            return {ErrorCode::CONFIG_ERROR, path + ":" + std::to_string(line_number) + ": expected key = value"};
        }

        auto applied = config.set(trim(line.substr(0, pos)), trim(line.substr(pos + 1)));
        if (applied.is_err()) {
            return {applied.error(), path + ":" + std::to_string(line_number) + ": " + applied.error_message()};
        }
    }

    SecureLogger::instance().info("Loaded configuration from " + path);
    return config;
}

Result<void> RelayConfig::set(const std::string& key, const std::string& value) {
    if (key == "rpc_url") {
        rpc_url = value;
    } else if (key == "program_id") {
        program_id = value;
    } else if (key == "keypair_path") {
        keypair_path = value;
    } else if (key == "relayer_enabled") {
        auto parsed = parse_bool(key, value);
        if (parsed.is_err()) {
            return {parsed.error(), parsed.error_message()};
        }
        relayer_enabled = parsed.value();
    } else if (key == "fee_bps") {
        auto parsed = parse_number(key, value, 10000);
        if (parsed.is_err()) {
            return {parsed.error(), parsed.error_message()};
        }
        fee_bps = static_cast<uint32_t>(parsed.value());
    } else if (key == "min_fee") {
        auto parsed = parse_number(key, value, std::numeric_limits<uint64_t>::max());
        if (parsed.is_err()) {
            return {parsed.error(), parsed.error_message()};
        }
        min_fee = parsed.value();
    } else if (key == "provider") {
        provider = value;
    } else if (key == "jupiter_api_url") {
        jupiter_api_url = value;
    } else if (key == "jupiter_token_list_url") {
        jupiter_token_list_url = value;
    } else if (key == "raydium_api_url") {
        raydium_api_url = value;
    } else if (key == "raydium_pools_api_url") {
        raydium_pools_api_url = value;
    } else if (key == "default_slippage_bps") {
        auto parsed = parse_number(key, value, 10000);
        if (parsed.is_err()) {
            return {parsed.error(), parsed.error_message()};
        }
        default_slippage_bps = static_cast<uint32_t>(parsed.value());
    } else if (key == "prover_url") {
        prover_url = value;
    } else if (key == "log_path") {
        log_path = value;
    } else if (key == "log_level") {
        log_level = value;
    } else if (key == "worker_threads") {
        auto parsed = parse_number(key, value, 1024);
        if (parsed.is_err()) {
            return {parsed.error(), parsed.error_message()};
        }
        worker_threads = static_cast<size_t>(parsed.value());
    } else {
        SecureLogger::instance().warning("Ignoring unknown configuration key: " + key);
    }
    return {};
}

Result<void> RelayConfig::validate() const {
    if (provider != "jupiter" && provider != "raydium") {
        return {ErrorCode::CONFIG_ERROR, "Unknown swap provider: " + provider};
    }
    if (sdk::parse_url(rpc_url).is_err()) {
        return {ErrorCode::CONFIG_ERROR, "Invalid rpc_url: " + rpc_url};
    }
    if (sdk::parse_url(prover_url).is_err()) {
        return {ErrorCode::CONFIG_ERROR, "Invalid prover_url: " + prover_url};
    }
    if (sdk::PublicKey::from_base58(program_id).is_err()) {
        return {ErrorCode::CONFIG_ERROR, "Invalid program_id: " + program_id};
    }
    if (worker_threads == 0) {
        return {ErrorCode::CONFIG_ERROR, "worker_threads must be at least 1"};
    }
    return {};
}

} // namespace relay
} // namespace veilrelay
