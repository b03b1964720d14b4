#pragma once

#include <string>

namespace veilrelay {
namespace sdk {

/**
 * @brief Error codes for the relay SDK
 */
enum class ErrorCode {
    SUCCESS = 0,
    INVALID_PARAMETER,
    INVALID_ADDRESS,
    INVALID_NULLIFIER,
    SERVICE_DISABLED,
    JOB_NOT_FOUND,
    JOB_NOT_COMPLETE,
    PROOF_RESULT_MISSING,
    PROOF_GENERATION_FAILED,
    CHAIN_REJECTED,
    CONFIRMATION_TIMEOUT,
    RPC_ERROR,
    ACCOUNT_NOT_FOUND,
    SIGNATURE_FAILED,
    NETWORK_ERROR,
    CONNECTION_TIMEOUT,
    SSL_ERROR,
    RATE_LIMITED,
    UPSTREAM_UNAVAILABLE,
    NO_ROUTE,
    AGGREGATOR_REJECTED,
    SIMULATION_FAILED,
    MALFORMED_RESPONSE,
    CIRCUIT_OPEN,
    THREAD_POOL_ERROR,
    CONFIG_ERROR,
    FILE_IO_ERROR,
    INTERNAL_ERROR
};

/**
 * @brief Coarse classification used for retry and exposure decisions
 */
enum class ErrorCategory {
    NONE,
    VALIDATION,            // Malformed input, safe to surface, never retried
    DOMAIN,                // Service state or chain rejection, safe to surface
    AGGREGATOR_TRANSIENT,  // Retryable provider or network failure
    AGGREGATOR_PERMANENT,  // Provider refused, retrying cannot help
    INTERNAL               // Must be sanitized before leaving the process
};

/**
 * @brief Convert error code to string
 */
inline std::string ErrorCodeToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::INVALID_PARAMETER: return "Invalid parameter";
        case ErrorCode::INVALID_ADDRESS: return "Invalid address";
        case ErrorCode::INVALID_NULLIFIER: return "Invalid nullifier length";
        case ErrorCode::SERVICE_DISABLED: return "Relayer service is currently disabled";
        case ErrorCode::JOB_NOT_FOUND: return "Proof job not found";
        case ErrorCode::JOB_NOT_COMPLETE: return "Proof job not complete";
        case ErrorCode::PROOF_RESULT_MISSING: return "Proof or nullifier missing from job result";
        case ErrorCode::PROOF_GENERATION_FAILED: return "Proof generation failed";
        case ErrorCode::CHAIN_REJECTED: return "Transaction rejected by chain";
        case ErrorCode::CONFIRMATION_TIMEOUT: return "Transaction confirmation timed out";
        case ErrorCode::RPC_ERROR: return "RPC error";
        case ErrorCode::ACCOUNT_NOT_FOUND: return "Account not found";
        case ErrorCode::SIGNATURE_FAILED: return "Signature failed";
        case ErrorCode::NETWORK_ERROR: return "Network error";
        case ErrorCode::CONNECTION_TIMEOUT: return "Connection timeout";
        case ErrorCode::SSL_ERROR: return "SSL error";
        case ErrorCode::RATE_LIMITED: return "Rate limited";
        case ErrorCode::UPSTREAM_UNAVAILABLE: return "Upstream service unavailable";
        case ErrorCode::NO_ROUTE: return "No swap route found";
        case ErrorCode::AGGREGATOR_REJECTED: return "Swap aggregator rejected the request";
        case ErrorCode::SIMULATION_FAILED: return "Swap simulation failed";
        case ErrorCode::MALFORMED_RESPONSE: return "Malformed response";
        case ErrorCode::CIRCUIT_OPEN: return "Circuit breaker open";
        case ErrorCode::THREAD_POOL_ERROR: return "Thread pool error";
        case ErrorCode::CONFIG_ERROR: return "Configuration error";
        case ErrorCode::FILE_IO_ERROR: return "File I/O error";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

/**
 * @brief Classify an error code
 */
inline ErrorCategory classify(ErrorCode error) {
    switch (error) {
        case ErrorCode::SUCCESS:
            return ErrorCategory::NONE;
        case ErrorCode::INVALID_PARAMETER:
        case ErrorCode::INVALID_ADDRESS:
        case ErrorCode::INVALID_NULLIFIER:
        case ErrorCode::CONFIG_ERROR:
            return ErrorCategory::VALIDATION;
        case ErrorCode::SERVICE_DISABLED:
        case ErrorCode::JOB_NOT_FOUND:
        case ErrorCode::JOB_NOT_COMPLETE:
        case ErrorCode::PROOF_RESULT_MISSING:
        case ErrorCode::PROOF_GENERATION_FAILED:
        case ErrorCode::CHAIN_REJECTED:
        case ErrorCode::CONFIRMATION_TIMEOUT:
        case ErrorCode::RPC_ERROR:
        case ErrorCode::ACCOUNT_NOT_FOUND:
            return ErrorCategory::DOMAIN;
        case ErrorCode::NETWORK_ERROR:
        case ErrorCode::CONNECTION_TIMEOUT:
        case ErrorCode::SSL_ERROR:
        case ErrorCode::RATE_LIMITED:
        case ErrorCode::UPSTREAM_UNAVAILABLE:
        case ErrorCode::CIRCUIT_OPEN:
            return ErrorCategory::AGGREGATOR_TRANSIENT;
        case ErrorCode::NO_ROUTE:
        case ErrorCode::AGGREGATOR_REJECTED:
        case ErrorCode::SIMULATION_FAILED:
        case ErrorCode::MALFORMED_RESPONSE:
            return ErrorCategory::AGGREGATOR_PERMANENT;
        default:
            return ErrorCategory::INTERNAL;
    }
}

inline bool is_transient(ErrorCode error) {
    return classify(error) == ErrorCategory::AGGREGATOR_TRANSIENT;
}

/**
 * @brief HTTP status the calling layer should answer with for an error
 */
inline int recommended_status(ErrorCode error) {
    switch (error) {
        case ErrorCode::SUCCESS: return 200;
        case ErrorCode::JOB_NOT_FOUND: return 404;
        case ErrorCode::SERVICE_DISABLED: return 503;
        case ErrorCode::PROOF_RESULT_MISSING: return 500;
        case ErrorCode::CHAIN_REJECTED:
        case ErrorCode::CONFIRMATION_TIMEOUT:
        case ErrorCode::RPC_ERROR:
            return 502;
        default:
            break;
    }

    switch (classify(error)) {
        case ErrorCategory::VALIDATION:
        case ErrorCategory::DOMAIN:
            return 400;
        case ErrorCategory::AGGREGATOR_TRANSIENT:
            return 503;
        case ErrorCategory::AGGREGATOR_PERMANENT:
            return 502;
        default:
            return 500;
    }
}

} // namespace sdk
} // namespace veilrelay
