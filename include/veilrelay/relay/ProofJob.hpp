#pragma once

#include "veilrelay/sdk/types.hpp"
#include <map>
#include <optional>
#include <string>

namespace veilrelay {
namespace relay {

using sdk::ByteVector;
using sdk::TimePoint;

enum class JobStatus {
    PENDING,
    PROCESSING,
    COMPLETED,
    FAILED
};

inline std::string to_string(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING: return "pending";
        case JobStatus::PROCESSING: return "processing";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Withdrawal parameters a proof is generated for
 */
struct ProofJobParams {
    std::string commitment;   // hex
    std::string secret;       // hex, never logged
    uint64_t amount = 0;      // lamports
    std::string recipient;    // base58
    uint64_t denomination = 0;
};

/**
 * @brief Output of the proof generator, validated once when the job completes
 */
struct ProofResult {
    ByteVector proof;
    ByteVector nullifier;
    std::map<std::string, std::string> public_inputs;
    bool verified = false;
};

struct ProofJob {
    std::string id;
    JobStatus status = JobStatus::PENDING;
    int progress = 0;
    std::string stage = "queued";
    TimePoint created_at;
    ProofJobParams params;
    std::optional<ProofResult> result;   // set iff COMPLETED
    std::optional<std::string> error;    // set iff FAILED

    bool is_terminal() const {
        return status == JobStatus::COMPLETED || status == JobStatus::FAILED;
    }
};

} // namespace relay
} // namespace veilrelay
