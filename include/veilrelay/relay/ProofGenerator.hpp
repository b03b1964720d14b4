#pragma once

#include "veilrelay/relay/ProofJob.hpp"
#include "veilrelay/sdk/HttpClient.hpp"
#include <memory>
#include <string>

namespace veilrelay {
namespace relay {

using sdk::Result;

/**
 * @brief Produces a withdrawal proof and nullifier for a deposit
 *
 * Validation and domain errors carry messages safe to show a client. Anything
 * else is treated as internal by the job manager.
 */
class ProofGenerator {
public:
    virtual ~ProofGenerator() = default;

    virtual Result<ProofResult> generate_proof(const ProofJobParams& params) = 0;
};

/**
 * @brief Client for an external prover service, POST {url}/prove
 */
class RemoteProverClient : public ProofGenerator {
public:
    RemoteProverClient(std::string prover_url, std::shared_ptr<sdk::HttpTransport> transport);

    Result<ProofResult> generate_proof(const ProofJobParams& params) override;

private:
    std::string prover_url_;
    std::shared_ptr<sdk::HttpTransport> transport_;
};

} // namespace relay
} // namespace veilrelay
