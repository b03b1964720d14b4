/**
 * @file ProofJobManager.hpp
 * @brief Asynchronous proof-generation jobs: submission, progress, terminal state, expiry
 */

#pragma once

#include "veilrelay/relay/ProofJob.hpp"
#include "veilrelay/relay/ProofGenerator.hpp"
#include "veilrelay/sdk/ThreadPool.hpp"
#include "veilrelay/sdk/constants.hpp"
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace veilrelay {
namespace relay {

/**
 * @brief Owns the job table and drives each job through its stages
 *
 * Every job is processed exactly once on the shared worker pool. Status only
 * moves forward: PENDING -> PROCESSING -> COMPLETED | FAILED. Terminal jobs are
 * dropped by the sweep once older than the retention window.
 */
class ProofJobManager {
public:
    struct Options {
        std::chrono::milliseconds stage_delay = sdk::constants::PROOF_STAGE_DELAY;
        std::chrono::milliseconds retention = sdk::constants::JOB_RETENTION;
        std::chrono::milliseconds sweep_interval = sdk::constants::JOB_SWEEP_INTERVAL;
        std::function<TimePoint()> clock;
        std::function<void(std::chrono::milliseconds)> sleeper;
    };

    ProofJobManager(std::shared_ptr<ProofGenerator> generator,
                    std::shared_ptr<sdk::ThreadPool> pool);
    ProofJobManager(std::shared_ptr<ProofGenerator> generator,
                    std::shared_ptr<sdk::ThreadPool> pool,
                    Options options);

    ~ProofJobManager();

    ProofJobManager(const ProofJobManager&) = delete;
    ProofJobManager& operator=(const ProofJobManager&) = delete;

    /**
     * @brief Create a PENDING job and schedule it, returning its id immediately
     *
     * Identical parameters submitted twice produce two jobs.
     */
    Result<std::string> submit(const ProofJobParams& params);

    /**
     * @brief Snapshot of a job, nullopt when unknown or already swept
     */
    std::optional<ProofJob> get_status(const std::string& job_id) const;

    /**
     * @brief Drop terminal jobs created before now - retention
     * @return Number of jobs removed
     */
    size_t sweep_expired();

    size_t job_count() const;

    // Start / stop the periodic sweep
    void start();
    void stop();

    /**
     * @brief Block until no job is being processed
     */
    void wait_idle();

private:
    void process_job(const std::string& job_id);

    // Forward-only progress write; ignored for unknown or terminal jobs
    void update_progress(const std::string& job_id, int progress, const std::string& stage);

    void complete_job(const std::string& job_id, ProofResult result);
    void fail_job(const std::string& job_id, const std::string& error);

    void sweep_loop();

    TimePoint now() const { return options_.clock(); }

    std::shared_ptr<ProofGenerator> generator_;
    std::shared_ptr<sdk::ThreadPool> pool_;
    Options options_;

    mutable std::mutex jobs_mutex_;
    std::unordered_map<std::string, ProofJob> jobs_;
    size_t in_flight_ = 0;
    std::condition_variable idle_cv_;

    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    std::thread sweep_thread_;
    bool sweeping_ = false;
};

} // namespace relay
} // namespace veilrelay
