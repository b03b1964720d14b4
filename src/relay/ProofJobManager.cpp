#include "veilrelay/relay/ProofJobManager.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>

namespace veilrelay {
namespace relay {

using sdk::ErrorCode;
using sdk::ErrorCategory;
using sdk::SecureLogger;

namespace {

const std::string SANITIZED_FAILURE = "Proof generation failed unexpectedly";

std::string generate_job_id() {
    // random_generator is not thread-safe, one per thread
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

bool is_known_denomination(uint64_t denomination) {
    if (denomination == sdk::constants::CUSTOM_DENOMINATION) {
        return true;
    }
    const auto& fixed = sdk::constants::FIXED_DENOMINATIONS;
    return std::find(fixed.begin(), fixed.end(), denomination) != fixed.end();
}

} // namespace

ProofJobManager::ProofJobManager(std::shared_ptr<ProofGenerator> generator,
                                 std::shared_ptr<sdk::ThreadPool> pool)
    : ProofJobManager(std::move(generator), std::move(pool), Options()) {
}

ProofJobManager::ProofJobManager(std::shared_ptr<ProofGenerator> generator,
                                 std::shared_ptr<sdk::ThreadPool> pool,
                                 Options options)
    : generator_(std::move(generator)),
      pool_(std::move(pool)),
      options_(std::move(options)) {
    if (!generator_ || !pool_) {
        throw std::invalid_argument("ProofJobManager requires a generator and a worker pool");
    }
    if (!options_.clock) {
        options_.clock = [] { return std::chrono::system_clock::now(); };
    }
    if (!options_.sleeper) {
        options_.sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

ProofJobManager::~ProofJobManager() {
    stop();
    wait_idle();
}

Result<std::string> ProofJobManager::submit(const ProofJobParams& params) {
    if (params.amount == 0) {
        return {ErrorCode::INVALID_PARAMETER, "Amount must be greater than zero"};
    }
    if (!is_known_denomination(params.denomination)) {
        return {ErrorCode::INVALID_PARAMETER,
                "Invalid denomination: " + std::to_string(params.denomination)};
    }

    ProofJob job;
    job.id = generate_job_id();
    job.created_at = now();
    job.params = params;

    const std::string job_id = job.id;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        jobs_.emplace(job_id, std::move(job));
        ++in_flight_;
    }

    try {
        pool_->enqueue_normal([this, job_id] { process_job(job_id); });
    } catch (const std::exception& e) {
        SecureLogger::instance().error("Failed to schedule proof job " + job_id + ": " + e.what());
        fail_job(job_id, SANITIZED_FAILURE);

        std::lock_guard<std::mutex> lock(jobs_mutex_);
        --in_flight_;
        idle_cv_.notify_all();
        return {ErrorCode::THREAD_POOL_ERROR, "Proof job could not be scheduled"};
    }

    SecureLogger::instance().info("Proof job " + job_id + " submitted (amount " +
                                  std::to_string(params.amount) + ", denomination " +
                                  std::to_string(params.denomination) + ")");
    return job_id;
}

std::optional<ProofJob> ProofJobManager::get_status(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ProofJobManager::update_progress(const std::string& job_id, int progress, const std::string& stage) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end() || it->second.is_terminal() || progress < it->second.progress) {
        return;
    }
    it->second.progress = progress;
    it->second.stage = stage;
}

void ProofJobManager::complete_job(const std::string& job_id, ProofResult result) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end() || it->second.is_terminal()) {
        return;
    }
    it->second.status = JobStatus::COMPLETED;
    it->second.progress = 100;
    it->second.result = std::move(result);
}

void ProofJobManager::fail_job(const std::string& job_id, const std::string& error) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end() || it->second.is_terminal()) {
        return;
    }
    it->second.status = JobStatus::FAILED;
    it->second.error = error;
}

void ProofJobManager::process_job(const std::string& job_id) {
    ProofJobParams params;
    bool claimed = false;

    // Claim and copy inputs in one critical section
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        auto it = jobs_.find(job_id);
        if (it != jobs_.end() && it->second.status == JobStatus::PENDING) {
            it->second.status = JobStatus::PROCESSING;
            params = it->second.params;
            claimed = true;
        }
    }

    if (claimed) {
        try {
            update_progress(job_id, 10, "initializing");
            options_.sleeper(options_.stage_delay);

            update_progress(job_id, 30, "generating_witnesses");
            options_.sleeper(options_.stage_delay);

            update_progress(job_id, 60, "computing_proof");

            auto result = generator_->generate_proof(params);

            if (result.is_ok()) {
                const ProofResult& proof = result.value();
                if (proof.proof.empty() || proof.nullifier.size() != sdk::constants::NULLIFIER_SIZE) {
                    SecureLogger::instance().error("Proof job " + job_id + " produced a malformed result (proof " +
                                                   std::to_string(proof.proof.size()) + " bytes, nullifier " +
                                                   std::to_string(proof.nullifier.size()) + " bytes)");
                    fail_job(job_id, "Proof generator returned a malformed result");
                } else {
                    update_progress(job_id, 90, "verifying_proof");
                    options_.sleeper(options_.stage_delay * 2 / 3);

                    update_progress(job_id, 100, "finalizing");
                    complete_job(job_id, std::move(result.value()));
                    SecureLogger::instance().info("Proof job " + job_id + " completed");
                }
            } else {
                const ErrorCategory category = sdk::classify(result.error());
                if (category == ErrorCategory::VALIDATION || category == ErrorCategory::DOMAIN) {
                    SecureLogger::instance().warning("Proof job " + job_id + " failed: " + result.error_message());
                    fail_job(job_id, result.error_message());
                } else {
                    SecureLogger::instance().error("Proof job " + job_id + " failed internally: " +
                                                   result.error_message());
                    fail_job(job_id, SANITIZED_FAILURE);
                }
            }
        } catch (const std::exception& e) {
            SecureLogger::instance().error("Proof job " + job_id + " threw: " + e.what());
            fail_job(job_id, SANITIZED_FAILURE);
        }
    }

    std::lock_guard<std::mutex> lock(jobs_mutex_);
    --in_flight_;
    idle_cv_.notify_all();
}

size_t ProofJobManager::sweep_expired() {
    const TimePoint cutoff = now() - options_.retention;
    size_t removed = 0;

    std::lock_guard<std::mutex> lock(jobs_mutex_);
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        if (it->second.is_terminal() && it->second.created_at < cutoff) {
            it = jobs_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        SecureLogger::instance().info("Swept " + std::to_string(removed) + " expired proof jobs");
    }
    return removed;
}

size_t ProofJobManager::job_count() const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    return jobs_.size();
}

void ProofJobManager::start() {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    if (sweeping_) {
        return;
    }
    sweeping_ = true;
    sweep_thread_ = std::thread([this] { sweep_loop(); });
    SecureLogger::instance().info("Proof job sweep started");
}

void ProofJobManager::stop() {
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        if (!sweeping_) {
            return;
        }
        sweeping_ = false;
    }
    sweep_cv_.notify_all();

    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
    SecureLogger::instance().info("Proof job sweep stopped");
}

void ProofJobManager::wait_idle() {
    std::unique_lock<std::mutex> lock(jobs_mutex_);
    idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
}

void ProofJobManager::sweep_loop() {
    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (sweeping_) {
        if (sweep_cv_.wait_for(lock, options_.sweep_interval, [this] { return !sweeping_; })) {
            break;
        }

        lock.unlock();
        sweep_expired();
        lock.lock();
    }
}

} // namespace relay
} // namespace veilrelay
