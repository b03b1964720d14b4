#include "veilrelay/relay/ProofJobManager.hpp"
#include "veilrelay/testing/fakes.hpp"
#include <gtest/gtest.h>
#include <functional>
#include <future>
#include <set>
#include <utility>

using namespace veilrelay::relay;
using namespace veilrelay::testing;
using veilrelay::sdk::ErrorCode;
using veilrelay::sdk::ThreadPool;

namespace {

ProofJobParams make_params(uint64_t amount = 2000000000ull, uint64_t denomination = 0) {
    ProofJobParams params;
    params.commitment = "0a0b0c";
    params.secret = "deadbeef";
    params.amount = amount;
    params.recipient = make_key(9).to_base58();
    params.denomination = denomination;
    return params;
}

class ProofJobManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool = std::make_shared<ThreadPool>(2);
        generator = std::make_shared<FakeProofGenerator>();
        clock_now = std::chrono::system_clock::now();
    }

    void TearDown() override {
        manager.reset();
        pool->shutdown();
    }

    void create_manager() {
        ProofJobManager::Options options;
        options.stage_delay = std::chrono::milliseconds(30);
        options.sweep_interval = sweep_interval;
        options.clock = [this] { return clock_now; };
        options.sleeper = [this](std::chrono::milliseconds delay) {
            {
                std::lock_guard<std::mutex> lock(delays_mutex);
                delays.push_back(delay.count());
            }
            if (on_sleep) {
                on_sleep();
            }
        };
        manager = std::make_unique<ProofJobManager>(generator, pool, options);
    }

    ProofJob run_to_completion(const ProofJobParams& params) {
        auto id = manager->submit(params);
        EXPECT_TRUE(id.is_ok()) << id.error_message();
        manager->wait_idle();
        auto job = manager->get_status(id.value());
        EXPECT_TRUE(job.has_value());
        return *job;
    }

    std::shared_ptr<ThreadPool> pool;
    std::shared_ptr<FakeProofGenerator> generator;
    std::unique_ptr<ProofJobManager> manager;
    veilrelay::sdk::TimePoint clock_now;
    std::chrono::milliseconds sweep_interval = veilrelay::sdk::constants::JOB_SWEEP_INTERVAL;
    std::function<void()> on_sleep;

    std::mutex delays_mutex;
    std::vector<int64_t> delays;
};

} // namespace

TEST_F(ProofJobManagerTest, CompletesWithValidatedResult) {
    create_manager();

    ProofJob job = run_to_completion(make_params());
    EXPECT_EQ(job.status, JobStatus::COMPLETED);
    EXPECT_EQ(job.progress, 100);
    EXPECT_EQ(job.stage, "finalizing");
    ASSERT_TRUE(job.result.has_value());
    EXPECT_EQ(job.result->nullifier.size(), 32u);
    EXPECT_FALSE(job.error.has_value());
    EXPECT_EQ(generator->calls.load(), 1);
}

TEST_F(ProofJobManagerTest, PacesStagesWithStageDelay) {
    create_manager();
    run_to_completion(make_params());

    std::lock_guard<std::mutex> lock(delays_mutex);
    EXPECT_EQ(delays, (std::vector<int64_t>{30, 30, 20}));
}

TEST_F(ProofJobManagerTest, ReportsProgressWhileProving) {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    generator->handler = [released](const ProofJobParams&) -> Result<ProofResult> {
        released.wait();
        return valid_proof_result();
    };
    create_manager();

    auto id = manager->submit(make_params());
    ASSERT_TRUE(id.is_ok());

    std::optional<ProofJob> job;
    for (int i = 0; i < 200; ++i) {
        job = manager->get_status(id.value());
        if (job && job->progress == 60) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::PROCESSING);
    EXPECT_EQ(job->progress, 60);
    EXPECT_EQ(job->stage, "computing_proof");
    EXPECT_FALSE(job->result.has_value());

    release.set_value();
    manager->wait_idle();
    EXPECT_EQ(manager->get_status(id.value())->status, JobStatus::COMPLETED);
}

TEST_F(ProofJobManagerTest, ProgressWalksEveryStageInOrder) {
    // One worker, held until the job id is known to the observers
    pool = std::make_shared<ThreadPool>(1);
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    pool->enqueue_normal([opened] { opened.wait(); });

    std::string job_id;
    std::mutex seen_mutex;
    std::vector<std::pair<int, std::string>> seen;
    auto record = [&] {
        auto job = manager->get_status(job_id);
        ASSERT_TRUE(job.has_value());
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.emplace_back(job->progress, job->stage);
    };
    on_sleep = record;
    generator->handler = [&](const ProofJobParams&) -> Result<ProofResult> {
        record();
        return valid_proof_result();
    };
    create_manager();

    auto id = manager->submit(make_params());
    ASSERT_TRUE(id.is_ok());
    job_id = id.value();
    gate.set_value();
    manager->wait_idle();
    record();

    const std::vector<std::pair<int, std::string>> expected = {
        {10, "initializing"},
        {30, "generating_witnesses"},
        {60, "computing_proof"},
        {90, "verifying_proof"},
        {100, "finalizing"},
    };
    std::lock_guard<std::mutex> lock(seen_mutex);
    EXPECT_EQ(seen, expected);
}

TEST_F(ProofJobManagerTest, IdenticalSubmissionsAreSeparateJobs) {
    create_manager();

    auto first = manager->submit(make_params());
    auto second = manager->submit(make_params());
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_NE(first.value(), second.value());

    manager->wait_idle();
    EXPECT_EQ(manager->job_count(), 2u);
    EXPECT_EQ(generator->calls.load(), 2);
}

TEST_F(ProofJobManagerTest, AcceptsCustomAndFixedDenominations) {
    create_manager();

    EXPECT_EQ(run_to_completion(make_params(2000000000ull, 0)).status, JobStatus::COMPLETED);
    EXPECT_EQ(run_to_completion(make_params(1000000000ull, 1000000000ull)).status, JobStatus::COMPLETED);
}

TEST_F(ProofJobManagerTest, RejectsInvalidSubmissions) {
    create_manager();

    auto bad_denomination = manager->submit(make_params(2000000000ull, 5));
    ASSERT_TRUE(bad_denomination.is_err());
    EXPECT_EQ(bad_denomination.error(), ErrorCode::INVALID_PARAMETER);

    auto zero = manager->submit(make_params(0, 0));
    EXPECT_EQ(zero.error(), ErrorCode::INVALID_PARAMETER);

    EXPECT_EQ(manager->job_count(), 0u);
}

TEST_F(ProofJobManagerTest, UnknownJobHasNoStatus) {
    create_manager();
    EXPECT_FALSE(manager->get_status("no-such-job").has_value());
}

TEST_F(ProofJobManagerTest, DomainFailuresKeepTheirMessage) {
    generator->handler = [](const ProofJobParams&) -> Result<ProofResult> {
        return {ErrorCode::PROOF_GENERATION_FAILED, "Commitment not found in tree"};
    };
    create_manager();

    ProofJob job = run_to_completion(make_params());
    EXPECT_EQ(job.status, JobStatus::FAILED);
    ASSERT_TRUE(job.error.has_value());
    EXPECT_EQ(*job.error, "Commitment not found in tree");
    EXPECT_FALSE(job.result.has_value());
}

TEST_F(ProofJobManagerTest, InternalFailuresAreSanitized) {
    generator->handler = [](const ProofJobParams&) -> Result<ProofResult> {
        return {ErrorCode::INTERNAL_ERROR, "witness file /tmp/w-91.bin unreadable"};
    };
    create_manager();

    ProofJob job = run_to_completion(make_params());
    EXPECT_EQ(job.status, JobStatus::FAILED);
    EXPECT_EQ(*job.error, "Proof generation failed unexpectedly");
}

TEST_F(ProofJobManagerTest, ThrowingGeneratorFailsTheJob) {
    generator->handler = [](const ProofJobParams&) -> Result<ProofResult> {
        throw std::runtime_error("segment 0x7f00 corrupted");
    };
    create_manager();

    ProofJob job = run_to_completion(make_params());
    EXPECT_EQ(job.status, JobStatus::FAILED);
    EXPECT_EQ(*job.error, "Proof generation failed unexpectedly");
}

TEST_F(ProofJobManagerTest, MalformedResultFailsTheJob) {
    generator->handler = [](const ProofJobParams&) -> Result<ProofResult> {
        ProofResult result = valid_proof_result();
        result.nullifier.resize(31);
        return result;
    };
    create_manager();

    ProofJob job = run_to_completion(make_params());
    EXPECT_EQ(job.status, JobStatus::FAILED);
    EXPECT_EQ(*job.error, "Proof generator returned a malformed result");
    EXPECT_FALSE(job.result.has_value());
}

TEST_F(ProofJobManagerTest, SweepDropsOnlyExpiredTerminalJobs) {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    generator->handler = [released](const ProofJobParams& params) -> Result<ProofResult> {
        if (params.commitment == "slow") {
            released.wait();
        }
        return valid_proof_result();
    };
    create_manager();

    auto done = run_to_completion(make_params());

    ProofJobParams slow = make_params();
    slow.commitment = "slow";
    auto running = manager->submit(slow);
    ASSERT_TRUE(running.is_ok());

    clock_now += std::chrono::minutes(30);
    EXPECT_EQ(manager->sweep_expired(), 0u);

    clock_now += std::chrono::minutes(31);
    EXPECT_EQ(manager->sweep_expired(), 1u);
    EXPECT_FALSE(manager->get_status(done.id).has_value());
    EXPECT_TRUE(manager->get_status(running.value()).has_value());

    release.set_value();
    manager->wait_idle();
}

TEST_F(ProofJobManagerTest, PeriodicSweepRunsBetweenStartAndStop) {
    sweep_interval = std::chrono::milliseconds(10);
    create_manager();

    run_to_completion(make_params());
    clock_now += std::chrono::minutes(61);
    manager->start();
    manager->start();

    for (int i = 0; i < 200 && manager->job_count() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(manager->job_count(), 0u);

    manager->stop();
    run_to_completion(make_params());
    clock_now += std::chrono::minutes(61);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(manager->job_count(), 1u);

    manager->stop();
}
