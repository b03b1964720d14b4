#include "veilrelay/relay/RelayConfig.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace veilrelay::relay;
using veilrelay::sdk::ErrorCode;

namespace {

class RelayConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() /
               ("veilrelay-config-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "-" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".conf");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    void write(const std::string& contents) {
        std::ofstream out(path);
        out << contents;
    }

    std::filesystem::path path;
};

} // namespace

TEST_F(RelayConfigTest, DefaultsAreValid) {
    RelayConfig config;
    EXPECT_TRUE(config.validate().is_ok());
    EXPECT_EQ(config.provider, "raydium");
    EXPECT_EQ(config.fee_bps, 30u);
    EXPECT_EQ(config.min_fee, 5000u);
    EXPECT_EQ(config.default_slippage_bps, 100u);
    EXPECT_TRUE(config.relayer_enabled);
}

TEST_F(RelayConfigTest, LoadsKeyValueFile) {
    write("# relay settings\n"
          "\n"
          "rpc_url = http://127.0.0.1:8899\n"
          "  provider=jupiter  \n"
          "fee_bps = 50\n"
          "min_fee = 10000\n"
          "relayer_enabled = no\n"
          "default_slippage_bps = 75\n"
          "worker_threads = 4\n"
          "log_level = debug\n");

    auto config = RelayConfig::load(path.string());
    ASSERT_TRUE(config.is_ok()) << config.error_message();
    EXPECT_EQ(config.value().rpc_url, "http://127.0.0.1:8899");
    EXPECT_EQ(config.value().provider, "jupiter");
    EXPECT_EQ(config.value().fee_bps, 50u);
    EXPECT_EQ(config.value().min_fee, 10000u);
    EXPECT_FALSE(config.value().relayer_enabled);
    EXPECT_EQ(config.value().default_slippage_bps, 75u);
    EXPECT_EQ(config.value().worker_threads, 4u);
    EXPECT_EQ(config.value().log_level, "debug");
    EXPECT_TRUE(config.value().validate().is_ok());
}

TEST_F(RelayConfigTest, UnknownKeysAreIgnored) {
    write("colour = blue\nfee_bps = 40\n");

    auto config = RelayConfig::load(path.string());
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().fee_bps, 40u);
}

TEST_F(RelayConfigTest, ErrorsNameTheLine) {
    write("fee_bps = 30\nthis line has no separator\n");

    auto config = RelayConfig::load(path.string());
    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.error(), ErrorCode::CONFIG_ERROR);
    EXPECT_NE(config.error_message().find(":2:"), std::string::npos);
}

TEST_F(RelayConfigTest, RejectsMalformedValues) {
    RelayConfig config;
    EXPECT_EQ(config.set("fee_bps", "thirty").error(), ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(config.set("fee_bps", "-1").error(), ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(config.set("fee_bps", "10001").error(), ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(config.set("min_fee", "99999999999999999999999").error(), ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(config.set("relayer_enabled", "maybe").error(), ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(config.fee_bps, 30u);

    EXPECT_TRUE(config.set("fee_bps", "10000").is_ok());
    EXPECT_EQ(config.fee_bps, 10000u);
}

TEST_F(RelayConfigTest, MissingFileIsIoError) {
    auto config = RelayConfig::load((path.parent_path() / "veilrelay-does-not-exist.conf").string());
    EXPECT_EQ(config.error(), ErrorCode::FILE_IO_ERROR);
}

TEST_F(RelayConfigTest, ValidateCatchesInconsistentSettings) {
    RelayConfig provider;
    provider.provider = "orca";
    EXPECT_EQ(provider.validate().error(), ErrorCode::CONFIG_ERROR);

    RelayConfig rpc;
    rpc.rpc_url = "api.devnet.solana.com";
    EXPECT_EQ(rpc.validate().error(), ErrorCode::CONFIG_ERROR);

    RelayConfig program;
    program.program_id = "xyz";
    EXPECT_EQ(program.validate().error(), ErrorCode::CONFIG_ERROR);

    RelayConfig threads;
    threads.worker_threads = 0;
    EXPECT_EQ(threads.validate().error(), ErrorCode::CONFIG_ERROR);
}
