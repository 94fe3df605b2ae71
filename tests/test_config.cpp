#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "config/config.hpp"
#include <filesystem>
#include <fstream>

using namespace gate;

class ConfigTest : public ::testing::Test {
protected:
    std::string path_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = "/tmp/test_gate_config_" + std::string(info->name()) + "_" +
                std::to_string(now_ms()) + ".json";
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    void write(const std::string& text) {
        std::ofstream out(path_);
        out << text;
    }
};

TEST_F(ConfigTest, Defaults_AreValid) {
    Config config;
    EXPECT_TRUE(config.validate());
    EXPECT_DOUBLE_EQ(config.risk.max_risk_per_trade, 0.01);
    EXPECT_DOUBLE_EQ(config.risk.max_effective_leverage, 10.0);
    EXPECT_DOUBLE_EQ(config.risk.min_free_margin_pct, 0.10);
}

TEST_F(ConfigTest, Validate_RejectsFreeMarginFloorOutOfRange) {
    Config config;
    config.risk.min_free_margin_pct = 1.0;
    EXPECT_FALSE(config.validate());
    config.risk.min_free_margin_pct = -0.1;
    EXPECT_FALSE(config.validate());
    config.risk.min_free_margin_pct = 0.0;
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, Validate_RejectsCriticalAboveMinimumBuffer) {
    Config config;
    config.risk.critical_liquidation_buffer = 0.1;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, Validate_RejectsCeilingBelowCap) {
    Config config;
    config.risk.correlated_hard_ceiling = 5.0;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, Validate_RejectsNonPositiveSnapshotAge) {
    Config config;
    config.integrity.max_snapshot_age_ms = 0;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, Logging_FilePathJoinsDirectoryAndName) {
    LoggingConfig logging;
    EXPECT_EQ(logging.log_file_path(), "./logs/mandate_gate.log");

    logging.log_dir = "/var/log/gate";
    logging.log_file = "replay.log";
    EXPECT_EQ(logging.log_file_path(), "/var/log/gate/replay.log");
}

TEST_F(ConfigTest, Logging_LevelParsedFromName) {
    LoggingConfig logging;
    EXPECT_EQ(logging.level(), spdlog::level::info);
    logging.log_level = "warn";
    EXPECT_EQ(logging.level(), spdlog::level::warn);
    logging.log_level = "error";
    EXPECT_EQ(logging.level(), spdlog::level::err);
    logging.log_level = "off";
    EXPECT_TRUE(logging.validate());
}

TEST_F(ConfigTest, Validate_RejectsUnknownLogLevel) {
    Config config;
    config.logging.log_level = "verbose";
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, Validate_RejectsFileLoggingWithoutName) {
    Config config;
    config.logging.log_to_file = true;
    config.logging.log_file = "";
    EXPECT_FALSE(config.validate());

    config.logging.log_file = "gate.log";
    config.logging.max_log_files = 0;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, SaveAndLoad_RoundTrip) {
    Config config;
    config.risk.max_symbol_exposure = 3.0;
    config.risk.min_free_margin_pct = 0.25;
    config.risk.correlation_groups["majors"] = {"BTCUSDT", "ETHUSDT"};
    config.integrity.required_primitives = {"spread_bps"};
    config.engine.parallel_symbols = true;
    config.audit.positions_db_path = "/tmp/positions.db";
    config.logging.log_file = "replay.log";
    config.save(path_);

    Config loaded = Config::load(path_);
    EXPECT_DOUBLE_EQ(loaded.risk.max_symbol_exposure, 3.0);
    EXPECT_DOUBLE_EQ(loaded.risk.min_free_margin_pct, 0.25);
    ASSERT_EQ(loaded.risk.correlation_groups.count("majors"), 1u);
    EXPECT_EQ(loaded.risk.correlation_groups.at("majors").size(), 2u);
    EXPECT_EQ(loaded.integrity.required_primitives.size(), 1u);
    EXPECT_TRUE(loaded.engine.parallel_symbols);
    EXPECT_EQ(loaded.audit.positions_db_path, "/tmp/positions.db");
    EXPECT_EQ(loaded.logging.log_file, "replay.log");
}

TEST_F(ConfigTest, Load_PartialFileKeepsDefaults) {
    write(R"({"risk": {"max_risk_per_trade": 0.02}})");

    Config loaded = Config::load(path_);
    EXPECT_DOUBLE_EQ(loaded.risk.max_risk_per_trade, 0.02);
    EXPECT_DOUBLE_EQ(loaded.risk.max_symbol_exposure, 5.0);
    EXPECT_EQ(loaded.logging.log_level, "info");
}

TEST_F(ConfigTest, Load_MissingFileThrows) {
    EXPECT_THROW(Config::load("/tmp/does_not_exist_gate_config.json"), ConfigError);
}

TEST_F(ConfigTest, Load_MalformedFileThrows) {
    write("{ not json");
    EXPECT_THROW(Config::load(path_), ConfigError);
}

TEST_F(ConfigTest, Load_InvalidValuesThrow) {
    write(R"({"risk": {"max_risk_per_trade": 0}})");
    EXPECT_THROW(Config::load(path_), ConfigError);
}

TEST_F(ConfigTest, GroupsFor_ReturnsMembershipInNameOrder) {
    RiskEnvelope env;
    env.correlation_groups["majors"] = {"BTCUSDT", "ETHUSDT"};
    env.correlation_groups["l1"] = {"ETHUSDT", "SOLUSDT"};

    auto groups = env.groups_for("ETHUSDT");
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0], "l1");
    EXPECT_EQ(groups[1], "majors");
    EXPECT_TRUE(env.groups_for("DOGEUSDT").empty());
}
