#include "lft/core/config.hpp"
#include "lft/core/logging.hpp"

#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using lft::ErrorCode;
using lft::core::TransferConfig;

TEST(TransferConfigTest, DefaultsAreValid) {
    TransferConfig config;
    EXPECT_TRUE(config.validate().is_ok());
    EXPECT_EQ(config.chunk_size, 64u * 1024u);
    EXPECT_EQ(config.ports, (std::vector<std::uint16_t>{5001, 5002, 5003, 5004, 5005}));
    EXPECT_EQ(config.ack_timeout, std::chrono::milliseconds(30000));
    ASSERT_TRUE(config.io_deadline().has_value());
    EXPECT_EQ(*config.io_deadline(), std::chrono::milliseconds(10000));
}

TEST(TransferConfigTest, JsonOverridesOnlyPresentKeys) {
    auto config = TransferConfig::from_json_text(R"({
        "chunk_size": 4096,
        "ack_timeout_ms": 1500,
        "io_timeout_ms": 0,
        "ports": [6000, 6001],
        "receive_root": "/srv/incoming",
        "log_level": "debug",
        "comment": "unknown keys are ignored"
    })");
    ASSERT_TRUE(config.is_ok()) << config.error().describe();

    EXPECT_EQ(config.value().chunk_size, 4096u);
    EXPECT_EQ(config.value().ack_timeout, std::chrono::milliseconds(1500));
    EXPECT_FALSE(config.value().io_deadline().has_value());
    EXPECT_EQ(config.value().ports, (std::vector<std::uint16_t>{6000, 6001}));
    EXPECT_EQ(config.value().receive_root, std::filesystem::path("/srv/incoming"));
    EXPECT_EQ(config.value().log_level, "debug");
    EXPECT_EQ(config.value().bind_address, "0.0.0.0");
    EXPECT_EQ(config.value().connect_timeout, std::chrono::milliseconds(5000));
}

TEST(TransferConfigTest, RejectsMalformedDocuments) {
    EXPECT_TRUE(TransferConfig::from_json_text("{ not json").is_error());
    EXPECT_TRUE(TransferConfig::from_json_text("[1, 2]").is_error());
    EXPECT_TRUE(TransferConfig::from_json_text(R"({"chunk_size": "big"})").is_error());
    EXPECT_TRUE(TransferConfig::from_json_text(R"({"chunk_size": -1})").is_error());
    EXPECT_TRUE(TransferConfig::from_json_text(R"({"chunk_size": 16777217})").is_error());
    EXPECT_TRUE(TransferConfig::from_json_text(R"({"ports": 5001})").is_error());
    EXPECT_TRUE(TransferConfig::from_json_text(R"({"ports": [70000]})").is_error());
    EXPECT_TRUE(TransferConfig::from_json_text(R"({"bind_address": 1})").is_error());

    auto bad = TransferConfig::from_json_text("{ not json");
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
}

TEST(TransferConfigTest, ValidateCatchesBadValues) {
    TransferConfig config;
    config.chunk_size = 0;
    EXPECT_TRUE(config.validate().is_error());

    config = TransferConfig{};
    config.ports.clear();
    EXPECT_TRUE(config.validate().is_error());

    config = TransferConfig{};
    config.ack_timeout = std::chrono::milliseconds(0);
    EXPECT_TRUE(config.validate().is_error());

    config = TransferConfig{};
    config.log_level = "chatty";
    EXPECT_TRUE(config.validate().is_error());
}

TEST(TransferConfigTest, LoadsFileOverBase) {
    const auto dir = lft::test::create_temp_dir("lft_config_");
    lft::test::write_file(dir / "lft.json", R"({"progress_interval_ms": 250})");

    TransferConfig base;
    base.bind_address = "127.0.0.1";
    auto config = TransferConfig::load_file(dir / "lft.json", base);
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().progress_interval, std::chrono::milliseconds(250));
    EXPECT_EQ(config.value().bind_address, "127.0.0.1");

    auto missing = TransferConfig::load_file(dir / "missing.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::InvalidArgument);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(LoggingTest, ParsesKnownLevels) {
    EXPECT_EQ(lft::core::parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(lft::core::parse_log_level("off"), spdlog::level::off);
    EXPECT_FALSE(lft::core::parse_log_level("loud").has_value());
    EXPECT_TRUE(lft::core::configure_logging("loud").is_error());
}
