/// @file tests/core/test_config_loader.cpp
/// @brief Unit tests for the YAML configuration loader.

#include <gtest/gtest.h>
#include "tkg/config.hpp"
#include "tkg/logging.hpp"

#include <cstdio>
#include <fstream>
#include <string>

using namespace tkg;
using namespace tkg::config;

TEST(ConfigLoader, EmptyDocumentYieldsDefaults) {
    const auto cfg = parse_config_string("");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_DOUBLE_EQ(cfg->graph.retention_window, 30.0 * 86400.0);
    EXPECT_DOUBLE_EQ(cfg->graph.discovery.max_lag, 3600.0);
    EXPECT_DOUBLE_EQ(cfg->graph.discovery.hypothesis_threshold, 0.5);
    EXPECT_DOUBLE_EQ(cfg->graph.chains.edge_strength_threshold, 0.6);
    EXPECT_EQ(cfg->graph.chains.max_retained, 100u);
    EXPECT_EQ(cfg->graph.patterns.min_group_size, 5u);
    EXPECT_EQ(cfg->graph.prediction.max_predictions, 20u);
    EXPECT_EQ(cfg->run.max_chain_length, 5u);
    EXPECT_DOUBLE_EQ(cfg->run.horizon, 4.0 * 3600.0);
    EXPECT_EQ(cfg->logging.level, "info");
}

TEST(ConfigLoader, OverridesAreApplied) {
    const auto cfg = parse_config_string(R"(
retention_window: 86400
discovery:
  window: 7200
  max_lag: 600
  promote_validated: false
chains:
  max_chain_length: 3
  prediction_multiplier: 2.0
  timeout_ms: 250
patterns:
  min_group_size: 4
prediction:
  horizon: 1800
  max_predictions: 5
logging:
  level: debug
)");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_DOUBLE_EQ(cfg->graph.retention_window, 86400.0);
    EXPECT_DOUBLE_EQ(cfg->run.discovery_window, 7200.0);
    EXPECT_DOUBLE_EQ(cfg->graph.discovery.max_lag, 600.0);
    EXPECT_FALSE(cfg->graph.discovery.promote_validated);
    EXPECT_EQ(cfg->run.max_chain_length, 3u);
    EXPECT_DOUBLE_EQ(cfg->graph.chains.prediction_multiplier, 2.0);
    EXPECT_EQ(cfg->run.chain_timeout_ms, 250u);
    EXPECT_EQ(cfg->graph.patterns.min_group_size, 4u);
    EXPECT_DOUBLE_EQ(cfg->run.horizon, 1800.0);
    EXPECT_EQ(cfg->graph.prediction.max_predictions, 5u);
    EXPECT_EQ(cfg->logging.level, "debug");
    // Untouched keys keep defaults.
    EXPECT_DOUBLE_EQ(cfg->graph.discovery.min_correlation, 0.3);
}

TEST(ConfigLoader, OutOfRangeValuesAreRejected) {
    EXPECT_FALSE(parse_config_string("retention_window: -1\n").has_value());
    EXPECT_FALSE(parse_config_string("discovery:\n  hypothesis_threshold: 1.5\n").has_value());
    EXPECT_FALSE(parse_config_string("patterns:\n  min_group_size: 2\n").has_value());
    EXPECT_FALSE(parse_config_string("logging:\n  level: loud\n").has_value());
}

TEST(ConfigLoader, MalformedYamlIsRejected) {
    EXPECT_FALSE(parse_config_string("discovery: [unclosed\n").has_value());
    EXPECT_FALSE(parse_config_string("discovery:\n  max_lag: soon\n").has_value());
    EXPECT_FALSE(parse_config_string("chains:\n  max_retained: -3\n").has_value());
}

TEST(ConfigLoader, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "tkg_config_test.yaml";
    {
        std::ofstream out(path);
        out << "chains:\n  max_retained: 7\n";
    }
    const auto cfg = load_config_file(path);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->graph.chains.max_retained, 7u);
    std::remove(path.c_str());
}

TEST(ConfigLoader, MissingFileIsRejected) {
    EXPECT_FALSE(load_config_file("/nonexistent/tkg/config.yaml").has_value());
}

TEST(Logging, LevelNames) {
    EXPECT_TRUE(logging::is_valid_level("debug"));
    EXPECT_TRUE(logging::is_valid_level("off"));
    EXPECT_FALSE(logging::is_valid_level("verbose"));
    EXPECT_FALSE(logging::init(logging::LoggingConfig{.level = "verbose"}));
}
