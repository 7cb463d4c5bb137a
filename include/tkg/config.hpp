#pragma once

/// @file include/tkg/config.hpp
/// @brief Configuration aggregates and the YAML loader.
///
/// # Module: Configuration
///
/// ## Responsibility
/// Group the per-component config structs into `GraphConfig`, add the CLI's
/// run parameters, and read all of it from a YAML document.
///
/// ## YAML layout
/// ```yaml
/// retention_window: 2592000        # seconds
/// discovery:
///   window: 86400
///   max_lag: 3600
///   temporal_weight: 0.3
///   compatibility_weight: 0.4
///   property_weight: 0.3
///   hypothesis_threshold: 0.5
///   max_p_value: 0.1
///   min_correlation: 0.3
///   min_series_length: 3
///   promote_validated: true
/// chains:
///   max_chain_length: 5
///   edge_strength_threshold: 0.6
///   max_retained: 100
///   prediction_multiplier: 0.8
///   timeout_ms: 0                 # 0 = no deadline
/// patterns:
///   min_group_size: 5
///   max_variation: 0.5
///   max_accuracy: 0.9
/// prediction:
///   horizon: 14400
///   min_prediction_power: 0.5
///   activity_window: 7200
///   activity_threshold: 0.3
///   max_predictions: 20
/// logging:
///   level: info
/// ```
/// Every key is optional; absent keys keep their defaults.
///
/// ## Guarantees
/// - Never throws: parse errors and out-of-range values yield `nullopt`
///   after a warning is logged

#include "tkg/causal_discovery.hpp"
#include "tkg/chain_builder.hpp"
#include "tkg/constants.hpp"
#include "tkg/logging.hpp"
#include "tkg/pattern_miner.hpp"
#include "tkg/predictor.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace tkg::config {

/// Everything a TemporalKnowledgeGraph instance is tuned by.
struct GraphConfig {
    Duration                    retention_window = constants::DEFAULT_RETENTION_WINDOW;
    causal::DiscoveryConfig     discovery{};
    chain::ChainBuilderConfig   chains{};
    pattern::PatternMinerConfig patterns{};
    predict::PredictorConfig    prediction{};
};

/// Parameters of one analysis pass driven by a host (the CLI).
struct RunConfig {
    Duration    discovery_window = constants::SECONDS_PER_DAY;
    std::size_t max_chain_length = constants::DEFAULT_MAX_CHAIN_LENGTH;
    Duration    horizon          = constants::DEFAULT_PREDICTION_HORIZON;
    std::size_t chain_timeout_ms = 0;  ///< 0 = no deadline
};

struct AppConfig {
    GraphConfig            graph{};
    RunConfig              run{};
    logging::LoggingConfig logging{};
};

/// Parse a YAML document. Empty input yields the defaults.
[[nodiscard]] std::optional<AppConfig> parse_config_string(const std::string& yaml);

/// Read and parse a YAML file. `nullopt` if unreadable or invalid.
[[nodiscard]] std::optional<AppConfig> load_config_file(const std::string& path);

/// Range checks shared by both entry points.
[[nodiscard]] bool validate(const AppConfig& config) noexcept;

}  // namespace tkg::config
