#pragma once

#include <cstddef>

/// @file include/tkg/constants.hpp
/// @brief Default thresholds and weights for the TKG analytics pipeline.
///
/// These are heuristic screens, not calibrated models. Every value here is the
/// default of a field in one of the config structs and can be overridden per
/// graph instance.

namespace tkg::constants {

// ─── Time ─────────────────────────────────────────────────────────────────────

static constexpr double SECONDS_PER_HOUR = 3600.0;
static constexpr double SECONDS_PER_DAY  = 86400.0;

/// Entities older than this are evicted by `enforce_retention`.
static constexpr double DEFAULT_RETENTION_WINDOW = 30.0 * SECONDS_PER_DAY;

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

// ─── Causal discovery ─────────────────────────────────────────────────────────

/// Pairs further apart than this get no temporal-proximity credit.
static constexpr double DEFAULT_MAX_LAG = SECONDS_PER_HOUR;

static constexpr double TEMPORAL_WEIGHT      = 0.3;
static constexpr double COMPATIBILITY_WEIGHT = 0.4;
static constexpr double PROPERTY_WEIGHT      = 0.3;

/// Combined score a pair must exceed to become a hypothesis.
static constexpr double HYPOTHESIS_THRESHOLD = 0.5;

/// Compatibility score for kind pairs absent from the table.
static constexpr double DEFAULT_COMPATIBILITY = 0.2;

/// Validation: pseudo-p-value ceiling and |correlation| floor.
static constexpr double MAX_P_VALUE     = 0.1;
static constexpr double MIN_CORRELATION = 0.3;

/// Validation: points required on each side of a hypothesis.
static constexpr std::size_t MIN_SERIES_LENGTH = 3;

// ─── Chain building ───────────────────────────────────────────────────────────

/// Hypotheses at or below this strength never become chain edges.
static constexpr double CHAIN_EDGE_THRESHOLD = 0.6;

static constexpr std::size_t DEFAULT_MAX_CHAIN_LENGTH = 5;
static constexpr std::size_t MAX_RETAINED_CHAINS      = 100;

/// prediction_power = chain_confidence × this. Tunable, not calibrated.
static constexpr double PREDICTION_MULTIPLIER = 0.8;

// ─── Pattern mining ───────────────────────────────────────────────────────────

static constexpr std::size_t MIN_PATTERN_GROUP = 5;

/// Coefficient of variation of inter-arrival intervals must stay below this.
static constexpr double MAX_INTERVAL_VARIATION = 0.5;

static constexpr double MAX_PATTERN_ACCURACY = 0.9;

// ─── Prediction ───────────────────────────────────────────────────────────────

static constexpr double MIN_PREDICTION_POWER = 0.5;

/// Activity decays linearly to zero over this window.
static constexpr double ACTIVITY_WINDOW    = 2.0 * SECONDS_PER_HOUR;
static constexpr double ACTIVITY_THRESHOLD = 0.3;

static constexpr std::size_t MAX_PREDICTIONS = 20;

static constexpr double DEFAULT_PREDICTION_HORIZON = 4.0 * SECONDS_PER_HOUR;

/// Risk annotation rules.
static constexpr std::size_t LONG_CHAIN_ENTITIES   = 3;
static constexpr double      LOW_CONFIDENCE        = 0.7;
static constexpr double      EXTENDED_SPAN         = SECONDS_PER_DAY;
static constexpr double      HIGH_PROBABILITY_CHAIN = 0.8;

}  // namespace tkg::constants
