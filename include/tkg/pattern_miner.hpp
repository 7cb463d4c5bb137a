#pragma once

/// @file include/tkg/pattern_miner.hpp
/// @brief PatternMiner: periodic recurrence per entity kind.
///
/// # Module: Pattern Miner
///
/// ## Responsibility
/// Group stored entities by kind and flag kinds whose inter-arrival times are
/// stable enough to extrapolate the next occurrence.
///
/// ## Algorithm
/// For each kind with at least 5 entities, sorted by timestamp:
///   intervals  = consecutive timestamp differences
///   cv         = σ(intervals) / μ(intervals)      (population σ)
///   emit when cv < 0.5:
///     frequency           = 1 / μ
///     predictive_accuracy = min(0.9, 1 − cv)
///     next_predicted      = last timestamp + μ
///
/// This is a coarse stability screen, not spectral analysis: a kind that
/// recurs at two interleaved periods, or drifts slowly, is not detected.
///
/// ## Guarantees
/// - Never throws; a kind with a zero mean interval is skipped and logged
/// - Output ordered by kind declaration order

#include "tkg/constants.hpp"
#include "tkg/entity_store.hpp"
#include "tkg/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tkg::pattern {

/// Interval statistics backing a pattern.
struct TemporalSignature {
    Duration mean_interval   = 0.0;
    Duration stddev_interval = 0.0;
    double   frequency       = 0.0;  ///< Hz
    double   consistency     = 0.0;  ///< 1 − σ/μ
};

/// A roughly periodic entity kind. Owns copies of the ids it references.
struct TemporalPattern {
    std::string              id;
    std::string              pattern_type;      ///< "periodic_<kind>"
    EntityKind               kind = EntityKind::MarketEvent;
    std::vector<EntityId>    entities_involved; ///< Oldest first
    TemporalSignature        signature;
    double                   frequency           = 0.0;
    double                   predictive_accuracy = 0.0;
    Timestamp                last_occurrence     = 0.0;
    std::optional<Timestamp> next_predicted;

    [[nodiscard]] std::string to_string() const;
};

struct PatternMinerConfig {
    std::size_t min_group_size      = constants::MIN_PATTERN_GROUP;
    double      max_variation       = constants::MAX_INTERVAL_VARIATION;
    double      max_accuracy        = constants::MAX_PATTERN_ACCURACY;
};

class PatternMiner {
public:
    explicit PatternMiner(PatternMinerConfig config = PatternMinerConfig{});

    /// Scan every stored entity. Callers hold at least a shared lock.
    [[nodiscard]] std::vector<TemporalPattern>
    discover_patterns(const store::EntityStore& entities) const;

    /// Periodicity test for one kind's entities (already timestamp-ordered).
    /// `nullopt` when the group is too small, degenerate, or irregular.
    [[nodiscard]] std::optional<TemporalPattern>
    analyze(EntityKind kind, const std::vector<const TemporalEntity*>& ordered) const;

    [[nodiscard]] const PatternMinerConfig& config() const noexcept { return config_; }

private:
    PatternMinerConfig config_;
};

}  // namespace tkg::pattern
