#pragma once

/// @file include/tkg/causal_discovery.hpp
/// @brief CausalDiscoveryEngine: candidate generation and statistical screen.
///
/// # Module: Causal Discovery
///
/// ## Responsibility
/// Scan a time window of stored entities for plausible cause → effect pairs,
/// then screen the candidates against the history of the streams they belong
/// to.
///
/// ## Candidate score
/// For every ordered pair (a, b) with a.timestamp < b.timestamp:
///
///     score = 0.3 · proximity + 0.4 · compatibility + 0.3 · similarity
///
///   - proximity     = 1 − Δt / max_lag, zero beyond max_lag
///   - compatibility = fixed (kind_a, kind_b) table, 0.2 when unlisted
///   - similarity    = mean over shared numeric properties of
///                     1 − |x−y| / max(|x|,|y|)  clamped to [0, 1]
///                     (1 if both zero, 0 if one is)
///
/// A pair becomes a CausalHypothesis when score > 0.5.
///
/// ## Validation
/// Each side of a hypothesis is expanded into its stream history: stored
/// entities of the same kind and source at or before it, newest last, each
/// reduced to one scalar (see `primary_value`). Both series are trimmed to
/// their common most-recent length; fewer than 3 points rejects the
/// candidate (insufficient data, not disproof). The candidate survives when
/// the lagged-correlation pseudo-p-value < 0.1 and the best cross-correlation
/// |corr| > 0.3, and its strength becomes `(strength + (1−p)·|corr|) / 2`.
///
/// This is a heuristic screen, not causal inference.
///
/// ## Guarantees
/// - Never throws; a bad candidate is dropped and logged, the batch continues
/// - Hypotheses carry copies of endpoint ids, kinds and timestamps, so later
///   stages never dereference evicted entities
/// - Callers hold at least a shared lock on the store for the whole call

#include "tkg/constants.hpp"
#include "tkg/entity_store.hpp"
#include "tkg/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tkg::causal {

// ─── CausalMechanism ──────────────────────────────────────────────────────────

/// Mechanism label keyed by (cause kind, effect kind).
enum class CausalMechanism {
    InformationImpact,     ///< news_event → price_movement
    FundamentalAnalysis,   ///< economic_data → market_event
    TechnicalAnalysis,     ///< technical_indicator → trading_signal
    LiquidityImpact,       ///< volume_spike → price_movement
    AlgorithmicExecution,  ///< trading_signal → strategy_output
    MarketReaction,        ///< market_event → volume_spike
    Unknown,
};

[[nodiscard]] const char* to_string(CausalMechanism m) noexcept;

/// Plausibility in [0, 1] that an entity of kind `cause` causes one of kind
/// `effect`. Exhaustive over both kinds.
[[nodiscard]] double causal_compatibility(EntityKind cause, EntityKind effect) noexcept;

/// Mechanism label for a kind pair. Exhaustive over both kinds.
[[nodiscard]] CausalMechanism causal_mechanism(EntityKind cause, EntityKind effect) noexcept;

// ─── CausalHypothesis ─────────────────────────────────────────────────────────

/// A candidate cause → effect pair with a heuristic strength.
struct CausalHypothesis {
    EntityId        cause_id;
    EntityId        effect_id;
    EntityKind      cause_kind  = EntityKind::MarketEvent;
    EntityKind      effect_kind = EntityKind::MarketEvent;
    Timestamp       cause_time  = 0.0;
    Timestamp       effect_time = 0.0;
    CausalMechanism mechanism   = CausalMechanism::Unknown;
    double          strength    = 0.0;
    std::vector<std::string> evidence;

    /// One-line summary, e.g. "news_1 -> price_2 [information_impact] 0.635".
    [[nodiscard]] std::string to_string() const;
};

// ─── DiscoveryConfig ──────────────────────────────────────────────────────────

struct DiscoveryConfig {
    Duration    max_lag              = constants::DEFAULT_MAX_LAG;
    double      temporal_weight      = constants::TEMPORAL_WEIGHT;
    double      compatibility_weight = constants::COMPATIBILITY_WEIGHT;
    double      property_weight      = constants::PROPERTY_WEIGHT;
    double      hypothesis_threshold = constants::HYPOTHESIS_THRESHOLD;
    double      max_p_value          = constants::MAX_P_VALUE;
    double      min_correlation      = constants::MIN_CORRELATION;
    std::size_t min_series_length    = constants::MIN_SERIES_LENGTH;

    /// Promote validated hypotheses into `causes` relations (facade only).
    bool        promote_validated    = true;
};

// ─── CausalDiscoveryEngine ────────────────────────────────────────────────────

class CausalDiscoveryEngine {
public:
    explicit CausalDiscoveryEngine(DiscoveryConfig config = DiscoveryConfig{});

    /// Generate unvalidated hypotheses from entities in `[now − window, now]`.
    ///
    /// # Returns
    /// Hypotheses ordered by (cause time, effect time), or `nullopt` if
    /// `window` is non-positive or non-finite, or `now` is non-finite.
    [[nodiscard]] std::optional<std::vector<CausalHypothesis>>
    discover(const store::EntityStore& entities, Duration window, Timestamp now) const;

    /// Screen hypotheses against stream history. Rejected candidates are
    /// dropped; survivors get boosted strength plus p-value, correlation and
    /// lag evidence strings.
    [[nodiscard]] std::vector<CausalHypothesis>
    validate(std::span<const CausalHypothesis> hypotheses,
             const store::EntityStore& entities) const;

    /// Combined candidate score for `a` preceding `b`, clamped to [0, 1].
    [[nodiscard]] double
    causal_strength(const TemporalEntity& a, const TemporalEntity& b) const noexcept;

    /// `1 − dt / max_lag` in [0, 1]; zero for dt > max_lag or max_lag <= 0.
    [[nodiscard]] static double
    temporal_proximity(Duration dt, Duration max_lag) noexcept;

    /// Mean value similarity over numeric properties present in both maps;
    /// 0 when none are shared.
    [[nodiscard]] static double
    property_similarity(const PropertyMap& a, const PropertyMap& b) noexcept;

    /// The scalar an entity contributes to its stream series: the first of
    /// `value`, `price`, `volume` that is numeric, else the alphabetically
    /// first numeric property, else `confidence`.
    [[nodiscard]] static double primary_value(const TemporalEntity& e) noexcept;

    /// History of `e`'s stream (same kind and source, timestamp ≤ e's),
    /// oldest first, as primary values.
    [[nodiscard]] static std::vector<double>
    stream_series(const store::EntityStore& entities, const TemporalEntity& e);

    [[nodiscard]] const DiscoveryConfig& config() const noexcept { return config_; }

private:
    DiscoveryConfig config_;
};

}  // namespace tkg::causal
