#pragma once

/// @file include/tkg/predictor.hpp
/// @brief Predictor: forward projection from currently-active causal chains.
///
/// # Module: Predictor
///
/// ## Responsibility
/// For each chain with `prediction_power > 0.5`, measure how recently its
/// entities were observed; if the chain is active, project its terminal
/// event forward by the chain's average inter-hop lag.
///
/// ## Activity
///     activity = Σ_i (1 − age_i / 2h) · confidence_i  /  |entities|
/// over path entities still stored with 0 ≤ age_i ≤ 2h (older, future or
/// evicted entities contribute zero), capped at 1. Active when > 0.3.
///
/// ## Projection
///     predicted_time = now + temporal_span / (|entities| − 1)
/// Predictions past `now + horizon` are discarded. Survivors are ordered by
/// confidence descending (chain id ascending on ties) and capped at 20.
///
/// Risk factors and mitigation strategies are fixed-rule heuristic
/// annotations on chain length, confidence and span, not guarantees.
///
/// ## Guarantees
/// - Never throws; a chain whose terminal entity was evicted is skipped
/// - Callers hold at least a shared lock on the store for the whole call

#include "tkg/chain_builder.hpp"
#include "tkg/constants.hpp"
#include "tkg/entity_store.hpp"
#include "tkg/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tkg::predict {

/// A projected future event.
struct Prediction {
    std::string              id;                ///< "pred_<chain id>"
    EntityKind               predicted_kind = EntityKind::MarketEvent;
    Timestamp                predicted_time = 0.0;
    double                   confidence     = 0.0;  ///< Chain prediction power
    std::string              chain_id;
    std::string              reasoning;
    PropertyMap              expected_properties;   ///< Copy of terminal entity's
    std::vector<std::string> risk_factors;
    std::vector<std::string> mitigation_strategies;

    [[nodiscard]] std::string to_string() const;
};

struct PredictorConfig {
    double      min_prediction_power = constants::MIN_PREDICTION_POWER;
    Duration    activity_window      = constants::ACTIVITY_WINDOW;
    double      activity_threshold   = constants::ACTIVITY_THRESHOLD;
    std::size_t max_predictions      = constants::MAX_PREDICTIONS;
};

class Predictor {
public:
    explicit Predictor(PredictorConfig config = PredictorConfig{});

    /// Project events within `horizon` of `now`.
    ///
    /// # Returns
    /// Ranked predictions, or `nullopt` if `horizon` is non-positive or
    /// non-finite, or `now` is non-finite.
    [[nodiscard]] std::optional<std::vector<Prediction>>
    predict(std::span<const chain::CausalChain> chains,
            const store::EntityStore& entities,
            Duration horizon, Timestamp now) const;

    /// Recency-weighted confidence of the chain's stored entities, in [0, 1].
    [[nodiscard]] double chain_activity(const chain::CausalChain& chain,
                                        const store::EntityStore& entities,
                                        Timestamp now) const noexcept;

    /// "long_causal_chain", "low_confidence", "extended_temporal_span".
    [[nodiscard]] static std::vector<std::string>
    risk_factors(const chain::CausalChain& chain);

    /// Two general strategies plus one keyed on total strength.
    [[nodiscard]] static std::vector<std::string>
    mitigation_strategies(const chain::CausalChain& chain);

    [[nodiscard]] const PredictorConfig& config() const noexcept { return config_; }

private:
    PredictorConfig config_;
};

}  // namespace tkg::predict
