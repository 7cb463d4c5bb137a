/// @file src/predict/predictor.cpp
/// @brief Predictor implementation.

#include "tkg/predictor.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace tkg::predict {

std::string Prediction::to_string() const {
    return fmt::format("{} {} at {:.0f} confidence={:.3f} via {}",
                       id, tkg::to_string(predicted_kind), predicted_time,
                       confidence, chain_id);
}

Predictor::Predictor(PredictorConfig config)
    : config_(std::move(config))
{}

// ─── Activity ─────────────────────────────────────────────────────────────────

double Predictor::chain_activity(const chain::CausalChain& chain,
                                 const store::EntityStore& entities,
                                 Timestamp now) const noexcept {
    if (chain.entities.empty() || !(config_.activity_window > 0.0)) {
        return 0.0;
    }

    double score = 0.0;
    for (const auto& id : chain.entities) {
        const TemporalEntity* e = entities.find(id);
        if (e == nullptr) continue;

        const Duration age = now - e->timestamp;
        if (age < 0.0 || age > config_.activity_window) continue;

        score += (1.0 - age / config_.activity_window) * e->confidence;
    }

    return std::min(1.0, score / static_cast<double>(chain.entities.size()));
}

// ─── Annotations ──────────────────────────────────────────────────────────────

std::vector<std::string> Predictor::risk_factors(const chain::CausalChain& chain) {
    std::vector<std::string> risks;
    if (chain.entities.size() > constants::LONG_CHAIN_ENTITIES) {
        risks.emplace_back("long_causal_chain");
    }
    if (chain.chain_confidence < constants::LOW_CONFIDENCE) {
        risks.emplace_back("low_confidence");
    }
    if (chain.temporal_span > constants::EXTENDED_SPAN) {
        risks.emplace_back("extended_temporal_span");
    }
    return risks;
}

std::vector<std::string> Predictor::mitigation_strategies(const chain::CausalChain& chain) {
    std::vector<std::string> strategies = {"monitor_early_indicators", "diversify_exposure"};
    if (chain.total_strength > constants::HIGH_PROBABILITY_CHAIN) {
        strategies.emplace_back("prepare_for_high_probability_event");
    } else {
        strategies.emplace_back("maintain_defensive_position");
    }
    return strategies;
}

// ─── Predictor::predict ───────────────────────────────────────────────────────

std::optional<std::vector<Prediction>>
Predictor::predict(std::span<const chain::CausalChain> chains,
                   const store::EntityStore& entities,
                   Duration horizon, Timestamp now) const {
    if (!std::isfinite(horizon) || horizon <= 0.0 || !std::isfinite(now)) {
        spdlog::warn("predict: rejected horizon {} at now={}", horizon, now);
        return std::nullopt;
    }

    std::vector<Prediction> predictions;
    std::size_t active = 0;

    for (const auto& chain : chains) {
        if (!(chain.prediction_power > config_.min_prediction_power)) continue;
        if (chain.entities.size() < 2) continue;

        const double activity = chain_activity(chain, entities, now);
        if (!(activity > config_.activity_threshold)) continue;
        ++active;

        const TemporalEntity* last = entities.find(chain.entities.back());
        if (last == nullptr) {
            spdlog::debug("predict: chain {} skipped, terminal entity evicted", chain.id);
            continue;
        }

        const Duration avg_lag =
            chain.temporal_span / static_cast<double>(chain.entities.size() - 1);
        const Timestamp predicted_time = now + avg_lag;
        if (predicted_time > now + horizon) continue;

        predictions.push_back(Prediction{
            .id                    = fmt::format("pred_{}", chain.id),
            .predicted_kind        = last->kind,
            .predicted_time        = predicted_time,
            .confidence            = chain.prediction_power,
            .chain_id              = chain.id,
            .reasoning             = fmt::format("causal chain with {} entities, activity {:.3f}",
                                                 chain.entities.size(), activity),
            .expected_properties   = last->properties,
            .risk_factors          = risk_factors(chain),
            .mitigation_strategies = mitigation_strategies(chain),
        });
    }

    std::sort(predictions.begin(), predictions.end(),
              [](const Prediction& a, const Prediction& b) {
                  if (a.confidence != b.confidence) return a.confidence > b.confidence;
                  return a.chain_id < b.chain_id;
              });
    if (predictions.size() > config_.max_predictions) {
        predictions.resize(config_.max_predictions);
    }

    spdlog::info("predict: {} chains, {} active, {} predictions",
                 chains.size(), active, predictions.size());
    return predictions;
}

}  // namespace tkg::predict
