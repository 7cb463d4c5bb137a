/// @file src/causal/causal_discovery.cpp
/// @brief CausalDiscoveryEngine implementation.

#include "tkg/causal_discovery.hpp"
#include "tkg/statistics.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace tkg::causal {

namespace {

/// Preferred keys for a stream's scalar, in priority order.
constexpr const char* PRIMARY_KEYS[] = {"value", "price", "volume"};

}  // namespace

// ─── CausalHypothesis ─────────────────────────────────────────────────────────

std::string CausalHypothesis::to_string() const {
    return fmt::format("{} -> {} [{}] {:.3f}",
                       cause_id, effect_id, causal::to_string(mechanism), strength);
}

// ─── CausalDiscoveryEngine ────────────────────────────────────────────────────

CausalDiscoveryEngine::CausalDiscoveryEngine(DiscoveryConfig config)
    : config_(std::move(config))
{}

// ─── Scoring factors ──────────────────────────────────────────────────────────

double CausalDiscoveryEngine::temporal_proximity(Duration dt, Duration max_lag) noexcept {
    if (!std::isfinite(dt) || !std::isfinite(max_lag) || max_lag <= 0.0) return 0.0;
    if (dt < 0.0 || dt > max_lag) return 0.0;
    return std::clamp(1.0 - dt / max_lag, 0.0, 1.0);
}

double CausalDiscoveryEngine::property_similarity(const PropertyMap& a,
                                                  const PropertyMap& b) noexcept {
    double sum = 0.0;
    std::size_t shared = 0;

    for (const auto& [key, va] : a) {
        const auto it = b.find(key);
        if (it == b.end()) continue;

        const auto x = numeric_value(va);
        const auto y = numeric_value(it->second);
        if (!x || !y) continue;

        double sim = 0.0;
        if (*x == 0.0 && *y == 0.0) {
            sim = 1.0;
        } else if (*x == 0.0 || *y == 0.0) {
            sim = 0.0;
        } else {
            // Opposite signs or overflow would go negative.
            sim = std::clamp(1.0 - std::abs(*x - *y) / std::max(std::abs(*x), std::abs(*y)),
                             0.0, 1.0);
        }
        sum += sim;
        ++shared;
    }

    return shared == 0 ? 0.0 : sum / static_cast<double>(shared);
}

double CausalDiscoveryEngine::causal_strength(const TemporalEntity& a,
                                              const TemporalEntity& b) const noexcept {
    const double proximity     = temporal_proximity(b.timestamp - a.timestamp, config_.max_lag);
    const double compatibility = causal_compatibility(a.kind, b.kind);
    const double similarity    = property_similarity(a.properties, b.properties);

    const double score = config_.temporal_weight      * proximity
                       + config_.compatibility_weight * compatibility
                       + config_.property_weight      * similarity;
    return std::clamp(score, 0.0, 1.0);
}

// ─── CausalDiscoveryEngine::discover ──────────────────────────────────────────

std::optional<std::vector<CausalHypothesis>>
CausalDiscoveryEngine::discover(const store::EntityStore& entities,
                                Duration window, Timestamp now) const {
    if (!std::isfinite(window) || window <= 0.0 || !std::isfinite(now)) {
        spdlog::warn("discover: rejected window {} at now={}", window, now);
        return std::nullopt;
    }

    // Window view is already sorted by timestamp.
    std::vector<const TemporalEntity*> relevant;
    for (const auto& e : entities.entities_in_window(now - window, now)) {
        relevant.push_back(&e);
    }

    std::vector<CausalHypothesis> hypotheses;
    for (std::size_t i = 0; i < relevant.size(); ++i) {
        const TemporalEntity& a = *relevant[i];
        for (std::size_t j = i + 1; j < relevant.size(); ++j) {
            const TemporalEntity& b = *relevant[j];

            const Duration dt = b.timestamp - a.timestamp;
            if (dt <= 0.0) continue;  // simultaneous: no precedence

            const double strength = causal_strength(a, b);
            if (strength <= config_.hypothesis_threshold) continue;

            hypotheses.push_back(CausalHypothesis{
                .cause_id    = a.id,
                .effect_id   = b.id,
                .cause_kind  = a.kind,
                .effect_kind = b.kind,
                .cause_time  = a.timestamp,
                .effect_time = b.timestamp,
                .mechanism   = causal_mechanism(a.kind, b.kind),
                .strength    = strength,
                .evidence    = {fmt::format("temporal_precedence_{}s", dt)},
            });
        }
    }

    spdlog::info("discover: {} entities in window, {} candidate hypotheses",
                 relevant.size(), hypotheses.size());
    return hypotheses;
}

// ─── Stream history ───────────────────────────────────────────────────────────

double CausalDiscoveryEngine::primary_value(const TemporalEntity& e) noexcept {
    for (const char* key : PRIMARY_KEYS) {
        const auto it = e.properties.find(key);
        if (it == e.properties.end()) continue;
        if (const auto v = numeric_value(it->second)) return *v;
    }
    for (const auto& [key, value] : e.properties) {
        if (const auto v = numeric_value(value)) return *v;
    }
    return e.confidence;
}

std::vector<double>
CausalDiscoveryEngine::stream_series(const store::EntityStore& entities,
                                     const TemporalEntity& e) {
    std::vector<double> series;
    const auto history = entities.entities_in_window(
        -std::numeric_limits<double>::infinity(), e.timestamp);
    for (const auto& other : history) {
        if (other.kind == e.kind && other.source == e.source) {
            series.push_back(primary_value(other));
        }
    }
    return series;
}

// ─── CausalDiscoveryEngine::validate ──────────────────────────────────────────

std::vector<CausalHypothesis>
CausalDiscoveryEngine::validate(std::span<const CausalHypothesis> hypotheses,
                                const store::EntityStore& entities) const {
    std::vector<CausalHypothesis> validated;

    for (const auto& h : hypotheses) {
        const TemporalEntity* cause  = entities.find(h.cause_id);
        const TemporalEntity* effect = entities.find(h.effect_id);
        if (cause == nullptr || effect == nullptr) {
            spdlog::debug("validate: {} dropped, endpoint no longer stored", h.to_string());
            continue;
        }

        std::vector<double> cause_series  = stream_series(entities, *cause);
        std::vector<double> effect_series = stream_series(entities, *effect);

        // Align on the most recent common length; both end at the hypothesis.
        const std::size_t n = std::min(cause_series.size(), effect_series.size());
        if (n < config_.min_series_length) {
            spdlog::debug("validate: {} dropped, insufficient data ({} points)",
                          h.to_string(), n);
            continue;
        }
        const std::span<const double> cs(cause_series.data() + cause_series.size() - n, n);
        const std::span<const double> es(effect_series.data() + effect_series.size() - n, n);

        const double p = stats::lagged_correlation_p_value(cs, es);
        const stats::LagCorrelation xc = stats::cross_correlation(cs, es);
        const double abs_corr = std::abs(xc.correlation);

        if (!(p < config_.max_p_value) || !(abs_corr > config_.min_correlation)) {
            spdlog::debug("validate: {} rejected (p={:.3f}, corr={:.3f})",
                          h.to_string(), p, xc.correlation);
            continue;
        }

        CausalHypothesis boosted = h;
        boosted.strength = std::clamp((h.strength + (1.0 - p) * abs_corr) / 2.0, 0.0, 1.0);
        boosted.evidence.push_back(fmt::format("granger_p={:.3f}", p));
        boosted.evidence.push_back(fmt::format("correlation={:.3f}", xc.correlation));
        boosted.evidence.push_back(fmt::format("lag={}", xc.lag));
        validated.push_back(std::move(boosted));
    }

    spdlog::info("validate: {} of {} hypotheses passed", validated.size(), hypotheses.size());
    return validated;
}

}  // namespace tkg::causal
