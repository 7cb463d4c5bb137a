/// @file tests/predict/test_predictor.cpp
/// @brief Unit tests for Predictor (activity gating and projection).
///
/// Chains are constructed directly: with the default 0.8 multiplier a
/// builder-made chain never exceeds power 0.4, below the 0.5 gate.

#include <gtest/gtest.h>
#include "tkg/predictor.hpp"
#include "tkg/entity_store.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

using namespace tkg;
using namespace tkg::predict;

namespace {

constexpr Timestamp NOW = 1'700'000'000.0;

void add(store::EntityStore& store, const std::string& id, EntityKind kind, double ts,
         double confidence = 1.0) {
    TemporalEntity e;
    e.id         = id;
    e.kind       = kind;
    e.timestamp  = ts;
    e.confidence = confidence;
    e.properties["price"] = 101.0;
    ASSERT_EQ(store.add_entity(std::move(e)), IngestStatus::Ok);
}

chain::CausalChain make_chain(const std::string& id, std::vector<EntityId> entities,
                              double span, double power, double total = 0.9) {
    chain::CausalChain c;
    c.id               = id;
    c.entities         = std::move(entities);
    c.terminal_kind    = EntityKind::PriceMovement;
    c.total_strength   = total;
    c.chain_confidence = total / static_cast<double>(c.entities.size());
    c.temporal_span    = span;
    c.prediction_power = power;
    return c;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

}  // namespace

// ─── Activity ────────────────────────────────────────────────────────────────

TEST(Predictor, ActivityDecaysWithAge) {
    store::EntityStore store;
    add(store, "fresh", EntityKind::NewsEvent, NOW);
    add(store, "half", EntityKind::NewsEvent, NOW - 3600.0, 0.5);
    add(store, "stale", EntityKind::NewsEvent, NOW - 10000.0);
    add(store, "future", EntityKind::NewsEvent, NOW + 60.0);

    const Predictor predictor;
    const auto c = make_chain("c", {"fresh", "half", "stale", "future"}, 0.0, 0.9);
    // (1·1 + 0.5·0.5 + 0 + 0) / 4
    EXPECT_NEAR(predictor.chain_activity(c, store, NOW), 1.25 / 4.0, 1e-12);
}

// ─── Projection ──────────────────────────────────────────────────────────────

TEST(Predictor, ActiveChainProjectsTerminalEvent) {
    store::EntityStore store;
    add(store, "a", EntityKind::NewsEvent, NOW - 600.0);
    add(store, "b", EntityKind::PriceMovement, NOW);

    const std::vector<chain::CausalChain> chains = {make_chain("chain_1", {"a", "b"}, 600.0, 0.7)};
    const auto preds = Predictor{}.predict(chains, store, 4 * 3600.0, NOW);
    ASSERT_TRUE(preds.has_value());
    ASSERT_EQ(preds->size(), 1u);

    const auto& p = preds->front();
    EXPECT_EQ(p.id, "pred_chain_1");
    EXPECT_EQ(p.chain_id, "chain_1");
    EXPECT_EQ(p.predicted_kind, EntityKind::PriceMovement);
    EXPECT_DOUBLE_EQ(p.predicted_time, NOW + 600.0);
    EXPECT_DOUBLE_EQ(p.confidence, 0.7);
    EXPECT_DOUBLE_EQ(std::get<double>(p.expected_properties.at("price")), 101.0);
    EXPECT_FALSE(p.reasoning.empty());
}

TEST(Predictor, WeakChainIsIgnored) {
    store::EntityStore store;
    add(store, "a", EntityKind::NewsEvent, NOW - 600.0);
    add(store, "b", EntityKind::PriceMovement, NOW);

    const std::vector<chain::CausalChain> chains = {make_chain("c", {"a", "b"}, 600.0, 0.4)};
    EXPECT_TRUE(Predictor{}.predict(chains, store, 3600.0, NOW)->empty());
}

TEST(Predictor, InactiveChainIsIgnored) {
    store::EntityStore store;
    add(store, "a", EntityKind::NewsEvent, NOW - 9000.0);
    add(store, "b", EntityKind::PriceMovement, NOW - 8000.0);

    const std::vector<chain::CausalChain> chains = {make_chain("c", {"a", "b"}, 1000.0, 0.9)};
    EXPECT_TRUE(Predictor{}.predict(chains, store, 3600.0, NOW)->empty());
}

TEST(Predictor, ProjectionBeyondHorizonIsDiscarded) {
    store::EntityStore store;
    add(store, "a", EntityKind::NewsEvent, NOW - 20000.0);
    add(store, "b", EntityKind::PriceMovement, NOW);

    const std::vector<chain::CausalChain> chains = {make_chain("c", {"a", "b"}, 20000.0, 0.9)};
    EXPECT_TRUE(Predictor{}.predict(chains, store, 3600.0, NOW)->empty());
    EXPECT_EQ(Predictor{}.predict(chains, store, 30000.0, NOW)->size(), 1u);
}

TEST(Predictor, EvictedTerminalEntityIsSkipped) {
    store::EntityStore store;
    add(store, "a", EntityKind::NewsEvent, NOW);

    const std::vector<chain::CausalChain> chains = {make_chain("c", {"a", "gone"}, 60.0, 0.9)};
    const auto preds = Predictor{}.predict(chains, store, 3600.0, NOW);
    ASSERT_TRUE(preds.has_value());
    EXPECT_TRUE(preds->empty());
}

TEST(Predictor, InvalidHorizonIsRejected) {
    store::EntityStore store;
    const std::vector<chain::CausalChain> chains;
    EXPECT_FALSE(Predictor{}.predict(chains, store, 0.0, NOW).has_value());
    EXPECT_FALSE(Predictor{}.predict(chains, store, -1.0, NOW).has_value());
    EXPECT_FALSE(Predictor{}.predict(chains, store, std::numeric_limits<double>::quiet_NaN(),
                                     NOW).has_value());
}

TEST(Predictor, OrderedByConfidenceAndCapped) {
    store::EntityStore store;
    add(store, "a", EntityKind::NewsEvent, NOW - 60.0);
    add(store, "b", EntityKind::PriceMovement, NOW);

    const std::vector<chain::CausalChain> chains = {
        make_chain("c1", {"a", "b"}, 60.0, 0.6),
        make_chain("c2", {"a", "b"}, 60.0, 0.9),
        make_chain("c3", {"a", "b"}, 60.0, 0.7),
    };
    PredictorConfig cfg;
    cfg.max_predictions = 2;
    const auto preds = Predictor{cfg}.predict(chains, store, 3600.0, NOW);
    ASSERT_TRUE(preds.has_value());
    ASSERT_EQ(preds->size(), 2u);
    EXPECT_EQ((*preds)[0].chain_id, "c2");
    EXPECT_EQ((*preds)[1].chain_id, "c3");
}

// ─── Annotations ─────────────────────────────────────────────────────────────

TEST(Predictor, RiskFactorRules) {
    auto c = make_chain("c", {"a", "b", "c", "d"}, 2 * 86400.0, 0.9, 0.4);
    const auto risks = Predictor::risk_factors(c);
    EXPECT_TRUE(contains(risks, "long_causal_chain"));
    EXPECT_TRUE(contains(risks, "low_confidence"));
    EXPECT_TRUE(contains(risks, "extended_temporal_span"));

    c = make_chain("c", {"a", "b"}, 60.0, 0.9, 1.6);
    EXPECT_TRUE(Predictor::risk_factors(c).empty());
}

TEST(Predictor, MitigationDependsOnStrength) {
    const auto strong = Predictor::mitigation_strategies(make_chain("s", {"a", "b"}, 1.0, 0.9, 0.85));
    const auto weak   = Predictor::mitigation_strategies(make_chain("w", {"a", "b"}, 1.0, 0.9, 0.5));
    EXPECT_TRUE(contains(strong, "monitor_early_indicators"));
    EXPECT_TRUE(contains(strong, "diversify_exposure"));
    EXPECT_TRUE(contains(strong, "prepare_for_high_probability_event"));
    EXPECT_TRUE(contains(weak, "maintain_defensive_position"));
}
