/// @file tests/causal/test_validation.cpp
/// @brief Unit tests for CausalDiscoveryEngine::validate (stream-history screen).
///
/// Each side of a hypothesis is expanded into its stream: same kind, same
/// source, at or before the endpoint. These tests build two streams of five
/// points and check acceptance, rejection and insufficient-data handling.

#include <gtest/gtest.h>
#include "tkg/causal_discovery.hpp"
#include "tkg/entity_store.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace tkg;
using namespace tkg::causal;

namespace {

void add_stream(store::EntityStore& store, const std::string& prefix, EntityKind kind,
                double t0, const std::vector<double>& values,
                const std::string& source = "feed") {
    for (std::size_t i = 0; i < values.size(); ++i) {
        TemporalEntity e;
        e.id        = prefix + std::to_string(i);
        e.kind      = kind;
        e.timestamp = t0 + 1000.0 * static_cast<double>(i);
        e.source    = source;
        e.properties["value"] = values[i];
        ASSERT_EQ(store.add_entity(std::move(e)), IngestStatus::Ok);
    }
}

CausalHypothesis hypothesis(const store::EntityStore& store, const std::string& cause,
                            const std::string& effect, double strength = 0.6) {
    const auto* c = store.find(cause);
    const auto* e = store.find(effect);
    return CausalHypothesis{
        .cause_id    = cause,
        .effect_id   = effect,
        .cause_kind  = c->kind,
        .effect_kind = e->kind,
        .cause_time  = c->timestamp,
        .effect_time = e->timestamp,
        .mechanism   = causal_mechanism(c->kind, e->kind),
        .strength    = strength,
        .evidence    = {"temporal_precedence_100s"},
    };
}

bool has_prefix(const std::vector<std::string>& evidence, const std::string& prefix) {
    return std::any_of(evidence.begin(), evidence.end(), [&](const std::string& s) {
        return s.rfind(prefix, 0) == 0;
    });
}

}  // namespace

TEST(CausalValidation, StreamSeriesFiltersKindAndSource) {
    store::EntityStore store;
    add_stream(store, "n", EntityKind::NewsEvent, 0.0, {1, 2, 3, 4, 5});
    add_stream(store, "o", EntityKind::NewsEvent, 50.0, {9, 9, 9}, "other");

    const auto series = CausalDiscoveryEngine::stream_series(store, *store.find("n2"));
    EXPECT_EQ(series, (std::vector<double>{1, 2, 3}));
}

TEST(CausalValidation, LeadingStreamIsAccepted) {
    store::EntityStore store;
    add_stream(store, "n", EntityKind::NewsEvent,     0.0,   {1, 2, 3, 4, 5});
    add_stream(store, "p", EntityKind::PriceMovement, 100.0, {10, 20, 30, 40, 50});

    const std::vector<CausalHypothesis> candidates = {hypothesis(store, "n4", "p4", 0.6)};
    const CausalDiscoveryEngine engine;
    const auto validated = engine.validate(candidates, store);

    ASSERT_EQ(validated.size(), 1u);
    // p = 0 and |corr| = 1, so strength = (0.6 + 1) / 2.
    EXPECT_NEAR(validated[0].strength, 0.8, 1e-9);
    EXPECT_TRUE(has_prefix(validated[0].evidence, "granger_p="));
    EXPECT_TRUE(has_prefix(validated[0].evidence, "correlation="));
    EXPECT_EQ(validated[0].evidence.front(), "temporal_precedence_100s");
}

TEST(CausalValidation, UncorrelatedStreamIsRejected) {
    store::EntityStore store;
    add_stream(store, "n", EntityKind::NewsEvent,     0.0,   {1, 2, 3, 4, 5});
    add_stream(store, "p", EntityKind::PriceMovement, 100.0, {10, 50, 10, 50, 10});

    const std::vector<CausalHypothesis> candidates = {hypothesis(store, "n4", "p4")};
    const CausalDiscoveryEngine engine;
    EXPECT_TRUE(engine.validate(candidates, store).empty());
}

TEST(CausalValidation, ShortHistoryIsInsufficientData) {
    store::EntityStore store;
    add_stream(store, "n", EntityKind::NewsEvent,     0.0,   {1, 2});
    add_stream(store, "p", EntityKind::PriceMovement, 100.0, {10, 20});

    const std::vector<CausalHypothesis> candidates = {hypothesis(store, "n1", "p1")};
    const CausalDiscoveryEngine engine;
    EXPECT_TRUE(engine.validate(candidates, store).empty());
}

TEST(CausalValidation, MissingEndpointIsDroppedAndBatchContinues) {
    store::EntityStore store;
    add_stream(store, "n", EntityKind::NewsEvent,     0.0,   {1, 2, 3, 4, 5});
    add_stream(store, "p", EntityKind::PriceMovement, 100.0, {10, 20, 30, 40, 50});

    auto dangling = hypothesis(store, "n4", "p4");
    dangling.effect_id = "gone";
    const std::vector<CausalHypothesis> candidates = {dangling, hypothesis(store, "n4", "p4")};

    const CausalDiscoveryEngine engine;
    const auto validated = engine.validate(candidates, store);
    ASSERT_EQ(validated.size(), 1u);
    EXPECT_EQ(validated[0].effect_id, "p4");
}

TEST(CausalValidation, SeriesAreAlignedOnMostRecentPoints) {
    store::EntityStore store;
    // Cause stream has extra early history that would break a head alignment.
    add_stream(store, "n", EntityKind::NewsEvent,     0.0,    {100, -50, 1, 2, 3, 4, 5});
    add_stream(store, "p", EntityKind::PriceMovement, 2100.0, {10, 20, 30, 40, 50});

    const std::vector<CausalHypothesis> candidates = {hypothesis(store, "n6", "p4")};
    const CausalDiscoveryEngine engine;
    EXPECT_EQ(engine.validate(candidates, store).size(), 1u);
}
