/// @file tests/store/test_relation_graph.cpp
/// @brief Unit tests for RelationGraph (adjacency over stored entities).
///
/// Test categories:
///   - Endpoint validation against the entity store
///   - Field validation (strength, confidence, lag, end time)
///   - Out/in adjacency
///   - Cascade removal, including self-loops
///   - Density and strongly connected components

#include <gtest/gtest.h>
#include "tkg/entity_store.hpp"
#include "tkg/relation_graph.hpp"

#include <string>
#include <vector>

using namespace tkg;
using namespace tkg::store;

namespace {

TemporalEntity make_entity(const std::string& id, double ts) {
    TemporalEntity e;
    e.id        = id;
    e.kind      = EntityKind::MarketEvent;
    e.timestamp = ts;
    return e;
}

TemporalRelation make_relation(const std::string& id, const std::string& src,
                               const std::string& dst) {
    TemporalRelation r;
    r.id            = id;
    r.source_entity = src;
    r.target_entity = dst;
    r.kind          = RelationKind::Causes;
    r.start_time    = 0.0;
    r.strength      = 0.7;
    r.confidence    = 0.9;
    return r;
}

class RelationGraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(store.add_entity(make_entity("a", 1.0)), IngestStatus::Ok);
        ASSERT_EQ(store.add_entity(make_entity("b", 2.0)), IngestStatus::Ok);
        ASSERT_EQ(store.add_entity(make_entity("c", 3.0)), IngestStatus::Ok);
    }

    EntityStore   store;
    RelationGraph graph{store};
};

}  // namespace

TEST_F(RelationGraphTest, UnknownEndpointIsRejected) {
    EXPECT_EQ(graph.add_relation(make_relation("r", "a", "zzz")), IngestStatus::UnknownEntity);
    EXPECT_EQ(graph.add_relation(make_relation("r", "zzz", "a")), IngestStatus::UnknownEntity);
    EXPECT_EQ(graph.size(), 0u);
}

TEST_F(RelationGraphTest, DuplicateRelationIdIsRejected) {
    ASSERT_EQ(graph.add_relation(make_relation("r", "a", "b")), IngestStatus::Ok);
    EXPECT_EQ(graph.add_relation(make_relation("r", "b", "c")), IngestStatus::DuplicateId);
    EXPECT_EQ(graph.size(), 1u);
    EXPECT_EQ(graph.get_relation("r")->target_entity, "b");
}

TEST_F(RelationGraphTest, InvalidFieldsAreRejected) {
    auto strength = make_relation("r1", "a", "b");
    strength.strength = 1.2;
    EXPECT_EQ(graph.add_relation(strength), IngestStatus::InvalidRelation);

    auto lag = make_relation("r2", "a", "b");
    lag.causal_lag = -5.0;
    EXPECT_EQ(graph.add_relation(lag), IngestStatus::InvalidRelation);

    auto ends_early = make_relation("r3", "a", "b");
    ends_early.start_time = 10.0;
    ends_early.end_time   = 5.0;
    EXPECT_EQ(graph.add_relation(ends_early), IngestStatus::InvalidRelation);

    EXPECT_EQ(graph.size(), 0u);
}

TEST_F(RelationGraphTest, OpenEndedRelationIsAccepted) {
    auto r = make_relation("r", "a", "b");
    r.end_time.reset();
    EXPECT_EQ(graph.add_relation(r), IngestStatus::Ok);
    EXPECT_FALSE(graph.get_relation("r")->end_time.has_value());
}

TEST_F(RelationGraphTest, AdjacencyTracksBothDirections) {
    ASSERT_EQ(graph.add_relation(make_relation("ab", "a", "b")), IngestStatus::Ok);
    ASSERT_EQ(graph.add_relation(make_relation("ac", "a", "c")), IngestStatus::Ok);
    ASSERT_EQ(graph.add_relation(make_relation("bc", "b", "c")), IngestStatus::Ok);

    EXPECT_EQ(graph.neighbors_out("a"), (std::vector<RelationId>{"ab", "ac"}));
    EXPECT_EQ(graph.neighbors_in("c"), (std::vector<RelationId>{"ac", "bc"}));
    EXPECT_EQ(graph.out_degree("b"), 1u);
    EXPECT_EQ(graph.in_degree("a"), 0u);
    EXPECT_TRUE(graph.neighbors_out("unknown").empty());
}

TEST_F(RelationGraphTest, CascadeRemovesAllIncidentRelations) {
    ASSERT_EQ(graph.add_relation(make_relation("ab", "a", "b")), IngestStatus::Ok);
    ASSERT_EQ(graph.add_relation(make_relation("bc", "b", "c")), IngestStatus::Ok);
    ASSERT_EQ(graph.add_relation(make_relation("ac", "a", "c")), IngestStatus::Ok);

    const auto removed = graph.remove_entity_cascade("b");
    EXPECT_EQ(removed.size(), 2u);
    EXPECT_FALSE(graph.contains("ab"));
    EXPECT_FALSE(graph.contains("bc"));
    EXPECT_TRUE(graph.contains("ac"));

    EXPECT_EQ(graph.neighbors_out("a"), (std::vector<RelationId>{"ac"}));
    EXPECT_EQ(graph.neighbors_in("c"), (std::vector<RelationId>{"ac"}));
    EXPECT_TRUE(graph.neighbors_out("b").empty());
    EXPECT_TRUE(graph.neighbors_in("b").empty());
}

TEST_F(RelationGraphTest, CascadeHandlesSelfLoop) {
    ASSERT_EQ(graph.add_relation(make_relation("aa", "a", "a")), IngestStatus::Ok);
    ASSERT_EQ(graph.add_relation(make_relation("ab", "a", "b")), IngestStatus::Ok);

    const auto removed = graph.remove_entity_cascade("a");
    EXPECT_EQ(removed.size(), 2u);
    EXPECT_EQ(graph.size(), 0u);
    EXPECT_TRUE(graph.neighbors_in("b").empty());
}

TEST_F(RelationGraphTest, KindHistogram) {
    auto precedes = make_relation("p", "b", "c");
    precedes.kind = RelationKind::Precedes;
    ASSERT_EQ(graph.add_relation(make_relation("ab", "a", "b")), IngestStatus::Ok);
    ASSERT_EQ(graph.add_relation(precedes), IngestStatus::Ok);

    const auto hist = graph.kind_histogram();
    EXPECT_EQ(hist.at(RelationKind::Causes), 1u);
    EXPECT_EQ(hist.at(RelationKind::Precedes), 1u);
}

// ─── Structure ────────────────────────────────────────────────────────────────

TEST_F(RelationGraphTest, EmptyGraphHasSingletonComponents) {
    EXPECT_DOUBLE_EQ(graph.density(), 0.0);
    EXPECT_EQ(graph.strongly_connected_components(), 3u);
}

TEST_F(RelationGraphTest, DensityCountsDistinctPairsOnly) {
    ASSERT_EQ(graph.add_relation(make_relation("ab",  "a", "b")), IngestStatus::Ok);
    ASSERT_EQ(graph.add_relation(make_relation("ab2", "a", "b")), IngestStatus::Ok);
    ASSERT_EQ(graph.add_relation(make_relation("ba",  "b", "a")), IngestStatus::Ok);
    ASSERT_EQ(graph.add_relation(make_relation("bc",  "b", "c")), IngestStatus::Ok);
    ASSERT_EQ(graph.add_relation(make_relation("cc",  "c", "c")), IngestStatus::Ok);

    // (a,b), (b,a), (b,c) out of 3·2 ordered pairs.
    EXPECT_DOUBLE_EQ(graph.density(), 0.5);
}

TEST_F(RelationGraphTest, CycleFormsOneComponent) {
    ASSERT_EQ(graph.add_relation(make_relation("ab", "a", "b")), IngestStatus::Ok);
    ASSERT_EQ(graph.add_relation(make_relation("ba", "b", "a")), IngestStatus::Ok);
    ASSERT_EQ(graph.add_relation(make_relation("bc", "b", "c")), IngestStatus::Ok);
    EXPECT_EQ(graph.strongly_connected_components(), 2u);  // {a, b}, {c}

    ASSERT_EQ(graph.add_relation(make_relation("ca", "c", "a")), IngestStatus::Ok);
    EXPECT_EQ(graph.strongly_connected_components(), 1u);

    graph.remove_entity_cascade("b");
    EXPECT_EQ(graph.strongly_connected_components(), 3u);
    EXPECT_DOUBLE_EQ(graph.density(), 1.0 / 6.0);  // c→a remains
}
