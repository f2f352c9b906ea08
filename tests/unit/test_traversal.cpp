#include <gtest/gtest.h>
#include "common/cancellation.hpp"
#include "common/errors.hpp"
#include "graph/temporal_graph.hpp"
#include "traversal/traversal_engine.hpp"

using namespace tempo;

namespace {

std::string day(int offset) {
    return Timestamp::parse("2024-01-01").plus_days(offset).to_iso8601();
}

} // namespace

class ChainTraversalTest : public ::testing::Test {
protected:
    TemporalGraph graph;
    TraversalEngine engine{graph};

    // A1 -> A2 -> ... -> A10, one day apart
    void SetUp() override {
        for (int i = 1; i <= 10; ++i) {
            graph.add_document("A" + std::to_string(i), "step " + std::to_string(i), day(i));
        }
        for (int i = 1; i < 10; ++i) {
            graph.add_relationship("A" + std::to_string(i), "A" + std::to_string(i + 1),
                                   RelationKind::Sequential);
        }
    }
};

// ==========================================
// Forward / Backward Reachability
// ==========================================

TEST_F(ChainTraversalTest, ForwardReachesWholeChain) {
    auto result = engine.forward_reachable("A1", 365, 9, 50);

    std::vector<std::string> expected;
    for (int i = 2; i <= 10; ++i) {
        expected.push_back("A" + std::to_string(i));
    }
    EXPECT_EQ(result.documents, expected);
    EXPECT_EQ(result.status, ResultStatus::Complete);
    EXPECT_EQ(result.direction, Direction::Forward);
}

TEST_F(ChainTraversalTest, HopBoundLimitsDepth) {
    auto two = engine.forward_reachable("A1", 365, 2, 50);
    EXPECT_EQ(two.documents, (std::vector<std::string>{"A2", "A3"}));
    EXPECT_EQ(two.hops_explored, 2);

    auto none = engine.forward_reachable("A1", 365, 0, 50);
    EXPECT_TRUE(none.documents.empty());
}

TEST_F(ChainTraversalTest, ResultsTruncatedAfterOrdering) {
    auto result = engine.forward_reachable("A1", 365, 9, 3);
    EXPECT_EQ(result.documents, (std::vector<std::string>{"A2", "A3", "A4"}));
}

TEST_F(ChainTraversalTest, BackwardIsNearestFirst) {
    auto result = engine.backward_reachable("A10", 365, 3, 50);
    EXPECT_EQ(result.documents, (std::vector<std::string>{"A9", "A8", "A7"}));
    EXPECT_EQ(result.direction, Direction::Backward);
}

TEST_F(ChainTraversalTest, LeafHasNoForwardReach) {
    auto result = engine.forward_reachable("A10", 365, 5, 50);
    EXPECT_TRUE(result.documents.empty());
    EXPECT_EQ(result.status, ResultStatus::Complete);
}

TEST_F(ChainTraversalTest, TimeWindowStopsExpansion) {
    // Five days from A1 reaches A6 at most
    auto result = engine.forward_reachable("A1", 5, 9, 50);
    EXPECT_EQ(result.documents, (std::vector<std::string>{"A2", "A3", "A4", "A5", "A6"}));
}

TEST_F(ChainTraversalTest, UnknownSourceThrows) {
    EXPECT_THROW(engine.forward_reachable("missing", 365, 5, 50), NotFoundError);
    EXPECT_THROW(engine.backward_reachable("missing", 365, 5, 50), NotFoundError);
}

TEST_F(ChainTraversalTest, NegativeBoundsThrow) {
    EXPECT_THROW(engine.forward_reachable("A1", 365, -1, 50), std::invalid_argument);
    EXPECT_THROW(engine.forward_reachable("A1", -1, 5, 50), std::invalid_argument);
}

TEST_F(ChainTraversalTest, ConfiguredDefaults) {
    // Default hop bound is 5
    auto result = engine.forward_reachable("A1");
    EXPECT_EQ(result.documents.size(), 5u);
    EXPECT_EQ(result.documents.back(), "A6");
}

TEST_F(ChainTraversalTest, ReachableInRange) {
    auto view = graph.read();
    auto result = engine.reachable_in_range(view, "A1", Direction::Forward,
                                            Timestamp::parse(day(1)), Timestamp::parse(day(4)), 10);
    EXPECT_EQ(result.documents, (std::vector<std::string>{"A2", "A3", "A4"}));
}

TEST_F(ChainTraversalTest, ReachableInRangeHonoursFilter) {
    auto view = graph.read();
    auto result = engine.reachable_in_range(view, "A1", Direction::Forward,
                                            Timestamp::parse(day(1)), Timestamp::parse(day(6)), 10,
                                            nullptr, [](const std::string& id) { return id != "A3"; });
    // A3 is rejected, so nothing past it is reached either
    EXPECT_EQ(result.documents, std::vector<std::string>{"A2"});
}

TEST(BackwardInTimeEdgeTest, EarlierNeighbourStillExpanded) {
    TemporalGraph graph;
    graph.add_document("a", "Filing", "2024-03-01");
    graph.add_document("b", "Backdated memo", "2024-02-28");
    graph.add_document("c", "Follow-up", "2024-03-05");
    auto late = graph.add_relationship("a", "b", RelationKind::Causal);
    ASSERT_TRUE(late.has_warning());
    graph.add_relationship("b", "c", RelationKind::Causal);

    TraversalEngine engine(graph);
    auto forward = engine.forward_reachable("a", 365, 5, 50);
    // "b" predates the source and is not reported, but "c" is reached through it
    EXPECT_EQ(forward.documents, std::vector<std::string>{"c"});

    auto backward = engine.backward_reachable("c", 365, 5, 50);
    // "a" postdates "c": not reported
    EXPECT_EQ(backward.documents, std::vector<std::string>{"b"});
}

TEST_F(ChainTraversalTest, TraversalsCounted) {
    uint64_t before = graph.compute_statistics().traversals_performed;
    engine.forward_reachable("A1", 365, 5, 50);
    engine.find_path("A1", "A3", 5);
    EXPECT_EQ(graph.compute_statistics().traversals_performed, before + 2);
}

TEST(ClaimScenarioTest, ForwardFromClaimIncludesSettlement) {
    TemporalGraph graph;
    graph.add_document("c", "Contract", "2024-01-01");
    graph.add_document("claim", "Claim", "2024-03-01");
    graph.add_document("resp", "Response", "2024-04-01");
    graph.add_document("settle", "Settlement", "2024-05-01");
    graph.add_relationship("c", "claim", RelationKind::Causal);
    graph.add_relationship("claim", "resp", RelationKind::Causal);
    graph.add_relationship("resp", "settle", RelationKind::Causal);

    TraversalEngine engine(graph);
    auto result = engine.forward_reachable("claim");
    EXPECT_EQ(result.documents, (std::vector<std::string>{"resp", "settle"}));

    auto past = engine.backward_reachable("settle");
    EXPECT_EQ(past.documents, (std::vector<std::string>{"resp", "claim", "c"}));
}

TEST(CycleTest, EachNodeReportedOnce) {
    TemporalGraph graph;
    graph.add_document("a", "", day(0));
    graph.add_document("b", "", day(1));
    graph.add_document("c", "", day(2));
    graph.add_document("d", "", day(3));
    graph.add_relationship("a", "b", RelationKind::Sequential);
    graph.add_relationship("b", "c", RelationKind::Sequential);
    graph.add_relationship("c", "b", RelationKind::Concurrent);
    graph.add_relationship("c", "a", RelationKind::Concurrent);
    graph.add_relationship("c", "d", RelationKind::Sequential);
    graph.add_relationship("d", "b", RelationKind::Concurrent);

    TraversalEngine engine(graph);
    auto result = engine.forward_reachable("a", 365, 100, 50);
    EXPECT_EQ(result.documents, (std::vector<std::string>{"b", "c", "d"}));

    auto back = engine.backward_reachable("d", 365, 100, 50);
    EXPECT_EQ(back.documents, (std::vector<std::string>{"c", "b", "a"}));
}

TEST(FanOutTest, TruncationKeepsEarliest) {
    TemporalGraph graph;
    graph.add_document("root", "", day(0));
    for (int i = 10; i >= 1; --i) {
        graph.add_document("child" + std::to_string(i), "", day(i));
        graph.add_relationship("root", "child" + std::to_string(i), RelationKind::Branch);
    }

    TraversalEngine engine(graph);
    auto result = engine.forward_reachable("root", 365, 1, 3);
    EXPECT_EQ(result.documents, (std::vector<std::string>{"child1", "child2", "child3"}));
}

// ==========================================
// Paths
// ==========================================

TEST_F(ChainTraversalTest, ShortestPathAlongChain) {
    auto path = engine.find_path("A2", "A5", 10);
    ASSERT_TRUE(path.found());
    EXPECT_EQ(path.path, (std::vector<std::string>{"A2", "A3", "A4", "A5"}));
    EXPECT_EQ(path.length(), 3u);
}

TEST_F(ChainTraversalTest, PathBeyondHopBoundIsNoPath) {
    auto path = engine.find_path("A1", "A10", 3);
    EXPECT_EQ(path.status, ResultStatus::NoPath);
    EXPECT_TRUE(path.path.empty());
}

TEST_F(ChainTraversalTest, PathToSelf) {
    auto path = engine.find_path("A4", "A4", 0);
    ASSERT_TRUE(path.found());
    EXPECT_EQ(path.path, std::vector<std::string>{"A4"});
}

TEST_F(ChainTraversalTest, PathIsDirected) {
    EXPECT_FALSE(engine.has_path("A5", "A1", 10));
    EXPECT_TRUE(engine.has_path("A1", "A5", 10));
}

TEST_F(ChainTraversalTest, PathUnknownEndpointThrows) {
    EXPECT_THROW(engine.find_path("A1", "missing", 5), NotFoundError);
    EXPECT_THROW(engine.find_path("missing", "A1", 5), NotFoundError);
}

TEST(DisjointTest, NoPathEitherDirection) {
    TemporalGraph graph;
    graph.add_document("x1", "", day(0));
    graph.add_document("x2", "", day(1));
    graph.add_document("y1", "", day(2));
    graph.add_document("y2", "", day(3));
    graph.add_relationship("x1", "x2", RelationKind::Causal);
    graph.add_relationship("y1", "y2", RelationKind::Causal);

    TraversalEngine engine(graph);
    for (const auto& from : {"x1", "x2"}) {
        for (const auto& to : {"y1", "y2"}) {
            EXPECT_EQ(engine.find_path(from, to, 10).status, ResultStatus::NoPath);
            EXPECT_EQ(engine.find_path(to, from, 10).status, ResultStatus::NoPath);
        }
    }
}

TEST(PathTieBreakTest, EarliestNextHopWins) {
    TemporalGraph graph;
    graph.add_document("start", "", day(0));
    graph.add_document("late", "", day(5));
    graph.add_document("early", "", day(2));
    graph.add_document("end", "", day(9));
    graph.add_relationship("start", "late", RelationKind::Sequential);
    graph.add_relationship("start", "early", RelationKind::Sequential);
    graph.add_relationship("late", "end", RelationKind::Sequential);
    graph.add_relationship("early", "end", RelationKind::Sequential);

    TraversalEngine engine(graph);
    auto path = engine.find_path("start", "end", 5);
    ASSERT_TRUE(path.found());
    EXPECT_EQ(path.path, (std::vector<std::string>{"start", "early", "end"}));
}

TEST(PathTieBreakTest, SameTimestampFallsBackToId) {
    TemporalGraph graph;
    graph.add_document("s", "", day(0));
    graph.add_document("m2", "", day(1));
    graph.add_document("m1", "", day(1));
    graph.add_document("t", "", day(2));
    graph.add_relationship("s", "m2", RelationKind::Sequential);
    graph.add_relationship("s", "m1", RelationKind::Sequential);
    graph.add_relationship("m2", "t", RelationKind::Sequential);
    graph.add_relationship("m1", "t", RelationKind::Sequential);

    TraversalEngine engine(graph);
    EXPECT_EQ(engine.find_path("s", "t", 5).path, (std::vector<std::string>{"s", "m1", "t"}));
}

// ==========================================
// Cancellation
// ==========================================

TEST_F(ChainTraversalTest, CancelledQueryReturnsPartialMarker) {
    CancellationToken token;
    token.cancel();

    auto result = engine.forward_reachable("A1", 365, 9, 50, &token);
    EXPECT_EQ(result.status, ResultStatus::Cancelled);
    EXPECT_TRUE(result.cancelled());
    EXPECT_TRUE(result.documents.empty());

    auto path = engine.find_path("A1", "A5", 10, &token);
    EXPECT_EQ(path.status, ResultStatus::Cancelled);

    token.reset();
    EXPECT_EQ(engine.forward_reachable("A1", 365, 9, 50, &token).documents.size(), 9u);
}

TEST_F(ChainTraversalTest, ResultJson) {
    auto j = engine.forward_reachable("A1", 365, 2, 50).to_json();
    EXPECT_EQ(j["source"], "A1");
    EXPECT_EQ(j["direction"], "forward");
    EXPECT_EQ(j["count"], 2);
    EXPECT_EQ(j["status"], "complete");

    auto p = engine.find_path("A1", "A10", 1).to_json();
    EXPECT_EQ(p["status"], "no_path");
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
