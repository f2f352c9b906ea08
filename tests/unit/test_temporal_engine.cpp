#include <gtest/gtest.h>
#include "api/temporal_engine.hpp"
#include "common/errors.hpp"

using namespace tempo;

class TemporalEngineTest : public ::testing::Test {
protected:
    TemporalEngine engine;

    // Contract dispute: contract -> claim -> response -> settlement, plus an unrelated memo
    void SetUp() override {
        engine.add_document("contract", "Supply contract signed with delivery penalty clause",
                            "2024-01-01T09:00:00Z", {{"type", "contract"}});
        engine.add_document("claim", "Penalty claim for late delivery under the contract",
                            "2024-03-01T10:00:00+01:00", {{"type", "claim"}});
        engine.add_document("response", "Response disputing the late delivery penalty claim",
                            "2024-04-01", {{"type", "response"}});
        engine.add_document("settlement", "Settlement of the delivery penalty dispute",
                            "2024-05-01", {{"type", "settlement"}});
        engine.add_document("memo", "Cafeteria menu update", "2024-03-15");

        engine.add_relationship("contract", "claim", "causal");
        engine.add_relationship("claim", "response", RelationKind::Causal);
        engine.add_relationship("response", "settlement", "causal");
    }
};

// ==========================================
// Navigation
// ==========================================

TEST_F(TemporalEngineTest, FutureFromClaim) {
    auto future = engine.get_future_documents("claim");
    EXPECT_EQ(future.documents, (std::vector<std::string>{"response", "settlement"}));

    auto past = engine.get_past_documents("settlement");
    EXPECT_EQ(past.documents, (std::vector<std::string>{"response", "claim", "contract"}));

    auto limited = engine.get_future_documents("contract", 365, 1, 50);
    EXPECT_EQ(limited.documents, std::vector<std::string>{"claim"});
}

TEST_F(TemporalEngineTest, PathAndNoPath) {
    auto path = engine.find_path("contract", "settlement");
    ASSERT_TRUE(path.found());
    EXPECT_EQ(path.length(), 3u);

    EXPECT_EQ(engine.find_path("contract", "memo").status, ResultStatus::NoPath);
    EXPECT_EQ(engine.find_path("contract", "settlement", 2).status, ResultStatus::NoPath);
}

TEST_F(TemporalEngineTest, OffsetTimestampNormalized) {
    EXPECT_EQ(engine.get_document("claim").timestamp.to_iso8601(), "2024-03-01T09:00:00Z");
}

TEST_F(TemporalEngineTest, RangeByText) {
    auto docs = engine.get_documents_in_range("2024-03-01", "2024-03-31");
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(docs[0].id, "claim");
    EXPECT_EQ(docs[1].id, "memo");
}

TEST_F(TemporalEngineTest, ErrorsPassThrough) {
    EXPECT_THROW(engine.get_document("missing"), NotFoundError);
    EXPECT_THROW(engine.add_document("claim", "again", "2024-06-01"), DuplicateDocumentError);
    EXPECT_THROW(engine.add_relationship("claim", "missing", "causal"), UnknownDocumentError);
    EXPECT_THROW(engine.add_relationship("claim", "memo", "caused-by"), std::invalid_argument);
    EXPECT_THROW(engine.add_document("bad", "text", "March 1st"), TimestampParseError);
}

// ==========================================
// Similarity and Analysis
// ==========================================

TEST_F(TemporalEngineTest, SimilarityBuiltOnFirstUse) {
    EXPECT_DOUBLE_EQ(engine.similarity("claim", "claim"), 1.0);
    EXPECT_GT(engine.similarity("claim", "response"), engine.similarity("claim", "memo"));
    EXPECT_EQ(&engine.similarity_engine(), &engine.similarity_engine());
}

TEST_F(TemporalEngineTest, AttentionAroundClaim) {
    auto attention = engine.compute_attention("claim");
    ASSERT_FALSE(attention.forward.empty());
    ASSERT_FALSE(attention.backward.empty());
    EXPECT_EQ(attention.backward[0].id, "contract");

    auto related = engine.find_related_documents("claim", 1, Direction::Forward);
    ASSERT_EQ(related.size(), 1u);
    EXPECT_EQ(related[0].id, attention.forward[0].id);
}

TEST_F(TemporalEngineTest, LongChainAnalysis) {
    auto result = engine.analyze_long_chain("contract", std::string("settlement"));

    EXPECT_EQ(result.status, ResultStatus::Complete);
    EXPECT_EQ(result.documents_processed, 5u);
    ASSERT_FALSE(result.causal_chains.empty());
    EXPECT_EQ(result.causal_chains.front().documents,
              (std::vector<std::string>{"contract", "claim", "response", "settlement"}));

    auto summaries = engine.get_temporal_summary("contract", "settlement", 4);
    EXPECT_EQ(summaries.size(), 4u);
}

// ==========================================
// Configuration and Diagnostics
// ==========================================

TEST(TemporalEngineConfigTest, InvalidConfigRejected) {
    EngineConfig config;
    config.analyzer.chunk_size_days = -1;
    EXPECT_THROW(TemporalEngine engine(config), std::invalid_argument);
}

TEST(TemporalEngineConfigTest, ConfiguredDefaultsApply) {
    EngineConfig config;
    config.traversal.max_hops = 1;
    TemporalEngine engine(config);

    engine.add_document("a", "first", "2024-01-01");
    engine.add_document("b", "second", "2024-01-02");
    engine.add_document("c", "third", "2024-01-03");
    engine.add_relationship("a", "b", "sequential");
    engine.add_relationship("b", "c", "sequential");

    EXPECT_EQ(engine.get_future_documents("a").documents, std::vector<std::string>{"b"});
}

TEST_F(TemporalEngineTest, StatisticsAndExport) {
    auto stats = engine.get_statistics();
    EXPECT_EQ(stats.num_documents, 5u);
    EXPECT_EQ(stats.num_relationships, 3u);
    EXPECT_EQ(stats.relationships_by_kind["causal"], 3u);

    auto j = engine.export_graph();
    EXPECT_EQ(j["documents"].size(), 5u);
    EXPECT_EQ(j["documents"][0]["id"], "contract");
    EXPECT_EQ(j["relationships"].size(), 3u);
    EXPECT_EQ(j["relationships"][0]["kind"], "causal");
    EXPECT_TRUE(j.contains("config"));
    EXPECT_TRUE(j.contains("statistics"));
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
