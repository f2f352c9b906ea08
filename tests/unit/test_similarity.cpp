#include <gtest/gtest.h>
#include "common/cancellation.hpp"
#include "common/errors.hpp"
#include "graph/temporal_graph.hpp"
#include "similarity/similarity_engine.hpp"
#include "similarity/tokenizer.hpp"
#include "traversal/traversal_engine.hpp"
#include <cmath>

using namespace tempo;

namespace {

std::string day(int offset) {
    return Timestamp::parse("2024-06-01").plus_days(offset).to_iso8601();
}

} // namespace

class SimilarityTest : public ::testing::Test {
protected:
    TemporalGraph graph;
    TraversalEngine traversal{graph};
    SimilarityEngine engine{graph, traversal};

    void SetUp() override {
        graph.add_document("breach", "Contract breach triggered a payment dispute", day(0));
        graph.add_document("dispute", "The payment dispute escalated to arbitration", day(1));
        graph.add_document("weather", "Sunny weather forecast for tomorrow", day(2));
        graph.add_document("filler", "it is the and of to", day(3));
    }
};

// ==========================================
// Tokenizer Tests
// ==========================================

TEST(TokenizerTest, LowercasesAndDropsShortTokensAndStopwords) {
    Tokenizer tokenizer;
    auto tokens = tokenizer.tokenize("The Quick-brown fox_jumps, 42 ab");
    EXPECT_EQ(tokens, (std::vector<std::string>{"quick", "brown", "fox_jumps"}));
}

TEST(TokenizerTest, NonAsciiBytesStayInsideWords) {
    Tokenizer tokenizer;
    auto tokens = tokenizer.tokenize("caf\xC3\xA9 na\xC3\xAFve");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0], "caf\xC3\xA9");
    EXPECT_EQ(tokens[1], "na\xC3\xAFve");
}

TEST(TokenizerTest, CountsOccurrences) {
    Tokenizer tokenizer;
    auto counts = tokenizer.count("claim Claim CLAIM response");
    EXPECT_EQ(counts["claim"], 3u);
    EXPECT_EQ(counts["response"], 1u);
    EXPECT_EQ(counts.size(), 2u);
}

TEST(TokenizerTest, StopwordsCanBeKept) {
    Tokenizer keep(1, false);
    EXPECT_EQ(keep.tokenize("the a it").size(), 3u);
    EXPECT_FALSE(keep.is_stopword("the"));

    Tokenizer drop;
    EXPECT_TRUE(drop.is_stopword("the"));
    EXPECT_TRUE(Tokenizer::stopwords().count("would"));
}

// ==========================================
// Pairwise Similarity
// ==========================================

TEST_F(SimilarityTest, SelfSimilarityIsOne) {
    EXPECT_DOUBLE_EQ(engine.similarity("breach", "breach"), 1.0);
    EXPECT_DOUBLE_EQ(engine.similarity("weather", "weather"), 1.0);
}

TEST_F(SimilarityTest, DocumentWithoutTermsScoresZero) {
    EXPECT_DOUBLE_EQ(engine.similarity("filler", "filler"), 0.0);
    EXPECT_DOUBLE_EQ(engine.similarity("filler", "breach"), 0.0);
}

TEST_F(SimilarityTest, SymmetricAndBounded) {
    const std::vector<std::string> ids = {"breach", "dispute", "weather", "filler"};
    for (const auto& a : ids) {
        for (const auto& b : ids) {
            double ab = engine.similarity(a, b);
            EXPECT_GE(ab, 0.0);
            EXPECT_LE(ab, 1.0);
            EXPECT_DOUBLE_EQ(ab, engine.similarity(b, a));
        }
    }
}

TEST_F(SimilarityTest, SharedVocabularyScoresAboveDisjoint) {
    double related = engine.similarity("breach", "dispute");
    EXPECT_GT(related, 0.0);
    EXPECT_LT(related, 1.0);
    EXPECT_DOUBLE_EQ(engine.similarity("breach", "weather"), 0.0);
}

TEST_F(SimilarityTest, UnknownDocumentThrows) {
    EXPECT_THROW(engine.similarity("breach", "missing"), NotFoundError);
    EXPECT_THROW(engine.document_vector("missing"), NotFoundError);
}

TEST_F(SimilarityTest, VectorsAreUnitLength) {
    double norm = 0.0;
    for (const auto& [term, weight] : engine.document_vector("dispute")) {
        norm += weight * weight;
    }
    EXPECT_NEAR(std::sqrt(norm), 1.0, 1e-9);
    EXPECT_TRUE(engine.document_vector("filler").empty());
}

TEST_F(SimilarityTest, FreeTextUsesCorpusWeights) {
    EXPECT_NEAR(engine.similarity_text("Payment dispute", "dispute, PAYMENT!"), 1.0, 1e-9);
    EXPECT_GT(engine.similarity_text("payment dispute", "dispute over payment"), 0.0);
    EXPECT_DOUBLE_EQ(engine.similarity_text("payment dispute", "sunny forecast"), 0.0);
}

// ==========================================
// Cache Tests
// ==========================================

TEST_F(SimilarityTest, RepeatedPairHitsCache) {
    engine.similarity("breach", "dispute");
    engine.similarity("dispute", "breach");

    auto stats = engine.stats();
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.cached_pairs, 1u);
    EXPECT_EQ(stats.rebuilds, 1u);
    EXPECT_EQ(stats.corpus_size, 4u);
}

TEST_F(SimilarityTest, NewDocumentInvalidatesCache) {
    double before = engine.similarity("breach", "dispute");

    // Another document mentioning "payment" lowers its IDF
    graph.add_document("invoice", "Payment invoice payment reminder", day(4));
    double after = engine.similarity("breach", "dispute");

    auto stats = engine.stats();
    EXPECT_EQ(stats.rebuilds, 2u);
    EXPECT_EQ(stats.corpus_size, 5u);
    EXPECT_NE(before, after);
    EXPECT_GT(after, 0.0);
}

TEST(SimilarityCacheTest, PairKeyIsUnordered) {
    SimilarityCache cache(2);
    cache.reset(1, 0, {});
    cache.store_pair("b", "a", 0.25);

    auto found = cache.find_pair("a", "b");
    ASSERT_TRUE(found.has_value());
    EXPECT_DOUBLE_EQ(*found, 0.25);

    cache.store_pair("c", "d", 0.5);
    cache.store_pair("e", "f", 0.75);   // at capacity: cleared first
    EXPECT_FALSE(cache.find_pair("a", "b").has_value());
    EXPECT_EQ(cache.stats().cached_pairs, 1u);
}

// ==========================================
// Attention Tests
// ==========================================

class AttentionTest : public ::testing::Test {
protected:
    TemporalGraph graph;
    TraversalEngine traversal{graph};
    SimilarityEngine engine{graph, traversal};

    void SetUp() override {
        graph.add_document("precedent", "Earlier payment claim precedent", day(-10));
        graph.add_document("source", "Payment claim filed over dispute", day(0));
        graph.add_document("near", "Ledger entry archived", day(3));
        graph.add_document("mid", "Office relocation memo", day(5));
        graph.add_document("reply", "Reply to payment claim and dispute", day(10));
        graph.add_document("far", "Ledger entry archived", day(20));
        graph.add_document("isolated", "Payment claim filed over dispute", day(1));

        graph.add_relationship("precedent", "source", RelationKind::Causal);
        graph.add_relationship("source", "reply", RelationKind::Causal);
        graph.add_relationship("source", "mid", RelationKind::Sequential);
        graph.add_relationship("source", "far", RelationKind::Sequential);
        graph.add_relationship("source", "near", RelationKind::Sequential);
    }
};

TEST_F(AttentionTest, RanksByScoreThenProximity) {
    auto attention = engine.compute_attention("source", 10);

    std::vector<std::string> forward;
    for (const auto& entry : attention.forward) {
        forward.push_back(entry.id);
    }
    // "near", "mid" and "far" all score zero; nearer comes first
    EXPECT_EQ(forward, (std::vector<std::string>{"reply", "near", "mid", "far"}));
    EXPECT_GT(attention.forward[0].score, 0.0);
    EXPECT_DOUBLE_EQ(attention.forward[1].days_from_source, 3.0);

    ASSERT_EQ(attention.backward.size(), 1u);
    EXPECT_EQ(attention.backward[0].id, "precedent");
    EXPECT_DOUBLE_EQ(attention.backward[0].days_from_source, -10.0);
    EXPECT_EQ(attention.status, ResultStatus::Complete);
}

TEST_F(AttentionTest, UnreachableDocumentsIgnored) {
    // "isolated" has identical text but no edges
    auto attention = engine.compute_attention("source", 10);
    for (const auto& entry : attention.forward) {
        EXPECT_NE(entry.id, "isolated");
    }
    for (const auto& entry : attention.backward) {
        EXPECT_NE(entry.id, "isolated");
    }
}

TEST_F(AttentionTest, LimitAppliesPerDirection) {
    auto attention = engine.compute_attention("source", 2);
    EXPECT_EQ(attention.forward.size(), 2u);
    EXPECT_EQ(attention.backward.size(), 1u);
}

TEST_F(AttentionTest, SummaryBalance) {
    auto attention = engine.compute_attention("source", 10);

    double fwd = attention.total_forward();
    double bwd = attention.total_backward();
    ASSERT_GT(fwd + bwd, 0.0);
    EXPECT_DOUBLE_EQ(attention.balance(), fwd / (fwd + bwd));
    EXPECT_EQ(attention.most_attended_forward().value(), "reply");
    EXPECT_EQ(attention.most_attended_backward().value(), "precedent");

    auto j = attention.to_json();
    EXPECT_EQ(j["summary"]["most_attended_forward"], "reply");
    EXPECT_EQ(j["forward"].size(), 4u);
}

TEST_F(AttentionTest, EmptyAttentionIsBalanced) {
    auto attention = engine.compute_attention("isolated", 10);
    EXPECT_TRUE(attention.forward.empty());
    EXPECT_TRUE(attention.backward.empty());
    EXPECT_DOUBLE_EQ(attention.balance(), 0.5);
    EXPECT_FALSE(attention.most_attended_forward().has_value());
}

TEST_F(AttentionTest, FindRelatedRespectsDirection) {
    auto backward = engine.find_related("source", 10, Direction::Backward);
    ASSERT_EQ(backward.size(), 1u);
    EXPECT_EQ(backward[0].id, "precedent");

    auto both = engine.find_related("source", 2);
    ASSERT_EQ(both.size(), 2u);
    EXPECT_GE(both[0].score, both[1].score);
    EXPECT_GT(both[1].score, 0.0);
}

TEST_F(AttentionTest, CancelledAttention) {
    CancellationToken token;
    token.cancel();

    auto attention = engine.compute_attention("source", 10, &token);
    EXPECT_EQ(attention.status, ResultStatus::Cancelled);
    EXPECT_TRUE(attention.forward.empty());
}

TEST_F(AttentionTest, UnknownSourceThrows) {
    EXPECT_THROW(engine.compute_attention("missing", 10), NotFoundError);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
