#ifndef TEMPO_SIMILARITY_SIMILARITY_ENGINE_HPP
#define TEMPO_SIMILARITY_SIMILARITY_ENGINE_HPP

#include "common/cancellation.hpp"
#include "common/config.hpp"
#include "graph/temporal_graph.hpp"
#include "similarity/tokenizer.hpp"
#include "traversal/traversal_engine.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace tempo {

// Term -> TF-IDF weight, L2-normalized
using TermVector = std::unordered_map<std::string, double>;

struct SimilarityCacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t rebuilds = 0;
    size_t cached_vectors = 0;
    size_t cached_pairs = 0;
    size_t corpus_size = 0;
    size_t vocabulary_size = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief Explicit memo cache owned by a SimilarityEngine
 *
 * Holds the corpus document frequencies, per-document vectors and
 * per-pair scores computed against one corpus revision. Any change of
 * revision (a document was added) drops everything, because IDF weights
 * of every document shift. Not synchronized; the owning engine locks.
 */
class SimilarityCache {
public:
    explicit SimilarityCache(size_t max_pairs = 100000);

    bool is_current(uint64_t revision) const { return built_ && revision_ == revision; }

    /**
     * @brief Drop all memoized values and adopt new corpus statistics
     */
    void reset(uint64_t revision,
               size_t corpus_size,
               std::unordered_map<std::string, size_t> document_frequency);

    size_t corpus_size() const { return corpus_size_; }
    size_t document_frequency(const std::string& term) const;

    const TermVector* find_vector(const std::string& id) const;
    const TermVector& store_vector(const std::string& id, TermVector vector);

    // Pairs are unordered: (a, b) and (b, a) share one entry
    std::optional<double> find_pair(const std::string& a, const std::string& b);
    void store_pair(const std::string& a, const std::string& b, double score);

    SimilarityCacheStats stats() const;

private:
    static std::pair<std::string, std::string> pair_key(const std::string& a, const std::string& b);

    size_t max_pairs_;
    bool built_ = false;
    uint64_t revision_ = 0;

    size_t corpus_size_ = 0;
    std::unordered_map<std::string, size_t> document_frequency_;

    std::unordered_map<std::string, TermVector> vectors_;
    std::map<std::pair<std::string, std::string>, double> pairs_;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t rebuilds_ = 0;
};

/**
 * @brief One attended document
 */
struct AttentionEntry {
    std::string id;
    double score = 0.0;              // Similarity to the source, [0, 1]
    double days_from_source = 0.0;   // Signed: positive for later documents

    nlohmann::json to_json() const;
};

/**
 * @brief Bidirectional attention around one document
 */
struct AttentionResult {
    std::string source;
    std::vector<AttentionEntry> forward;    // Ranked by score
    std::vector<AttentionEntry> backward;
    ResultStatus status = ResultStatus::Complete;

    double total_forward() const;
    double total_backward() const;

    /**
     * @brief Share of attention pointing forward, 0.5 when there is none
     */
    double balance() const;

    std::optional<std::string> most_attended_forward() const;
    std::optional<std::string> most_attended_backward() const;

    nlohmann::json to_json() const;
};

/**
 * @brief TF-IDF cosine similarity and reachability-based attention
 *
 * Document vectors use term frequency times smoothed inverse document
 * frequency, ln((1 + N) / (1 + df)) + 1, over the current corpus. Vectors
 * and scores are memoized in a SimilarityCache that is rebuilt lazily the
 * first time it is used after the corpus revision changes.
 */
class SimilarityEngine {
public:
    SimilarityEngine(const TemporalGraph& graph,
                     const TraversalEngine& traversal,
                     const SimilarityConfig& config = {});

    /**
     * @brief Cosine similarity of two stored documents
     * @return Value in [0, 1]; symmetric; 1 for a document with itself
     *         unless it has no terms at all
     * @throws NotFoundError
     */
    double similarity(const std::string& id_a, const std::string& id_b);

    /**
     * @brief Similarity of two free texts weighted by the current corpus
     */
    double similarity_text(const std::string& text_a, const std::string& text_b);

    /**
     * @brief Rank forward and backward reachable documents by similarity
     *
     * Ties in score go to the document closer in time to the source.
     *
     * @param max_per_direction Entries kept on each side
     * @throws NotFoundError
     */
    AttentionResult compute_attention(const std::string& id,
                                      size_t max_per_direction,
                                      const CancellationToken* cancel = nullptr);

    /**
     * @brief Reachable documents most similar to `id`
     * @param direction Restrict to one side; both sides when empty
     */
    std::vector<AttentionEntry> find_related(const std::string& id,
                                             size_t max_results,
                                             std::optional<Direction> direction = std::nullopt);

    // Term vector of a stored document against the current corpus
    TermVector document_vector(const std::string& id);

    SimilarityCacheStats stats() const;

    const Tokenizer& tokenizer() const { return tokenizer_; }

private:
    void ensure_current(const TemporalGraph::ReadView& view);
    TermVector build_vector(const std::string& text) const;
    const TermVector& vector_for(const TemporalGraph::ReadView& view, const std::string& id);
    double score_pair(const TemporalGraph::ReadView& view, const std::string& a, const std::string& b);

    std::vector<AttentionEntry> rank(const TemporalGraph::ReadView& view,
                                     const std::string& source,
                                     const std::vector<std::string>& candidates,
                                     size_t limit);

    const TemporalGraph& graph_;
    const TraversalEngine& traversal_;
    SimilarityConfig config_;
    Tokenizer tokenizer_;

    mutable std::mutex mutex_;
    SimilarityCache cache_;
};

} // namespace tempo

#endif // TEMPO_SIMILARITY_SIMILARITY_ENGINE_HPP
