#ifndef TEMPO_API_TEMPORAL_ENGINE_HPP
#define TEMPO_API_TEMPORAL_ENGINE_HPP

#include "analysis/chunked_analyzer.hpp"
#include "common/cancellation.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "graph/temporal_graph.hpp"
#include "similarity/similarity_engine.hpp"
#include "traversal/traversal_engine.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tempo {

/**
 * @brief In-process entry point owning the store and its engines
 *
 * Errors from the underlying components are passed through unchanged.
 * The similarity engine is built on first use.
 */
class TemporalEngine {
public:
    TemporalEngine();

    /**
     * @throws std::invalid_argument if the configuration does not validate
     */
    explicit TemporalEngine(const EngineConfig& config);

    TemporalEngine(const TemporalEngine&) = delete;
    TemporalEngine& operator=(const TemporalEngine&) = delete;

    // ==========================================
    // Ingestion
    // ==========================================

    Document add_document(const std::string& id,
                          const std::string& content,
                          const std::string& timestamp,
                          const std::map<std::string, std::string>& metadata = {});

    Document add_document(const std::string& id,
                          const std::string& content,
                          const Timestamp& timestamp,
                          const std::map<std::string, std::string>& metadata = {});

    Relationship add_relationship(const std::string& from,
                                  const std::string& to,
                                  RelationKind kind,
                                  double weight = 1.0,
                                  const std::map<std::string, std::string>& metadata = {});

    /**
     * @brief Same, with the kind given by name ("causal", "sequential", ...)
     * @throws std::invalid_argument for an unknown kind
     */
    Relationship add_relationship(const std::string& from,
                                  const std::string& to,
                                  const std::string& kind,
                                  double weight = 1.0,
                                  const std::map<std::string, std::string>& metadata = {});

    // ==========================================
    // Lookup and navigation
    // ==========================================

    Document get_document(const std::string& id) const;

    std::vector<Document> list_documents(size_t limit = 100) const;

    std::vector<Document> get_documents_in_range(const Timestamp& start, const Timestamp& end) const;

    // Bounds given as timestamp text, normalized like document timestamps
    std::vector<Document> get_documents_in_range(const std::string& start, const std::string& end) const;

    ReachabilityResult get_future_documents(const std::string& id,
                                            const CancellationToken* cancel = nullptr) const;
    ReachabilityResult get_future_documents(const std::string& id,
                                            int time_window_days,
                                            int max_hops,
                                            size_t max_results,
                                            const CancellationToken* cancel = nullptr) const;

    ReachabilityResult get_past_documents(const std::string& id,
                                          const CancellationToken* cancel = nullptr) const;
    ReachabilityResult get_past_documents(const std::string& id,
                                          int time_window_days,
                                          int max_hops,
                                          size_t max_results,
                                          const CancellationToken* cancel = nullptr) const;

    PathResult find_path(const std::string& from,
                         const std::string& to,
                         std::optional<int> max_hops = std::nullopt,
                         const CancellationToken* cancel = nullptr) const;

    // ==========================================
    // Similarity and attention
    // ==========================================

    double similarity(const std::string& id_a, const std::string& id_b);

    AttentionResult compute_attention(const std::string& id,
                                      size_t max_per_direction = 10,
                                      const CancellationToken* cancel = nullptr);

    std::vector<AttentionEntry> find_related_documents(const std::string& id,
                                                       size_t max_results = 10,
                                                       std::optional<Direction> direction = std::nullopt);

    // ==========================================
    // Windowed analysis
    // ==========================================

    AnalysisResult analyze_long_chain(const std::string& start_id,
                                      const std::optional<std::string>& end_id = std::nullopt,
                                      std::optional<int> max_days = std::nullopt,
                                      const CancellationToken* cancel = nullptr) const;

    std::vector<WindowSummary> get_temporal_summary(const std::string& start_id,
                                                    const std::string& end_id,
                                                    int num_chunks = 10) const;

    // ==========================================
    // Diagnostics
    // ==========================================

    GraphStatistics get_statistics() const;

    /**
     * @brief Full node/edge dump plus statistics (read-only)
     */
    nlohmann::json export_graph() const;

    const EngineConfig& config() const { return config_; }

    TemporalGraph& graph() { return graph_; }
    const TemporalGraph& graph() const { return graph_; }
    const TraversalEngine& traversal() const { return traversal_; }
    ChunkedAnalyzer& analyzer() { return analyzer_; }

    SimilarityEngine& similarity_engine();

private:
    EngineConfig config_;
    TemporalGraph graph_;
    TraversalEngine traversal_;
    ChunkedAnalyzer analyzer_;

    std::mutex similarity_mutex_;
    std::unique_ptr<SimilarityEngine> similarity_;
};

} // namespace tempo

#endif // TEMPO_API_TEMPORAL_ENGINE_HPP
