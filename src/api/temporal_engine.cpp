#include "api/temporal_engine.hpp"
#include <stdexcept>

namespace tempo {

namespace {

const EngineConfig& validated(const EngineConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid engine configuration: " + error);
    }
    return config;
}

} // namespace

TemporalEngine::TemporalEngine() : TemporalEngine(EngineConfig{}) {}

TemporalEngine::TemporalEngine(const EngineConfig& config)
    : config_(validated(config)),
      graph_(config_.graph),
      traversal_(graph_, config_.traversal),
      analyzer_(graph_, traversal_, config_.analyzer) {}

SimilarityEngine& TemporalEngine::similarity_engine() {
    std::lock_guard<std::mutex> lock(similarity_mutex_);
    if (!similarity_) {
        similarity_ = std::make_unique<SimilarityEngine>(graph_, traversal_, config_.similarity);
    }
    return *similarity_;
}

// ==========================================
// Ingestion
// ==========================================

Document TemporalEngine::add_document(const std::string& id,
                                      const std::string& content,
                                      const std::string& timestamp,
                                      const std::map<std::string, std::string>& metadata) {
    return graph_.add_document(id, content, timestamp, metadata);
}

Document TemporalEngine::add_document(const std::string& id,
                                      const std::string& content,
                                      const Timestamp& timestamp,
                                      const std::map<std::string, std::string>& metadata) {
    return graph_.add_document(id, content, timestamp, metadata);
}

Relationship TemporalEngine::add_relationship(const std::string& from,
                                              const std::string& to,
                                              RelationKind kind,
                                              double weight,
                                              const std::map<std::string, std::string>& metadata) {
    return graph_.add_relationship(from, to, kind, weight, metadata);
}

Relationship TemporalEngine::add_relationship(const std::string& from,
                                              const std::string& to,
                                              const std::string& kind,
                                              double weight,
                                              const std::map<std::string, std::string>& metadata) {
    return graph_.add_relationship(from, to, relation_kind_from_string(kind), weight, metadata);
}

// ==========================================
// Lookup and navigation
// ==========================================

Document TemporalEngine::get_document(const std::string& id) const {
    return graph_.get_document(id);
}

std::vector<Document> TemporalEngine::list_documents(size_t limit) const {
    return graph_.list_documents(limit);
}

std::vector<Document> TemporalEngine::get_documents_in_range(const Timestamp& start,
                                                             const Timestamp& end) const {
    return graph_.get_documents_in_range(start, end);
}

std::vector<Document> TemporalEngine::get_documents_in_range(const std::string& start,
                                                             const std::string& end) const {
    return graph_.get_documents_in_range(graph_.normalizer().normalize(start),
                                         graph_.normalizer().normalize(end));
}

ReachabilityResult TemporalEngine::get_future_documents(const std::string& id,
                                                        const CancellationToken* cancel) const {
    return traversal_.forward_reachable(id, cancel);
}

ReachabilityResult TemporalEngine::get_future_documents(const std::string& id,
                                                        int time_window_days,
                                                        int max_hops,
                                                        size_t max_results,
                                                        const CancellationToken* cancel) const {
    return traversal_.forward_reachable(id, time_window_days, max_hops, max_results, cancel);
}

ReachabilityResult TemporalEngine::get_past_documents(const std::string& id,
                                                      const CancellationToken* cancel) const {
    return traversal_.backward_reachable(id, cancel);
}

ReachabilityResult TemporalEngine::get_past_documents(const std::string& id,
                                                      int time_window_days,
                                                      int max_hops,
                                                      size_t max_results,
                                                      const CancellationToken* cancel) const {
    return traversal_.backward_reachable(id, time_window_days, max_hops, max_results, cancel);
}

PathResult TemporalEngine::find_path(const std::string& from,
                                     const std::string& to,
                                     std::optional<int> max_hops,
                                     const CancellationToken* cancel) const {
    return traversal_.find_path(from, to, max_hops.value_or(config_.traversal.path_max_hops), cancel);
}

// ==========================================
// Similarity and attention
// ==========================================

double TemporalEngine::similarity(const std::string& id_a, const std::string& id_b) {
    return similarity_engine().similarity(id_a, id_b);
}

AttentionResult TemporalEngine::compute_attention(const std::string& id,
                                                  size_t max_per_direction,
                                                  const CancellationToken* cancel) {
    return similarity_engine().compute_attention(id, max_per_direction, cancel);
}

std::vector<AttentionEntry> TemporalEngine::find_related_documents(const std::string& id,
                                                                   size_t max_results,
                                                                   std::optional<Direction> direction) {
    return similarity_engine().find_related(id, max_results, direction);
}

// ==========================================
// Windowed analysis
// ==========================================

AnalysisResult TemporalEngine::analyze_long_chain(const std::string& start_id,
                                                  const std::optional<std::string>& end_id,
                                                  std::optional<int> max_days,
                                                  const CancellationToken* cancel) const {
    return analyzer_.analyze(start_id, end_id, max_days, cancel);
}

std::vector<WindowSummary> TemporalEngine::get_temporal_summary(const std::string& start_id,
                                                                const std::string& end_id,
                                                                int num_chunks) const {
    return analyzer_.get_temporal_summary(start_id, end_id, num_chunks);
}

// ==========================================
// Diagnostics
// ==========================================

GraphStatistics TemporalEngine::get_statistics() const {
    return graph_.compute_statistics();
}

nlohmann::json TemporalEngine::export_graph() const {
    nlohmann::json j = graph_.to_json();
    j["config"] = config_.to_json();
    return j;
}

} // namespace tempo
