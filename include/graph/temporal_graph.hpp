#ifndef TEMPO_GRAPH_TEMPORAL_GRAPH_HPP
#define TEMPO_GRAPH_TEMPORAL_GRAPH_HPP

#include "common/config.hpp"
#include "index/layer_index.hpp"
#include "time/timestamp.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace tempo {

/**
 * @brief Fixed set of temporal relation kinds
 */
enum class RelationKind {
    Sequential,
    Causal,
    Concurrent,
    Branch,
    Merge
};

std::string relation_kind_to_string(RelationKind kind);

/**
 * @brief Parse a relation kind name ("sequential", "causal", ...)
 * @throws std::invalid_argument for an unknown name
 */
RelationKind relation_kind_from_string(const std::string& name);

// Kinds whose endpoints are expected to be ordered in time
bool is_time_ordered_kind(RelationKind kind);

/**
 * @brief A timestamped document (graph node)
 *
 * Content and timestamp are fixed at insertion. Only metadata may change.
 */
struct Document {
    std::string id;
    std::string content;
    Timestamp timestamp;                               // Canonical UTC instant
    std::map<std::string, std::string> metadata;

    nlohmann::json to_json() const;

    /**
     * @brief Create document from JSON
     *
     * The timestamp must carry 'Z' or an explicit offset, as written by
     * to_json(). Zone-naive text throws TimestampParseError.
     */
    static Document from_json(const nlohmann::json& j);
};

/**
 * @brief Audit record for a sequential/causal edge that points backward in time
 */
struct TemporalOrderWarning {
    Timestamp from_timestamp;
    Timestamp to_timestamp;
    std::string message;

    nlohmann::json to_json() const;
};

/**
 * @brief Directed, typed relationship between two documents
 *
 * Endpoints are document ids, never references into the store, so cycles
 * in the graph never create cyclic ownership.
 */
struct Relationship {
    size_t index = 0;                                  // Insertion order, stable
    std::string from;
    std::string to;
    RelationKind kind = RelationKind::Sequential;
    double weight = 1.0;
    std::map<std::string, std::string> metadata;

    std::optional<TemporalOrderWarning> warning;       // Set for backward-in-time edges

    bool has_warning() const { return warning.has_value(); }

    nlohmann::json to_json() const;
    static Relationship from_json(const nlohmann::json& j);
};

/**
 * @brief Summary statistics of the temporal graph
 */
struct GraphStatistics {
    size_t num_documents = 0;
    size_t num_relationships = 0;
    size_t num_layers = 0;
    size_t num_warnings = 0;
    std::map<std::string, size_t> relationships_by_kind;

    double avg_edges_per_document = 0.0;
    double avg_layer_size = 0.0;

    std::optional<Timestamp> earliest;
    std::optional<Timestamp> latest;
    int64_t time_span_days = 0;

    uint64_t traversals_performed = 0;
    uint64_t revision = 0;

    nlohmann::json to_json() const;

    /**
     * @brief Print summary to stdout
     */
    void print_summary() const;
};

/**
 * @brief In-memory store of documents and typed temporal relationships
 *
 * Writers (add_document, add_relationship, update_metadata) take the lock
 * exclusively; readers share it. A ReadView holds the shared lock for a
 * whole multi-step read so traversals never observe a half-applied write.
 */
class TemporalGraph {
public:
    /**
     * @brief Shared-lock view over the graph for multi-step reads
     *
     * Accessors return references into the store; they stay valid while
     * the view is alive. Do not call the graph's writing methods on the
     * same thread while holding a view.
     */
    class ReadView {
    public:
        explicit ReadView(const TemporalGraph& graph);

        const Document* find_document(const std::string& id) const;

        /**
         * @brief Get a document that must exist
         * @throws NotFoundError
         */
        const Document& document(const std::string& id) const;

        bool has_document(const std::string& id) const;

        // Edge indices leaving / entering a document
        const std::vector<size_t>& outgoing(const std::string& id) const;
        const std::vector<size_t>& incoming(const std::string& id) const;

        const Relationship& relationship(size_t index) const;

        /**
         * @brief Documents with timestamp in [start, end], ordered by (timestamp, id)
         */
        std::vector<const Document*> documents_in_range(const Timestamp& start,
                                                        const Timestamp& end) const;

        const std::map<std::string, Document>& documents() const;
        const std::vector<Relationship>& relationships() const;
        const LayerIndex& layers() const;

        size_t num_documents() const;
        size_t num_relationships() const;
        uint64_t revision() const;

        const GraphConfig& config() const;

    private:
        const TemporalGraph* graph_;
        std::shared_lock<std::shared_mutex> lock_;
    };

    TemporalGraph();
    explicit TemporalGraph(const GraphConfig& config);

    TemporalGraph(const TemporalGraph&) = delete;
    TemporalGraph& operator=(const TemporalGraph&) = delete;

    // ==========================================
    // Writes
    // ==========================================

    /**
     * @brief Insert a document
     * @throws DuplicateDocumentError if the id already exists
     * @throws TimestampParseError if the timestamp text is malformed
     */
    Document add_document(const std::string& id,
                          const std::string& content,
                          const std::string& timestamp,
                          const std::map<std::string, std::string>& metadata = {});

    Document add_document(const std::string& id,
                          const std::string& content,
                          const Timestamp& timestamp,
                          const std::map<std::string, std::string>& metadata = {});

    /**
     * @brief Insert a relationship
     *
     * For sequential and causal kinds, an edge whose source is later than
     * its target is still created and carries a TemporalOrderWarning.
     *
     * @return Copy of the created relationship (inspect has_warning())
     * @throws UnknownDocumentError if either endpoint is absent
     */
    Relationship add_relationship(const std::string& from,
                                  const std::string& to,
                                  RelationKind kind,
                                  double weight = 1.0,
                                  const std::map<std::string, std::string>& metadata = {});

    /**
     * @brief Set one metadata entry (the only mutation allowed on a document)
     * @throws NotFoundError
     */
    void update_metadata(const std::string& id, const std::string& key, const std::string& value);

    // ==========================================
    // Reads
    // ==========================================

    ReadView read() const { return ReadView(*this); }

    /**
     * @throws NotFoundError
     */
    Document get_document(const std::string& id) const;

    bool has_document(const std::string& id) const;

    /**
     * @brief All documents with canonical timestamp in [start, end]
     *
     * Uses the layer index to skip buckets outside the range; results are
     * identical to a linear scan, ordered by (timestamp, id).
     */
    std::vector<Document> get_documents_in_range(const Timestamp& start, const Timestamp& end) const;

    std::vector<Document> list_documents(size_t limit = 100) const;

    std::vector<std::string> get_direct_successors(const std::string& id) const;
    std::vector<std::string> get_direct_predecessors(const std::string& id) const;

    std::vector<Relationship> get_relationships_from(const std::string& id) const;
    std::vector<Relationship> get_relationships_to(const std::string& id) const;

    bool has_edge(const std::string& from, const std::string& to) const;

    /**
     * @brief Every relationship that carries a TemporalOrderWarning
     */
    std::vector<Relationship> get_warnings() const;

    std::vector<std::string> get_layer_documents(int64_t bucket) const;
    std::vector<int64_t> get_adjacent_layers(int64_t bucket) const;

    size_t num_documents() const;
    size_t num_relationships() const;

    /**
     * @brief Corpus revision, bumped on every document insertion
     */
    uint64_t revision() const;

    GraphStatistics compute_statistics() const;

    /**
     * @brief Read-only dump of every document and relationship plus statistics
     */
    nlohmann::json to_json() const;

    // Traversal bookkeeping (statistics only)
    void record_traversal() const { traversals_performed_.fetch_add(1, std::memory_order_relaxed); }

    const GraphConfig& config() const { return config_; }
    const TimestampNormalizer& normalizer() const { return normalizer_; }

private:
    GraphConfig config_;
    TimestampNormalizer normalizer_;

    mutable std::shared_mutex mutex_;

    std::map<std::string, Document> documents_;                        // id -> document
    std::vector<Relationship> relationships_;                          // index -> edge
    std::unordered_map<std::string, std::vector<size_t>> outgoing_;    // id -> edge indices
    std::unordered_map<std::string, std::vector<size_t>> incoming_;    // id -> edge indices
    LayerIndex layers_;

    uint64_t revision_ = 0;
    mutable std::atomic<uint64_t> traversals_performed_{0};

    static const std::vector<size_t>& empty_edges();

    GraphStatistics statistics_from(const ReadView& view) const;
};

} // namespace tempo

#endif // TEMPO_GRAPH_TEMPORAL_GRAPH_HPP
