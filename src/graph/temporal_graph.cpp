#include "graph/temporal_graph.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace tempo {

namespace {

bool by_time_then_id(const Document* a, const Document* b) {
    if (a->timestamp != b->timestamp) {
        return a->timestamp < b->timestamp;
    }
    return a->id < b->id;
}

} // namespace

// ==========================================
// RelationKind
// ==========================================

std::string relation_kind_to_string(RelationKind kind) {
    switch (kind) {
        case RelationKind::Sequential: return "sequential";
        case RelationKind::Causal:     return "causal";
        case RelationKind::Concurrent: return "concurrent";
        case RelationKind::Branch:     return "branch";
        case RelationKind::Merge:      return "merge";
    }
    return "unknown";
}

RelationKind relation_kind_from_string(const std::string& name) {
    if (name == "sequential") return RelationKind::Sequential;
    if (name == "causal") return RelationKind::Causal;
    if (name == "concurrent") return RelationKind::Concurrent;
    if (name == "branch") return RelationKind::Branch;
    if (name == "merge") return RelationKind::Merge;
    throw std::invalid_argument("Unknown relation kind: " + name);
}

bool is_time_ordered_kind(RelationKind kind) {
    return kind == RelationKind::Sequential || kind == RelationKind::Causal;
}

// ==========================================
// Document / Relationship
// ==========================================

nlohmann::json Document::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["content"] = content;
    j["timestamp"] = timestamp.to_iso8601();
    j["metadata"] = metadata;
    return j;
}

Document Document::from_json(const nlohmann::json& j) {
    Document doc;
    doc.id = j.at("id").get<std::string>();
    doc.content = j.value("content", "");
    doc.timestamp = Timestamp::parse_zoned(j.at("timestamp").get<std::string>());
    if (j.contains("metadata")) {
        doc.metadata = j["metadata"].get<std::map<std::string, std::string>>();
    }
    return doc;
}

nlohmann::json TemporalOrderWarning::to_json() const {
    nlohmann::json j;
    j["from_timestamp"] = from_timestamp.to_iso8601();
    j["to_timestamp"] = to_timestamp.to_iso8601();
    j["message"] = message;
    return j;
}

nlohmann::json Relationship::to_json() const {
    nlohmann::json j;
    j["index"] = index;
    j["from"] = from;
    j["to"] = to;
    j["kind"] = relation_kind_to_string(kind);
    j["weight"] = weight;
    j["metadata"] = metadata;
    if (warning.has_value()) {
        j["warning"] = warning->to_json();
    }
    return j;
}

Relationship Relationship::from_json(const nlohmann::json& j) {
    Relationship rel;
    rel.index = j.value("index", static_cast<size_t>(0));
    rel.from = j.at("from").get<std::string>();
    rel.to = j.at("to").get<std::string>();
    rel.kind = relation_kind_from_string(j.at("kind").get<std::string>());
    rel.weight = j.value("weight", 1.0);
    if (j.contains("metadata")) {
        rel.metadata = j["metadata"].get<std::map<std::string, std::string>>();
    }
    if (j.contains("warning")) {
        const auto& w = j["warning"];
        TemporalOrderWarning warning;
        warning.from_timestamp = Timestamp::parse_zoned(w.at("from_timestamp").get<std::string>());
        warning.to_timestamp = Timestamp::parse_zoned(w.at("to_timestamp").get<std::string>());
        warning.message = w.value("message", "");
        rel.warning = warning;
    }
    return rel;
}

// ==========================================
// GraphStatistics
// ==========================================

nlohmann::json GraphStatistics::to_json() const {
    nlohmann::json j;
    j["num_documents"] = num_documents;
    j["num_relationships"] = num_relationships;
    j["num_layers"] = num_layers;
    j["num_warnings"] = num_warnings;
    j["relationships_by_kind"] = relationships_by_kind;
    j["avg_edges_per_document"] = avg_edges_per_document;
    j["avg_layer_size"] = avg_layer_size;
    if (earliest.has_value()) {
        j["earliest"] = earliest->to_iso8601();
    }
    if (latest.has_value()) {
        j["latest"] = latest->to_iso8601();
    }
    j["time_span_days"] = time_span_days;
    j["traversals_performed"] = traversals_performed;
    j["revision"] = revision;
    return j;
}

void GraphStatistics::print_summary() const {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Temporal Graph Summary\n";
    std::cout << std::string(60, '=') << "\n\n";

    std::cout << "Documents: " << num_documents << "\n";
    std::cout << "Relationships: " << num_relationships << "\n";
    for (const auto& [kind, count] : relationships_by_kind) {
        std::cout << "  " << kind << ": " << count << "\n";
    }
    std::cout << "Backward-in-time warnings: " << num_warnings << "\n\n";

    std::cout << "Layers: " << num_layers
              << " (avg " << std::fixed << std::setprecision(2) << avg_layer_size << " docs)\n";
    std::cout << "Avg edges per document: " << avg_edges_per_document << "\n";
    if (earliest.has_value() && latest.has_value()) {
        std::cout << "Span: " << earliest->to_date_string() << " .. "
                  << latest->to_date_string() << " (" << time_span_days << " days)\n";
    }
    std::cout << "Traversals performed: " << traversals_performed << "\n";
    std::cout << std::string(60, '=') << "\n";
}

// ==========================================
// ReadView
// ==========================================

TemporalGraph::ReadView::ReadView(const TemporalGraph& graph)
    : graph_(&graph), lock_(graph.mutex_) {}

const Document* TemporalGraph::ReadView::find_document(const std::string& id) const {
    auto it = graph_->documents_.find(id);
    return it != graph_->documents_.end() ? &it->second : nullptr;
}

const Document& TemporalGraph::ReadView::document(const std::string& id) const {
    const Document* doc = find_document(id);
    if (!doc) {
        throw NotFoundError(id);
    }
    return *doc;
}

bool TemporalGraph::ReadView::has_document(const std::string& id) const {
    return graph_->documents_.count(id) > 0;
}

const std::vector<size_t>& TemporalGraph::ReadView::outgoing(const std::string& id) const {
    auto it = graph_->outgoing_.find(id);
    return it != graph_->outgoing_.end() ? it->second : empty_edges();
}

const std::vector<size_t>& TemporalGraph::ReadView::incoming(const std::string& id) const {
    auto it = graph_->incoming_.find(id);
    return it != graph_->incoming_.end() ? it->second : empty_edges();
}

const Relationship& TemporalGraph::ReadView::relationship(size_t index) const {
    return graph_->relationships_.at(index);
}

std::vector<const Document*> TemporalGraph::ReadView::documents_in_range(
    const Timestamp& start, const Timestamp& end) const {

    std::vector<const Document*> result;
    for (int64_t number : graph_->layers_.buckets_in_range(start, end)) {
        const auto* ids = graph_->layers_.bucket(number);
        if (!ids) continue;
        for (const auto& id : *ids) {
            const Document& doc = graph_->documents_.at(id);
            if (doc.timestamp >= start && doc.timestamp <= end) {
                result.push_back(&doc);
            }
        }
    }
    std::sort(result.begin(), result.end(), by_time_then_id);
    return result;
}

const std::map<std::string, Document>& TemporalGraph::ReadView::documents() const {
    return graph_->documents_;
}

const std::vector<Relationship>& TemporalGraph::ReadView::relationships() const {
    return graph_->relationships_;
}

const LayerIndex& TemporalGraph::ReadView::layers() const {
    return graph_->layers_;
}

size_t TemporalGraph::ReadView::num_documents() const {
    return graph_->documents_.size();
}

size_t TemporalGraph::ReadView::num_relationships() const {
    return graph_->relationships_.size();
}

uint64_t TemporalGraph::ReadView::revision() const {
    return graph_->revision_;
}

const GraphConfig& TemporalGraph::ReadView::config() const {
    return graph_->config_;
}

// ==========================================
// TemporalGraph: writes
// ==========================================

TemporalGraph::TemporalGraph() : TemporalGraph(GraphConfig{}) {}

TemporalGraph::TemporalGraph(const GraphConfig& config)
    : config_(config),
      normalizer_(config.naive_offset_minutes),
      layers_(config.layer_days) {}

const std::vector<size_t>& TemporalGraph::empty_edges() {
    static const std::vector<size_t> empty;
    return empty;
}

Document TemporalGraph::add_document(const std::string& id,
                                     const std::string& content,
                                     const std::string& timestamp,
                                     const std::map<std::string, std::string>& metadata) {
    // Parse outside the lock; malformed text never touches the store
    Timestamp ts = normalizer_.normalize(timestamp);
    return add_document(id, content, ts, metadata);
}

Document TemporalGraph::add_document(const std::string& id,
                                     const std::string& content,
                                     const Timestamp& timestamp,
                                     const std::map<std::string, std::string>& metadata) {
    if (id.empty()) {
        throw std::invalid_argument("Document id must not be empty");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (documents_.count(id)) {
        throw DuplicateDocumentError(id);
    }

    Document doc;
    doc.id = id;
    doc.content = content;
    doc.timestamp = timestamp;
    doc.metadata = metadata;

    auto [it, inserted] = documents_.emplace(id, std::move(doc));
    layers_.insert(id, timestamp);
    ++revision_;

    return it->second;
}

Relationship TemporalGraph::add_relationship(const std::string& from,
                                             const std::string& to,
                                             RelationKind kind,
                                             double weight,
                                             const std::map<std::string, std::string>& metadata) {
    if (!std::isfinite(weight)) {
        throw std::invalid_argument("Relationship weight must be finite");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto from_it = documents_.find(from);
    if (from_it == documents_.end()) {
        throw UnknownDocumentError(from);
    }
    auto to_it = documents_.find(to);
    if (to_it == documents_.end()) {
        throw UnknownDocumentError(to);
    }

    Relationship rel;
    rel.index = relationships_.size();
    rel.from = from;
    rel.to = to;
    rel.kind = kind;
    rel.weight = weight;
    rel.metadata = metadata;

    const Timestamp& from_ts = from_it->second.timestamp;
    const Timestamp& to_ts = to_it->second.timestamp;
    if (is_time_ordered_kind(kind) && from_ts > to_ts) {
        std::ostringstream msg;
        msg << relation_kind_to_string(kind) << " relationship " << from << " -> " << to
            << " points backward in time (" << from_ts.to_iso8601()
            << " > " << to_ts.to_iso8601() << ")";

        TemporalOrderWarning warning;
        warning.from_timestamp = from_ts;
        warning.to_timestamp = to_ts;
        warning.message = msg.str();
        rel.warning = warning;

        if (config_.verbose) {
            std::cerr << "Warning: " << warning.message << "\n";
        }
    }

    relationships_.push_back(rel);
    outgoing_[from].push_back(rel.index);
    incoming_[to].push_back(rel.index);

    return rel;
}

void TemporalGraph::update_metadata(const std::string& id,
                                    const std::string& key,
                                    const std::string& value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = documents_.find(id);
    if (it == documents_.end()) {
        throw NotFoundError(id);
    }
    it->second.metadata[key] = value;
}

// ==========================================
// TemporalGraph: reads
// ==========================================

Document TemporalGraph::get_document(const std::string& id) const {
    auto view = read();
    return view.document(id);
}

bool TemporalGraph::has_document(const std::string& id) const {
    auto view = read();
    return view.has_document(id);
}

std::vector<Document> TemporalGraph::get_documents_in_range(const Timestamp& start,
                                                            const Timestamp& end) const {
    auto view = read();
    std::vector<Document> result;
    for (const Document* doc : view.documents_in_range(start, end)) {
        result.push_back(*doc);
    }
    return result;
}

std::vector<Document> TemporalGraph::list_documents(size_t limit) const {
    auto view = read();

    std::vector<const Document*> all;
    all.reserve(documents_.size());
    for (const auto& [id, doc] : documents_) {
        all.push_back(&doc);
    }
    std::sort(all.begin(), all.end(), by_time_then_id);

    std::vector<Document> result;
    for (size_t i = 0; i < all.size() && i < limit; ++i) {
        result.push_back(*all[i]);
    }
    return result;
}

std::vector<std::string> TemporalGraph::get_direct_successors(const std::string& id) const {
    auto view = read();
    if (!view.has_document(id)) {
        throw NotFoundError(id);
    }

    std::vector<std::string> result;
    for (size_t index : view.outgoing(id)) {
        const std::string& target = relationships_[index].to;
        if (std::find(result.begin(), result.end(), target) == result.end()) {
            result.push_back(target);
        }
    }
    return result;
}

std::vector<std::string> TemporalGraph::get_direct_predecessors(const std::string& id) const {
    auto view = read();
    if (!view.has_document(id)) {
        throw NotFoundError(id);
    }

    std::vector<std::string> result;
    for (size_t index : view.incoming(id)) {
        const std::string& source = relationships_[index].from;
        if (std::find(result.begin(), result.end(), source) == result.end()) {
            result.push_back(source);
        }
    }
    return result;
}

std::vector<Relationship> TemporalGraph::get_relationships_from(const std::string& id) const {
    auto view = read();
    if (!view.has_document(id)) {
        throw NotFoundError(id);
    }

    std::vector<Relationship> result;
    for (size_t index : view.outgoing(id)) {
        result.push_back(relationships_[index]);
    }
    return result;
}

std::vector<Relationship> TemporalGraph::get_relationships_to(const std::string& id) const {
    auto view = read();
    if (!view.has_document(id)) {
        throw NotFoundError(id);
    }

    std::vector<Relationship> result;
    for (size_t index : view.incoming(id)) {
        result.push_back(relationships_[index]);
    }
    return result;
}

bool TemporalGraph::has_edge(const std::string& from, const std::string& to) const {
    auto view = read();
    for (size_t index : view.outgoing(from)) {
        if (relationships_[index].to == to) {
            return true;
        }
    }
    return false;
}

std::vector<Relationship> TemporalGraph::get_warnings() const {
    auto view = read();
    std::vector<Relationship> result;
    for (const auto& rel : relationships_) {
        if (rel.has_warning()) {
            result.push_back(rel);
        }
    }
    return result;
}

std::vector<std::string> TemporalGraph::get_layer_documents(int64_t bucket) const {
    auto view = read();
    const auto* ids = layers_.bucket(bucket);
    if (!ids) {
        return {};
    }
    return std::vector<std::string>(ids->begin(), ids->end());
}

std::vector<int64_t> TemporalGraph::get_adjacent_layers(int64_t bucket) const {
    auto view = read();
    return layers_.adjacent(bucket);
}

size_t TemporalGraph::num_documents() const {
    auto view = read();
    return view.num_documents();
}

size_t TemporalGraph::num_relationships() const {
    auto view = read();
    return view.num_relationships();
}

uint64_t TemporalGraph::revision() const {
    auto view = read();
    return view.revision();
}

GraphStatistics TemporalGraph::statistics_from(const ReadView& view) const {
    GraphStatistics stats;
    stats.num_documents = view.num_documents();
    stats.num_relationships = view.num_relationships();
    stats.num_layers = view.layers().num_layers();
    stats.traversals_performed = traversals_performed_.load(std::memory_order_relaxed);
    stats.revision = view.revision();

    for (const auto& rel : view.relationships()) {
        stats.relationships_by_kind[relation_kind_to_string(rel.kind)]++;
        if (rel.has_warning()) {
            stats.num_warnings++;
        }
    }

    if (stats.num_documents == 0) {
        return stats;
    }

    stats.avg_edges_per_document =
        static_cast<double>(stats.num_relationships) / stats.num_documents;
    if (stats.num_layers > 0) {
        stats.avg_layer_size =
            static_cast<double>(view.layers().num_entries()) / stats.num_layers;
    }

    for (const auto& [id, doc] : view.documents()) {
        if (!stats.earliest || doc.timestamp < *stats.earliest) {
            stats.earliest = doc.timestamp;
        }
        if (!stats.latest || doc.timestamp > *stats.latest) {
            stats.latest = doc.timestamp;
        }
    }
    stats.time_span_days =
        stats.latest->days_since_epoch() - stats.earliest->days_since_epoch();

    return stats;
}

GraphStatistics TemporalGraph::compute_statistics() const {
    auto view = read();
    return statistics_from(view);
}

nlohmann::json TemporalGraph::to_json() const {
    auto view = read();

    nlohmann::json j;

    std::vector<const Document*> ordered;
    for (const auto& [id, doc] : view.documents()) {
        ordered.push_back(&doc);
    }
    std::sort(ordered.begin(), ordered.end(), by_time_then_id);

    j["documents"] = nlohmann::json::array();
    for (const Document* doc : ordered) {
        j["documents"].push_back(doc->to_json());
    }

    j["relationships"] = nlohmann::json::array();
    for (const auto& rel : view.relationships()) {
        j["relationships"].push_back(rel.to_json());
    }

    j["layers"] = view.layers().to_json();
    j["statistics"] = statistics_from(view).to_json();
    return j;
}

} // namespace tempo
