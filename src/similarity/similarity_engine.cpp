#include "similarity/similarity_engine.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

namespace tempo {

namespace {

bool attention_order(const AttentionEntry& a, const AttentionEntry& b) {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    double da = std::fabs(a.days_from_source);
    double db = std::fabs(b.days_from_source);
    if (da != db) {
        return da < db;
    }
    return a.id < b.id;
}

double total_score(const std::vector<AttentionEntry>& entries) {
    double total = 0.0;
    for (const auto& entry : entries) {
        total += entry.score;
    }
    return total;
}

} // namespace

// ==========================================
// SimilarityCache
// ==========================================

nlohmann::json SimilarityCacheStats::to_json() const {
    nlohmann::json j;
    j["hits"] = hits;
    j["misses"] = misses;
    j["rebuilds"] = rebuilds;
    j["cached_vectors"] = cached_vectors;
    j["cached_pairs"] = cached_pairs;
    j["corpus_size"] = corpus_size;
    j["vocabulary_size"] = vocabulary_size;
    return j;
}

SimilarityCache::SimilarityCache(size_t max_pairs) : max_pairs_(max_pairs) {}

void SimilarityCache::reset(uint64_t revision,
                            size_t corpus_size,
                            std::unordered_map<std::string, size_t> document_frequency) {
    built_ = true;
    revision_ = revision;
    corpus_size_ = corpus_size;
    document_frequency_ = std::move(document_frequency);
    vectors_.clear();
    pairs_.clear();
    rebuilds_++;
}

size_t SimilarityCache::document_frequency(const std::string& term) const {
    auto it = document_frequency_.find(term);
    return it != document_frequency_.end() ? it->second : 0;
}

const TermVector* SimilarityCache::find_vector(const std::string& id) const {
    auto it = vectors_.find(id);
    return it != vectors_.end() ? &it->second : nullptr;
}

const TermVector& SimilarityCache::store_vector(const std::string& id, TermVector vector) {
    return vectors_[id] = std::move(vector);
}

std::pair<std::string, std::string> SimilarityCache::pair_key(const std::string& a,
                                                              const std::string& b) {
    return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

std::optional<double> SimilarityCache::find_pair(const std::string& a, const std::string& b) {
    auto it = pairs_.find(pair_key(a, b));
    if (it == pairs_.end()) {
        misses_++;
        return std::nullopt;
    }
    hits_++;
    return it->second;
}

void SimilarityCache::store_pair(const std::string& a, const std::string& b, double score) {
    if (pairs_.size() >= max_pairs_) {
        pairs_.clear();
    }
    pairs_[pair_key(a, b)] = score;
}

SimilarityCacheStats SimilarityCache::stats() const {
    SimilarityCacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.rebuilds = rebuilds_;
    stats.cached_vectors = vectors_.size();
    stats.cached_pairs = pairs_.size();
    stats.corpus_size = corpus_size_;
    stats.vocabulary_size = document_frequency_.size();
    return stats;
}

// ==========================================
// AttentionResult
// ==========================================

nlohmann::json AttentionEntry::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["score"] = score;
    j["days_from_source"] = days_from_source;
    return j;
}

double AttentionResult::total_forward() const {
    return total_score(forward);
}

double AttentionResult::total_backward() const {
    return total_score(backward);
}

double AttentionResult::balance() const {
    double fwd = total_forward();
    double total = fwd + total_backward();
    return total > 0.0 ? fwd / total : 0.5;
}

std::optional<std::string> AttentionResult::most_attended_forward() const {
    if (forward.empty()) return std::nullopt;
    return forward.front().id;
}

std::optional<std::string> AttentionResult::most_attended_backward() const {
    if (backward.empty()) return std::nullopt;
    return backward.front().id;
}

nlohmann::json AttentionResult::to_json() const {
    nlohmann::json j;
    j["source"] = source;

    j["forward"] = nlohmann::json::array();
    for (const auto& entry : forward) {
        j["forward"].push_back(entry.to_json());
    }
    j["backward"] = nlohmann::json::array();
    for (const auto& entry : backward) {
        j["backward"].push_back(entry.to_json());
    }

    nlohmann::json summary;
    summary["total_forward"] = total_forward();
    summary["total_backward"] = total_backward();
    summary["balance"] = balance();
    if (auto id = most_attended_forward()) {
        summary["most_attended_forward"] = *id;
    }
    if (auto id = most_attended_backward()) {
        summary["most_attended_backward"] = *id;
    }
    j["summary"] = summary;
    j["status"] = result_status_to_string(status);
    return j;
}

// ==========================================
// SimilarityEngine
// ==========================================

SimilarityEngine::SimilarityEngine(const TemporalGraph& graph,
                                   const TraversalEngine& traversal,
                                   const SimilarityConfig& config)
    : graph_(graph),
      traversal_(traversal),
      config_(config),
      tokenizer_(config.min_token_length, config.remove_stopwords),
      cache_(config.max_cached_pairs) {}

void SimilarityEngine::ensure_current(const TemporalGraph::ReadView& view) {
    if (cache_.is_current(view.revision())) {
        return;
    }

    std::unordered_map<std::string, size_t> document_frequency;
    for (const auto& [id, doc] : view.documents()) {
        for (const auto& [term, count] : tokenizer_.count(doc.content)) {
            document_frequency[term]++;
        }
    }
    cache_.reset(view.revision(), view.num_documents(), std::move(document_frequency));
}

TermVector SimilarityEngine::build_vector(const std::string& text) const {
    auto counts = tokenizer_.count(text);

    size_t total = 0;
    for (const auto& [term, count] : counts) {
        total += count;
    }

    TermVector vector;
    if (total == 0) {
        return vector;
    }

    const double n = static_cast<double>(cache_.corpus_size());
    double norm = 0.0;
    for (const auto& [term, count] : counts) {
        double tf = static_cast<double>(count) / total;
        double df = static_cast<double>(cache_.document_frequency(term));
        double idf = std::log((1.0 + n) / (1.0 + df)) + 1.0;
        double weight = tf * idf;
        vector[term] = weight;
        norm += weight * weight;
    }

    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (auto& [term, weight] : vector) {
            weight /= norm;
        }
    }
    return vector;
}

const TermVector& SimilarityEngine::vector_for(const TemporalGraph::ReadView& view,
                                               const std::string& id) {
    if (const TermVector* cached = cache_.find_vector(id)) {
        return *cached;
    }
    return cache_.store_vector(id, build_vector(view.document(id).content));
}

namespace {

double cosine(const TermVector& a, const TermVector& b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }
    const TermVector& small = a.size() <= b.size() ? a : b;
    const TermVector& large = a.size() <= b.size() ? b : a;

    double dot = 0.0;
    for (const auto& [term, weight] : small) {
        auto it = large.find(term);
        if (it != large.end()) {
            dot += weight * it->second;
        }
    }
    return std::min(1.0, std::max(0.0, dot));
}

} // namespace

double SimilarityEngine::score_pair(const TemporalGraph::ReadView& view,
                                    const std::string& a,
                                    const std::string& b) {
    if (a == b) {
        return vector_for(view, a).empty() ? 0.0 : 1.0;
    }

    if (auto cached = cache_.find_pair(a, b)) {
        return *cached;
    }

    double score = cosine(vector_for(view, a), vector_for(view, b));
    cache_.store_pair(a, b, score);
    return score;
}

double SimilarityEngine::similarity(const std::string& id_a, const std::string& id_b) {
    auto view = graph_.read();
    view.document(id_a);
    view.document(id_b);

    std::lock_guard<std::mutex> lock(mutex_);
    ensure_current(view);
    return score_pair(view, id_a, id_b);
}

double SimilarityEngine::similarity_text(const std::string& text_a, const std::string& text_b) {
    auto view = graph_.read();

    std::lock_guard<std::mutex> lock(mutex_);
    ensure_current(view);
    return cosine(build_vector(text_a), build_vector(text_b));
}

TermVector SimilarityEngine::document_vector(const std::string& id) {
    auto view = graph_.read();
    view.document(id);

    std::lock_guard<std::mutex> lock(mutex_);
    ensure_current(view);
    return vector_for(view, id);
}

std::vector<AttentionEntry> SimilarityEngine::rank(const TemporalGraph::ReadView& view,
                                                   const std::string& source,
                                                   const std::vector<std::string>& candidates,
                                                   size_t limit) {
    const Timestamp& source_ts = view.document(source).timestamp;

    std::vector<AttentionEntry> entries;
    entries.reserve(candidates.size());
    for (const auto& id : candidates) {
        AttentionEntry entry;
        entry.id = id;
        entry.score = score_pair(view, source, id);
        entry.days_from_source = source_ts.days_until(view.document(id).timestamp);
        entries.push_back(entry);
    }

    std::sort(entries.begin(), entries.end(), attention_order);
    if (entries.size() > limit) {
        entries.resize(limit);
    }
    return entries;
}

AttentionResult SimilarityEngine::compute_attention(const std::string& id,
                                                    size_t max_per_direction,
                                                    const CancellationToken* cancel) {
    auto view = graph_.read();
    view.document(id);

    const size_t unbounded = std::numeric_limits<size_t>::max();

    AttentionResult result;
    result.source = id;

    auto forward = traversal_.reachable(view, id, Direction::Forward,
                                        config_.attention_window_days,
                                        config_.attention_max_hops, unbounded, cancel);
    ReachabilityResult backward;
    if (forward.cancelled()) {
        result.status = ResultStatus::Cancelled;
    } else {
        backward = traversal_.reachable(view, id, Direction::Backward,
                                        config_.attention_window_days,
                                        config_.attention_max_hops, unbounded, cancel);
        if (backward.cancelled()) {
            result.status = ResultStatus::Cancelled;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ensure_current(view);
    result.forward = rank(view, id, forward.documents, max_per_direction);
    result.backward = rank(view, id, backward.documents, max_per_direction);
    return result;
}

std::vector<AttentionEntry> SimilarityEngine::find_related(const std::string& id,
                                                           size_t max_results,
                                                           std::optional<Direction> direction) {
    auto view = graph_.read();
    view.document(id);

    const size_t unbounded = std::numeric_limits<size_t>::max();

    std::vector<std::string> candidates;
    if (!direction || *direction == Direction::Forward) {
        auto forward = traversal_.reachable(view, id, Direction::Forward,
                                            config_.attention_window_days,
                                            config_.attention_max_hops, unbounded);
        candidates.insert(candidates.end(), forward.documents.begin(), forward.documents.end());
    }
    if (!direction || *direction == Direction::Backward) {
        auto backward = traversal_.reachable(view, id, Direction::Backward,
                                             config_.attention_window_days,
                                             config_.attention_max_hops, unbounded);
        candidates.insert(candidates.end(), backward.documents.begin(), backward.documents.end());
    }

    // A document can be reachable both ways through a cycle
    std::set<std::string> seen;
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [&seen](const std::string& c) { return !seen.insert(c).second; }),
                     candidates.end());

    std::lock_guard<std::mutex> lock(mutex_);
    ensure_current(view);
    return rank(view, id, candidates, max_results);
}

SimilarityCacheStats SimilarityEngine::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.stats();
}

} // namespace tempo
