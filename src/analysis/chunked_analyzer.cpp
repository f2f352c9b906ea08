#include "analysis/chunked_analyzer.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <set>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace tempo {

namespace {

// Attention given to a carried chain tail that had no attention score of its own
constexpr double kCarriedTailAttention = 0.5;

constexpr size_t kSummaryEvents = 3;
constexpr size_t kSummaryEntities = 5;

using Clock = std::chrono::high_resolution_clock;
using ChainGraph = std::map<std::string, std::vector<std::string>>;

double elapsed_ms(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

bool by_time_then_id(const Document* a, const Document* b) {
    if (a->timestamp != b->timestamp) {
        return a->timestamp < b->timestamp;
    }
    return a->id < b->id;
}

std::string summarize_content(const std::string& content, size_t max_chars) {
    if (content.size() <= max_chars) {
        return content;
    }
    size_t cut = max_chars;
    while (cut > 0 && (static_cast<unsigned char>(content[cut]) & 0xC0) == 0x80) {
        --cut;  // never split a UTF-8 sequence
    }
    return content.substr(0, cut) + "...";
}

// Depth-first enumeration of maximal simple paths
void extend_paths(const ChainGraph& successors,
                  std::vector<std::string>& path,
                  std::set<std::string>& on_path,
                  size_t max_length,
                  size_t max_paths,
                  std::vector<std::vector<std::string>>& out) {
    if (out.size() >= max_paths) {
        return;
    }

    bool extended = false;
    auto it = successors.find(path.back());
    if (it != successors.end() && path.size() < max_length) {
        for (const auto& next : it->second) {
            if (on_path.count(next)) {
                continue;
            }
            extended = true;
            path.push_back(next);
            on_path.insert(next);
            extend_paths(successors, path, on_path, max_length, max_paths, out);
            on_path.erase(next);
            path.pop_back();
            if (out.size() >= max_paths) {
                return;
            }
        }
    }

    if (!extended && path.size() >= 2) {
        out.push_back(path);
    }
}

// Drop chains that appear inside a longer (or earlier identical) chain, keeping input order
std::vector<CausalChain> drop_contained(const std::vector<CausalChain>& chains) {
    std::vector<size_t> order(chains.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&chains](size_t a, size_t b) {
        return chains[a].size() > chains[b].size();
    });

    std::vector<bool> keep(chains.size(), false);
    std::unordered_map<std::string, std::vector<size_t>> kept_by_member;

    for (size_t idx : order) {
        const CausalChain& chain = chains[idx];
        if (chain.empty()) {
            continue;
        }

        bool covered = false;
        auto it = kept_by_member.find(chain.head());
        if (it != kept_by_member.end()) {
            for (size_t other : it->second) {
                if (chains[other].contains(chain)) {
                    covered = true;
                    break;
                }
            }
        }
        if (covered) {
            continue;
        }

        keep[idx] = true;
        for (const auto& id : chain.documents) {
            kept_by_member[id].push_back(idx);
        }
    }

    std::vector<CausalChain> result;
    for (size_t i = 0; i < chains.size(); ++i) {
        if (keep[i]) {
            result.push_back(chains[i]);
        }
    }
    return result;
}

std::vector<std::string> top_entities(const std::map<std::string, size_t>& entities, size_t limit) {
    std::vector<std::pair<std::string, size_t>> sorted(entities.begin(), entities.end());
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });

    std::vector<std::string> result;
    for (size_t i = 0; i < sorted.size() && i < limit; ++i) {
        result.push_back(sorted[i].first);
    }
    return result;
}

nlohmann::json events_to_json(const std::vector<CriticalEvent>& events) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& event : events) {
        j.push_back(event.to_json());
    }
    return j;
}

nlohmann::json chains_to_json(const std::vector<CausalChain>& chains) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& chain : chains) {
        j.push_back(chain.to_json());
    }
    return j;
}

} // namespace

// ==========================================
// Result types
// ==========================================

nlohmann::json ChunkResult::to_json() const {
    nlohmann::json j;
    j["index"] = index;
    j["window_start"] = window_start.to_iso8601();
    j["window_end"] = window_end.to_iso8601();
    j["closed_end"] = closed_end;
    j["document_ids"] = document_ids;
    j["carried_ids"] = carried_ids;
    j["critical_events"] = events_to_json(critical_events);
    j["key_entities"] = key_entities;
    j["causal_chains"] = chains_to_json(causal_chains);

    j["open_questions"] = nlohmann::json::array();
    for (const auto& question : open_questions) {
        j["open_questions"].push_back(question.to_json());
    }

    j["causal_links"] = causal_links;
    j["carryover"] = carryover.to_json();
    j["processing_ms"] = processing_ms;
    j["working_set_size"] = working_set_size;
    return j;
}

std::string WindowSummary::period() const {
    return start.to_date_string() + " to " + end.to_date_string();
}

nlohmann::json WindowSummary::to_json() const {
    nlohmann::json j;
    j["index"] = index;
    j["period"] = period();
    j["start"] = start.to_iso8601();
    j["end"] = end.to_iso8601();
    j["new_documents"] = new_documents;
    j["num_documents"] = new_documents.size();
    j["top_events"] = events_to_json(top_events);
    j["causal_links"] = causal_links;
    j["top_entities"] = top_entities;
    return j;
}

nlohmann::json AnalysisResult::to_json() const {
    nlohmann::json j;
    j["start_id"] = start_id;
    if (end_id.has_value()) {
        j["end_id"] = *end_id;
    } else {
        j["end_id"] = nullptr;
    }
    j["span_start"] = span_start.to_iso8601();
    j["span_end"] = span_end.to_iso8601();
    j["span_days"] = span_days();
    j["num_windows"] = num_windows;

    j["critical_events"] = events_to_json(critical_events);
    j["key_entities"] = key_entities;
    j["causal_chains"] = chains_to_json(causal_chains);
    j["final_carryover"] = final_carryover.to_json();

    j["windows"] = nlohmann::json::array();
    for (const auto& window : windows) {
        j["windows"].push_back(window.to_json());
    }

    nlohmann::json metrics;
    metrics["documents_processed"] = documents_processed;
    metrics["total_processing_ms"] = total_processing_ms;
    metrics["avg_chunk_ms"] = avg_chunk_ms;
    metrics["avg_chunk_size"] = avg_chunk_size;
    metrics["peak_working_set"] = peak_working_set;
    metrics["estimated_unwindowed_ms"] = estimated_unwindowed_ms;
    metrics["speedup"] = speedup;
    j["metrics"] = metrics;

    j["status"] = result_status_to_string(status);
    return j;
}

void AnalysisResult::print_summary() const {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Windowed Analysis Summary\n";
    std::cout << std::string(60, '=') << "\n\n";

    std::cout << "Span: " << span_start.to_date_string() << " to " << span_end.to_date_string()
              << " (" << std::fixed << std::setprecision(1) << span_days() << " days)\n";
    std::cout << "Windows: " << num_windows << "\n";
    std::cout << "Documents: " << documents_processed << "\n";
    std::cout << "Status: " << result_status_to_string(status) << "\n\n";

    std::cout << "Processing:\n";
    std::cout << "  Total time: " << std::setprecision(3) << total_processing_ms << " ms\n";
    std::cout << "  Avg per window: " << avg_chunk_ms << " ms\n";
    std::cout << "  Avg window size: " << std::setprecision(1) << avg_chunk_size << " docs\n";
    std::cout << "  Peak working set: " << peak_working_set << " docs\n\n";

    std::cout << "Findings:\n";
    std::cout << "  Critical events: " << critical_events.size() << "\n";
    std::cout << "  Causal chains: " << causal_chains.size() << "\n";
    std::cout << "  Key entities: " << key_entities.size() << "\n";
    std::cout << "  Open questions: " << final_carryover.open_questions.size() << "\n";

    if (speedup > 0.0) {
        std::cout << "\nEstimated speedup over all-pairs analysis: "
                  << std::setprecision(1) << speedup << "x\n";
    }
    std::cout << std::string(60, '=') << "\n";
}

// ==========================================
// ChunkedAnalyzer
// ==========================================

ChunkedAnalyzer::ChunkedAnalyzer(const TemporalGraph& graph,
                                 const TraversalEngine& traversal,
                                 const AnalyzerConfig& config)
    : graph_(graph),
      traversal_(traversal),
      config_(config),
      entity_tokenizer_(config.min_entity_length, true) {
    if (config_.chunk_size_days <= 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    if (config_.max_chain_length < 2) {
        throw std::invalid_argument("Chains must be allowed at least two documents");
    }
}

void ChunkedAnalyzer::set_chunk_callback(ChunkCallback callback) {
    chunk_callback_ = callback;
}

double ChunkedAnalyzer::estimate_unwindowed_ms(size_t num_documents) {
    const double n = static_cast<double>(num_documents);
    if (num_documents < 50) {
        return 10.0 * n;   // per-document overhead dominates
    }
    return 0.1 * n + 0.01 * n * n;
}

ChunkResult ChunkedAnalyzer::process_window(const TemporalGraph::ReadView& view,
                                            size_t index,
                                            const Timestamp& lo,
                                            const Timestamp& hi,
                                            bool closed_end,
                                            const CarryoverState& previous) const {
    auto started = Clock::now();

    ChunkResult chunk;
    chunk.index = index;
    chunk.window_start = lo;
    chunk.window_end = hi;
    chunk.closed_end = closed_end;

    // ---- Working set: window documents plus flagged carryover documents ----

    std::vector<const Document*> window_docs;
    std::set<std::string> window_ids;
    for (const Document* doc : view.documents_in_range(lo, hi)) {
        if (!closed_end && doc->timestamp == hi) {
            continue;  // belongs to the next window
        }
        window_docs.push_back(doc);
        window_ids.insert(doc->id);
        chunk.document_ids.push_back(doc->id);
    }

    std::set<std::string> working_set = window_ids;
    std::map<std::string, double> inherited;

    std::vector<std::pair<const Document*, double>> carried;
    for (const auto& id : previous.flagged_documents()) {
        const Document* doc = view.find_document(id);
        if (!doc) {
            continue;
        }

        auto att = previous.attention.find(id);
        double weight = att != previous.attention.end() ? att->second : kCarriedTailAttention;
        carried.emplace_back(doc, weight);

        if (window_ids.count(id)) {
            inherited[id] = std::max(inherited[id], weight);
        } else {
            working_set.insert(id);
            chunk.carried_ids.push_back(id);
        }
    }

    // Attention flows only through documents the window actually holds
    auto in_working_set = [&working_set](const std::string& id) { return working_set.count(id) > 0; };
    for (const auto& [doc, weight] : carried) {
        if (doc->timestamp > hi) {
            continue;
        }
        auto reach = traversal_.reachable_in_range(view, doc->id, Direction::Forward,
                                                   doc->timestamp, hi, config_.carry_max_hops,
                                                   nullptr, in_working_set);
        for (const auto& reached : reach.documents) {
            if (window_ids.count(reached)) {
                inherited[reached] = std::max(inherited[reached], weight);
            }
        }
    }
    chunk.working_set_size = working_set.size();

    // ---- Importance ----

    std::map<std::string, size_t> degree;
    size_t max_degree = 0;
    for (const Document* doc : window_docs) {
        size_t d = 0;
        for (size_t idx : view.outgoing(doc->id)) {
            if (working_set.count(view.relationship(idx).to)) d++;
        }
        for (size_t idx : view.incoming(doc->id)) {
            if (working_set.count(view.relationship(idx).from)) d++;
        }
        degree[doc->id] = d;
        max_degree = std::max(max_degree, d);
    }

    const double window_seconds = static_cast<double>(hi.unix_seconds() - lo.unix_seconds());

    struct Scored {
        const Document* doc;
        double importance;
    };
    std::vector<Scored> scored;
    scored.reserve(window_docs.size());

    for (const Document* doc : window_docs) {
        double connectivity = max_degree > 0
            ? static_cast<double>(degree[doc->id]) / max_degree : 0.0;
        auto att = inherited.find(doc->id);
        double attention = att != inherited.end() ? att->second : 0.0;
        double recency = window_seconds > 0.0
            ? (doc->timestamp.unix_seconds() - lo.unix_seconds()) / window_seconds : 1.0;

        double importance = config_.weight_connectivity * connectivity +
                            config_.weight_attention * attention +
                            config_.weight_recency * recency;
        scored.push_back({doc, importance});
    }

    std::stable_sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.importance != b.importance) return a.importance > b.importance;
        return a.doc->id < b.doc->id;
    });

    for (size_t i = 0; i < scored.size() && i < config_.max_carryover_events; ++i) {
        CriticalEvent event;
        event.doc_id = scored[i].doc->id;
        event.timestamp = scored[i].doc->timestamp;
        event.importance = scored[i].importance;
        event.summary = summarize_content(scored[i].doc->content, config_.event_summary_chars);
        event.window_index = index;
        chunk.critical_events.push_back(event);
    }

    // ---- Entities ----

    std::map<std::string, size_t> mentions;
    for (const Document* doc : window_docs) {
        for (const auto& [token, count] : entity_tokenizer_.count(doc->content)) {
            mentions[token] += count;
        }
    }
    for (const auto& [token, count] : mentions) {
        if (count >= config_.min_entity_mentions) {
            chunk.key_entities[token] = count;
        }
    }

    // ---- Causal chains over the working set ----

    ChainGraph successors;
    std::map<std::string, size_t> in_degree;
    for (const auto& id : working_set) {
        for (size_t idx : view.outgoing(id)) {
            const Relationship& rel = view.relationship(idx);
            if (rel.kind != RelationKind::Causal || !working_set.count(rel.to)) {
                continue;
            }
            successors[id].push_back(rel.to);
            in_degree[rel.to]++;
            chunk.causal_links++;
        }
    }
    for (auto& [id, next] : successors) {
        std::sort(next.begin(), next.end(), [&view](const std::string& a, const std::string& b) {
            return by_time_then_id(&view.document(a), &view.document(b));
        });
        next.erase(std::unique(next.begin(), next.end()), next.end());
    }

    std::vector<const Document*> ordered;
    for (const auto& id : working_set) {
        ordered.push_back(&view.document(id));
    }
    std::sort(ordered.begin(), ordered.end(), by_time_then_id);

    // Most recent carried chain per tail
    std::map<std::string, size_t> tail_to_chain;
    for (size_t i = 0; i < previous.causal_chains.size(); ++i) {
        if (!previous.causal_chains[i].empty()) {
            tail_to_chain[previous.causal_chains[i].tail()] = i;
        }
    }

    std::vector<std::vector<std::string>> paths;
    std::set<std::string> covered;
    auto explore_from = [&](const std::string& root) {
        std::vector<std::string> path = {root};
        std::set<std::string> on_path = {root};
        size_t before = paths.size();
        extend_paths(successors, path, on_path, config_.max_chain_length,
                     config_.max_chain_enumeration, paths);
        for (size_t i = before; i < paths.size(); ++i) {
            covered.insert(paths[i].begin(), paths[i].end());
        }
    };

    for (const Document* doc : ordered) {
        if (successors.count(doc->id) && (in_degree[doc->id] == 0 || tail_to_chain.count(doc->id))) {
            explore_from(doc->id);
        }
    }
    // Causal cycles have no root
    for (const Document* doc : ordered) {
        if (successors.count(doc->id) && !covered.count(doc->id)) {
            explore_from(doc->id);
        }
    }

    std::set<size_t> extended;
    std::vector<CausalChain> found;
    for (const auto& path : paths) {
        bool touches_window = std::any_of(path.begin(), path.end(),
            [&window_ids](const std::string& id) { return window_ids.count(id) > 0; });
        if (!touches_window) {
            continue;
        }

        CausalChain chain;
        auto carried = tail_to_chain.find(path.front());
        if (carried != tail_to_chain.end()) {
            chain = previous.causal_chains[carried->second];
            chain.documents.insert(chain.documents.end(), path.begin() + 1, path.end());
            extended.insert(carried->second);
        } else {
            chain.documents = path;
        }
        chain.truncate_front(config_.max_chain_length);
        found.push_back(chain);
    }
    chunk.causal_chains = drop_contained(found);

    // ---- Open questions ----

    std::set<std::string> continued;
    for (const auto& chain : chunk.causal_chains) {
        continued.insert(chain.documents.begin(), chain.documents.end() - 1);
    }

    for (const auto& chain : chunk.causal_chains) {
        const Document& tail = view.document(chain.tail());
        for (size_t idx : view.outgoing(tail.id)) {
            const Relationship& rel = view.relationship(idx);
            if (rel.kind != RelationKind::Causal) {
                continue;
            }
            const Timestamp& target_ts = view.document(rel.to).timestamp;
            bool beyond = closed_end ? target_ts > hi : target_ts >= hi;
            if (!beyond) {
                continue;
            }

            std::ostringstream text;
            text << "Causal chain ending at " << tail.id << " (" << tail.timestamp.to_date_string()
                 << ") continues past " << hi.to_date_string();
            chunk.open_questions.push_back({tail.id, text.str()});
            break;
        }
    }

    // ---- Next carryover ----

    CarryoverState next;

    std::map<std::string, CriticalEvent> best_events;
    auto offer_event = [&best_events](const CriticalEvent& event) {
        auto [it, inserted] = best_events.emplace(event.doc_id, event);
        if (!inserted && event.importance > it->second.importance) {
            it->second = event;
        }
    };
    for (const auto& event : previous.critical_events) offer_event(event);
    for (const auto& event : chunk.critical_events) offer_event(event);

    for (const auto& [id, event] : best_events) {
        next.critical_events.push_back(event);
    }
    std::stable_sort(next.critical_events.begin(), next.critical_events.end(),
                     [](const CriticalEvent& a, const CriticalEvent& b) {
                         return a.importance > b.importance;
                     });
    if (next.critical_events.size() > config_.max_carryover_events) {
        next.critical_events.resize(config_.max_carryover_events);
    }

    std::map<std::string, size_t> entity_totals = previous.key_entities;
    for (const auto& [token, count] : chunk.key_entities) {
        entity_totals[token] += count;
    }
    for (const auto& token : top_entities(entity_totals, config_.max_carryover_entities)) {
        next.key_entities[token] = entity_totals[token];
    }

    std::vector<CausalChain> chains;
    for (size_t i = 0; i < previous.causal_chains.size(); ++i) {
        if (!extended.count(i)) {
            chains.push_back(previous.causal_chains[i]);
        }
    }
    chains.insert(chains.end(), chunk.causal_chains.begin(), chunk.causal_chains.end());
    chains = drop_contained(chains);
    if (chains.size() > config_.max_carryover_chains) {
        chains.erase(chains.begin(), chains.end() - static_cast<std::ptrdiff_t>(config_.max_carryover_chains));
    }
    next.causal_chains = chains;

    if (scored.empty()) {
        next.attention = previous.attention;
    } else {
        const double top = scored.front().importance;
        for (size_t i = 0; i < scored.size() && i < config_.max_carryover_attention; ++i) {
            next.attention[scored[i].doc->id] = top > 0.0 ? scored[i].importance / top : 1.0;
        }
    }

    std::set<std::string> questioned;
    for (const auto& question : previous.open_questions) {
        if (!continued.count(question.doc_id) && questioned.insert(question.doc_id).second) {
            next.open_questions.push_back(question);
        }
    }
    for (const auto& question : chunk.open_questions) {
        if (questioned.insert(question.doc_id).second) {
            next.open_questions.push_back(question);
        }
    }
    if (next.open_questions.size() > config_.max_open_questions) {
        next.open_questions.erase(next.open_questions.begin(),
                                  next.open_questions.end() -
                                      static_cast<std::ptrdiff_t>(config_.max_open_questions));
    }

    next.window_index = previous.window_index + 1;
    next.documents_seen = previous.documents_seen + window_docs.size();
    chunk.carryover = std::move(next);

    chunk.processing_ms = elapsed_ms(started);
    return chunk;
}

WindowSummary ChunkedAnalyzer::summarize(const ChunkResult& chunk) const {
    WindowSummary summary;
    summary.index = chunk.index;
    summary.start = chunk.window_start;
    summary.end = chunk.window_end;
    summary.new_documents = chunk.document_ids;
    for (size_t i = 0; i < chunk.critical_events.size() && i < kSummaryEvents; ++i) {
        summary.top_events.push_back(chunk.critical_events[i]);
    }
    summary.causal_links = chunk.causal_links;
    summary.top_entities = top_entities(chunk.key_entities, kSummaryEntities);
    return summary;
}

AnalysisResult ChunkedAnalyzer::analyze(const std::string& start_id,
                                        const std::optional<std::string>& end_id,
                                        std::optional<int> max_days,
                                        const CancellationToken* cancel) const {
    auto run_started = Clock::now();

    const int horizon = max_days.value_or(config_.max_days);
    if (horizon < 0) {
        throw std::invalid_argument("Analysis horizon must not be negative");
    }

    AnalysisResult result;
    result.start_id = start_id;
    result.end_id = end_id;

    {
        auto view = graph_.read();
        const Document& start = view.document(start_id);
        result.span_start = start.timestamp;

        if (end_id.has_value()) {
            const Document& end = view.document(*end_id);
            if (end.timestamp < start.timestamp) {
                throw std::invalid_argument("End document " + *end_id +
                                            " precedes start document " + start_id);
            }
            result.span_end = end.timestamp;
        } else {
            result.span_end = start.timestamp.plus_days(horizon);
        }
    }

    if (config_.verbose) {
        std::cout << "Analyzing " << result.span_start.to_date_string() << " to "
                  << result.span_end.to_date_string() << " in "
                  << config_.chunk_size_days << "-day windows\n";
    }

    CarryoverState state;
    state.attention[start_id] = 1.0;

    std::vector<CriticalEvent> all_events;
    std::vector<CausalChain> all_chains;
    double chunk_ms_total = 0.0;

    Timestamp lo = result.span_start;
    for (size_t index = 0; ; ++index) {
        if (CancellationToken::requested(cancel)) {
            result.status = ResultStatus::Cancelled;
            if (config_.verbose) {
                std::cerr << "Analysis cancelled after " << index << " windows\n";
            }
            break;
        }

        const Timestamp hi = std::min(lo.plus_days(config_.chunk_size_days), result.span_end);
        const bool last = hi >= result.span_end;

        ChunkResult chunk;
        {
            auto view = graph_.read();
            chunk = process_window(view, index, lo, hi, last, state);
        }

        result.num_windows++;
        result.documents_processed += chunk.document_ids.size();
        result.peak_working_set = std::max(result.peak_working_set, chunk.working_set_size);
        chunk_ms_total += chunk.processing_ms;

        all_events.insert(all_events.end(), chunk.critical_events.begin(), chunk.critical_events.end());
        all_chains.insert(all_chains.end(), chunk.causal_chains.begin(), chunk.causal_chains.end());
        for (const auto& [token, count] : chunk.key_entities) {
            result.key_entities[token] += count;
        }
        result.windows.push_back(summarize(chunk));

        if (config_.verbose) {
            std::cout << "  Window " << index << " [" << chunk.window_start.to_date_string()
                      << " .. " << chunk.window_end.to_date_string() << "]: "
                      << chunk.document_ids.size() << " docs, "
                      << chunk.carried_ids.size() << " carried, "
                      << chunk.critical_events.size() << " events, "
                      << chunk.causal_chains.size() << " chains\n";
        }

        if (chunk_callback_) {
            chunk_callback_(chunk);
        }

        state = std::move(chunk.carryover);

        if (last) {
            break;
        }
        lo = hi;
    }

    // ---- Synthesis ----

    std::map<std::string, CriticalEvent> best_events;
    for (const auto& event : all_events) {
        auto [it, inserted] = best_events.emplace(event.doc_id, event);
        if (!inserted && event.importance > it->second.importance) {
            it->second = event;
        }
    }
    for (const auto& [id, event] : best_events) {
        result.critical_events.push_back(event);
    }
    std::sort(result.critical_events.begin(), result.critical_events.end(),
              [](const CriticalEvent& a, const CriticalEvent& b) {
                  if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
                  return a.doc_id < b.doc_id;
              });

    result.causal_chains = drop_contained(all_chains);
    result.final_carryover = std::move(state);

    result.total_processing_ms = elapsed_ms(run_started);
    if (result.num_windows > 0) {
        result.avg_chunk_ms = chunk_ms_total / result.num_windows;
        result.avg_chunk_size = static_cast<double>(result.documents_processed) / result.num_windows;
    }
    result.estimated_unwindowed_ms = estimate_unwindowed_ms(result.documents_processed);
    if (result.total_processing_ms > 0.0) {
        result.speedup = result.estimated_unwindowed_ms / result.total_processing_ms;
    }

    return result;
}

std::vector<WindowSummary> ChunkedAnalyzer::get_temporal_summary(const std::string& start_id,
                                                                 const std::string& end_id,
                                                                 int num_chunks) const {
    if (num_chunks <= 0) {
        throw std::invalid_argument("Number of summary windows must be positive");
    }

    auto view = graph_.read();
    const Timestamp start = view.document(start_id).timestamp;
    const Timestamp end = view.document(end_id).timestamp;
    if (end < start) {
        throw std::invalid_argument("End document " + end_id + " precedes start document " + start_id);
    }

    const int64_t step = (end.unix_seconds() - start.unix_seconds()) / num_chunks;

    std::vector<WindowSummary> summaries;
    summaries.reserve(static_cast<size_t>(num_chunks));
    for (int i = 0; i < num_chunks; ++i) {
        const bool last = (i == num_chunks - 1);
        const Timestamp lo = start.plus_seconds(step * i);
        const Timestamp hi = last ? end : lo.plus_seconds(step);

        ChunkResult chunk = process_window(view, static_cast<size_t>(i), lo, hi, last, CarryoverState{});
        summaries.push_back(summarize(chunk));
    }
    return summaries;
}

} // namespace tempo
