#ifndef TEMPO_ANALYSIS_CHUNKED_ANALYZER_HPP
#define TEMPO_ANALYSIS_CHUNKED_ANALYZER_HPP

#include "analysis/carryover.hpp"
#include "common/cancellation.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "graph/temporal_graph.hpp"
#include "similarity/tokenizer.hpp"
#include "traversal/traversal_engine.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tempo {

/**
 * @brief Output of analyzing one window
 *
 * Handed to the chunk callback and then dropped; the run keeps only a
 * WindowSummary of it.
 */
struct ChunkResult {
    size_t index = 0;
    Timestamp window_start;
    Timestamp window_end;
    bool closed_end = false;                       // Last window includes its end instant

    std::vector<std::string> document_ids;         // Documents inside the window, by time
    std::vector<std::string> carried_ids;          // Flagged carryover documents considered

    std::vector<CriticalEvent> critical_events;
    std::map<std::string, size_t> key_entities;
    std::vector<CausalChain> causal_chains;
    std::vector<OpenQuestion> open_questions;      // Raised in this window
    size_t causal_links = 0;                       // Causal edges inside the working set

    CarryoverState carryover;                      // State handed to the next window

    double processing_ms = 0.0;
    size_t working_set_size = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief Compact per-window record
 */
struct WindowSummary {
    size_t index = 0;
    Timestamp start;
    Timestamp end;
    std::vector<std::string> new_documents;        // Documents first seen in this window
    std::vector<CriticalEvent> top_events;         // At most three
    size_t causal_links = 0;
    std::vector<std::string> top_entities;

    std::string period() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Synthesis of a full windowed run
 */
struct AnalysisResult {
    std::string start_id;
    std::optional<std::string> end_id;
    Timestamp span_start;
    Timestamp span_end;
    size_t num_windows = 0;

    std::vector<CriticalEvent> critical_events;    // Deduplicated by document
    std::map<std::string, size_t> key_entities;
    std::vector<CausalChain> causal_chains;        // Chains contained in others dropped
    CarryoverState final_carryover;
    std::vector<WindowSummary> windows;

    // Performance metrics
    size_t documents_processed = 0;
    double total_processing_ms = 0.0;
    double avg_chunk_ms = 0.0;
    double avg_chunk_size = 0.0;
    size_t peak_working_set = 0;
    double estimated_unwindowed_ms = 0.0;
    double speedup = 0.0;

    ResultStatus status = ResultStatus::Complete;

    double span_days() const { return span_start.days_until(span_end); }
    bool cancelled() const { return status == ResultStatus::Cancelled; }

    nlohmann::json to_json() const;

    /**
     * @brief Print summary to stdout
     */
    void print_summary() const;
};

/**
 * @brief Callback invoked once per finished window
 */
using ChunkCallback = std::function<void(const ChunkResult& chunk)>;

/**
 * @brief Windowed analysis of long temporal chains
 *
 * The span is cut into fixed windows processed strictly in order. Each
 * window sees its own documents plus the documents flagged by the previous
 * window's carryover, never more, and hands on a new carryover of bounded
 * size. Memory therefore depends on the window size and the carryover
 * capacities only.
 */
class ChunkedAnalyzer {
public:
    ChunkedAnalyzer(const TemporalGraph& graph,
                    const TraversalEngine& traversal,
                    const AnalyzerConfig& config = {});

    /**
     * @brief Analyze from `start_id` to `end_id`, or for `max_days` when no end is given
     *
     * Windows are [lo, lo + chunk) except the last, which is closed. When the
     * token fires, the run stops between windows and returns the windows it
     * finished with status Cancelled.
     *
     * @throws NotFoundError if a document is unknown
     * @throws std::invalid_argument if the end document precedes the start
     */
    AnalysisResult analyze(const std::string& start_id,
                           const std::optional<std::string>& end_id = std::nullopt,
                           std::optional<int> max_days = std::nullopt,
                           const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Split [start, end] into `num_chunks` equal windows and summarize each
     *
     * Each window is scored on its own documents only; no carryover is used.
     * The last window absorbs the remainder and includes the end instant.
     *
     * @throws std::invalid_argument if num_chunks <= 0 or end precedes start
     */
    std::vector<WindowSummary> get_temporal_summary(const std::string& start_id,
                                                    const std::string& end_id,
                                                    int num_chunks) const;

    void set_chunk_callback(ChunkCallback callback);

    /**
     * @brief Cost model for an all-pairs computation over n documents, in ms
     */
    static double estimate_unwindowed_ms(size_t num_documents);

    const AnalyzerConfig& config() const { return config_; }

private:
    ChunkResult process_window(const TemporalGraph::ReadView& view,
                               size_t index,
                               const Timestamp& lo,
                               const Timestamp& hi,
                               bool closed_end,
                               const CarryoverState& previous) const;

    WindowSummary summarize(const ChunkResult& chunk) const;

    const TemporalGraph& graph_;
    const TraversalEngine& traversal_;
    AnalyzerConfig config_;
    Tokenizer entity_tokenizer_;
    ChunkCallback chunk_callback_;
};

} // namespace tempo

#endif // TEMPO_ANALYSIS_CHUNKED_ANALYZER_HPP
