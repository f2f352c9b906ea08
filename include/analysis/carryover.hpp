#ifndef TEMPO_ANALYSIS_CARRYOVER_HPP
#define TEMPO_ANALYSIS_CARRYOVER_HPP

#include "common/config.hpp"
#include "time/timestamp.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tempo {

/**
 * @brief A document selected as important within a window
 */
struct CriticalEvent {
    std::string doc_id;
    Timestamp timestamp;
    double importance = 0.0;
    std::string summary;          // Leading characters of the content
    size_t window_index = 0;      // Window that selected it

    nlohmann::json to_json() const;
    static CriticalEvent from_json(const nlohmann::json& j);   // Timestamp must carry an offset
};

/**
 * @brief Document ids linked consecutively by causal edges
 */
struct CausalChain {
    std::vector<std::string> documents;

    size_t size() const { return documents.size(); }
    bool empty() const { return documents.empty(); }
    const std::string& head() const { return documents.front(); }
    const std::string& tail() const { return documents.back(); }

    // True if `other` appears as a contiguous run inside this chain
    bool contains(const CausalChain& other) const;

    /**
     * @brief Keep only the last `max_length` ids
     */
    void truncate_front(size_t max_length);

    bool operator==(const CausalChain& o) const { return documents == o.documents; }

    nlohmann::json to_json() const;
    static CausalChain from_json(const nlohmann::json& j);
};

/**
 * @brief Flag for a causal chain whose continuation lies past a window
 */
struct OpenQuestion {
    std::string doc_id;           // Chain tail the question is about
    std::string text;

    nlohmann::json to_json() const;
    static OpenQuestion from_json(const nlohmann::json& j);
};

/**
 * @brief Fixed-capacity state handed from one window to the next
 *
 * Every field is capped by AnalyzerConfig, independent of how many
 * documents have been processed, so a run needs memory proportional to
 * one window plus this state.
 */
struct CarryoverState {
    std::vector<CriticalEvent> critical_events;    // Importance descending
    std::map<std::string, size_t> key_entities;    // Token -> mentions
    std::vector<CausalChain> causal_chains;        // Oldest first
    std::map<std::string, double> attention;       // Doc id -> [0, 1]
    std::vector<OpenQuestion> open_questions;

    size_t window_index = 0;                       // Windows folded in so far
    size_t documents_seen = 0;

    size_t size() const;
    bool empty() const { return size() == 0; }

    bool within_capacity(const AnalyzerConfig& config) const;

    /**
     * @brief Documents the next window must consider in addition to its own
     *
     * Attention keys, chain tails and open-question documents.
     */
    std::set<std::string> flagged_documents() const;

    nlohmann::json to_json() const;
    static CarryoverState from_json(const nlohmann::json& j);
};

} // namespace tempo

#endif // TEMPO_ANALYSIS_CARRYOVER_HPP
