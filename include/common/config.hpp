#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace tempo {

// ============================================================================
// Component Configuration
// ============================================================================

/**
 * @brief Graph store settings
 */
struct GraphConfig {
    int layer_days = 7;                     ///< Width of one layer-index bucket
    int naive_offset_minutes = 0;           ///< Offset assumed for zone-naive timestamps
    bool verbose = false;                   ///< Log backward-in-time edges to stderr
};

/**
 * @brief Default bounds for reachability queries
 */
struct TraversalConfig {
    int time_window_days = 365;             ///< Only visit documents this close to the source
    int max_hops = 5;                       ///< BFS depth bound
    size_t max_results = 50;                ///< Truncation after timestamp ordering
    int path_max_hops = 10;                 ///< Depth bound for find_path / has_path
};

/**
 * @brief Term weighting and attention settings
 */
struct SimilarityConfig {
    size_t min_token_length = 3;            ///< Shorter tokens are dropped
    bool remove_stopwords = true;           ///< Filter the English stopword list
    int attention_window_days = 365;        ///< Reachability window for attention
    int attention_max_hops = 5;             ///< Reachability depth for attention
    size_t max_cached_pairs = 100000;       ///< Pair cache is cleared when it grows past this
};

/**
 * @brief Chunked (windowed) analyzer settings
 *
 * The importance weights are a tunable heuristic, not a calibrated model.
 */
struct AnalyzerConfig {
    int chunk_size_days = 90;               ///< Window width
    int max_days = 1825;                    ///< Horizon when no end document is given

    // Carryover capacities
    size_t max_carryover_events = 10;
    size_t max_carryover_entities = 15;
    size_t max_carryover_chains = 20;
    size_t max_carryover_attention = 10;
    size_t max_open_questions = 10;
    size_t max_chain_length = 32;           ///< Chains keep their most recent ids

    // Importance = connectivity * w_c + carried attention * w_a + recency * w_r
    double weight_connectivity = 0.4;
    double weight_attention = 0.3;
    double weight_recency = 0.3;

    // Entity heuristic
    size_t min_entity_length = 5;
    size_t min_entity_mentions = 2;

    int carry_max_hops = 5;                 ///< Reach from carried documents into a window
    size_t max_chain_enumeration = 200;     ///< Bound on chain paths explored per window
    size_t event_summary_chars = 100;

    bool verbose = false;                   ///< Per-window progress on stdout
};

// ============================================================================
// Engine Configuration
// ============================================================================

/**
 * @brief Aggregated configuration for the whole engine
 */
struct EngineConfig {
    GraphConfig graph;
    TraversalConfig traversal;
    SimilarityConfig similarity;
    AnalyzerConfig analyzer;

    /**
     * @brief Load configuration from JSON (missing keys keep defaults)
     */
    static EngineConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load configuration from JSON file
     * @throws std::runtime_error if the file cannot be opened
     */
    static EngineConfig from_json_file(const std::string& path);

    nlohmann::json to_json() const;

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overridden by TEMPO_* environment variables
     */
    static EngineConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

/**
 * @brief Load configuration from file with fallback to environment
 */
EngineConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace tempo
