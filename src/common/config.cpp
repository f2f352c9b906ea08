#include "common/config.hpp"
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>

namespace tempo {

using json = nlohmann::json;

namespace {

bool file_exists(const std::string& path) {
    struct stat buffer;
    return stat(path.c_str(), &buffer) == 0;
}

// Integer environment override; malformed or out-of-range values are a configuration error
void env_int(const char* name, int& target) {
    const char* value = std::getenv(name);
    if (!value) return;

    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(value, &end, 10);
    if (end == value || *end != '\0') {
        throw std::invalid_argument(std::string("Invalid integer in ") + name + ": " + value);
    }
    if (errno == ERANGE || parsed < INT_MIN || parsed > INT_MAX) {
        throw std::invalid_argument(std::string("Integer out of range in ") + name + ": " + value);
    }
    target = static_cast<int>(parsed);
}

void env_size(const char* name, size_t& target) {
    const char* value = std::getenv(name);
    if (!value) return;

    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(value, &end, 10);
    if (end == value || *end != '\0') {
        throw std::invalid_argument(std::string("Invalid integer in ") + name + ": " + value);
    }
    if (parsed < 0) {
        throw std::invalid_argument(std::string(name) + " must not be negative");
    }
    if (errno == ERANGE || static_cast<unsigned long long>(parsed) > SIZE_MAX) {
        throw std::invalid_argument(std::string("Integer out of range in ") + name + ": " + value);
    }
    target = static_cast<size_t>(parsed);
}

void env_bool(const char* name, bool& target) {
    const char* value = std::getenv(name);
    if (!value) return;
    std::string v = value;
    target = (v == "1" || v == "true" || v == "TRUE" || v == "yes");
}

} // namespace

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig config;

    // Graph config
    if (j.contains("graph")) {
        const auto& g = j["graph"];
        if (g.contains("layer_days")) config.graph.layer_days = g["layer_days"];
        if (g.contains("naive_offset_minutes")) config.graph.naive_offset_minutes = g["naive_offset_minutes"];
        if (g.contains("verbose")) config.graph.verbose = g["verbose"];
    }

    // Traversal config
    if (j.contains("traversal")) {
        const auto& t = j["traversal"];
        if (t.contains("time_window_days")) config.traversal.time_window_days = t["time_window_days"];
        if (t.contains("max_hops")) config.traversal.max_hops = t["max_hops"];
        if (t.contains("max_results")) config.traversal.max_results = t["max_results"];
        if (t.contains("path_max_hops")) config.traversal.path_max_hops = t["path_max_hops"];
    }

    // Similarity config
    if (j.contains("similarity")) {
        const auto& s = j["similarity"];
        if (s.contains("min_token_length")) config.similarity.min_token_length = s["min_token_length"];
        if (s.contains("remove_stopwords")) config.similarity.remove_stopwords = s["remove_stopwords"];
        if (s.contains("attention_window_days")) config.similarity.attention_window_days = s["attention_window_days"];
        if (s.contains("attention_max_hops")) config.similarity.attention_max_hops = s["attention_max_hops"];
        if (s.contains("max_cached_pairs")) config.similarity.max_cached_pairs = s["max_cached_pairs"];
    }

    // Analyzer config
    if (j.contains("analyzer")) {
        const auto& a = j["analyzer"];
        auto& c = config.analyzer;
        if (a.contains("chunk_size_days")) c.chunk_size_days = a["chunk_size_days"];
        if (a.contains("max_days")) c.max_days = a["max_days"];
        if (a.contains("max_carryover_events")) c.max_carryover_events = a["max_carryover_events"];
        if (a.contains("max_carryover_entities")) c.max_carryover_entities = a["max_carryover_entities"];
        if (a.contains("max_carryover_chains")) c.max_carryover_chains = a["max_carryover_chains"];
        if (a.contains("max_carryover_attention")) c.max_carryover_attention = a["max_carryover_attention"];
        if (a.contains("max_open_questions")) c.max_open_questions = a["max_open_questions"];
        if (a.contains("max_chain_length")) c.max_chain_length = a["max_chain_length"];
        if (a.contains("weight_connectivity")) c.weight_connectivity = a["weight_connectivity"];
        if (a.contains("weight_attention")) c.weight_attention = a["weight_attention"];
        if (a.contains("weight_recency")) c.weight_recency = a["weight_recency"];
        if (a.contains("min_entity_length")) c.min_entity_length = a["min_entity_length"];
        if (a.contains("min_entity_mentions")) c.min_entity_mentions = a["min_entity_mentions"];
        if (a.contains("carry_max_hops")) c.carry_max_hops = a["carry_max_hops"];
        if (a.contains("max_chain_enumeration")) c.max_chain_enumeration = a["max_chain_enumeration"];
        if (a.contains("event_summary_chars")) c.event_summary_chars = a["event_summary_chars"];
        if (a.contains("verbose")) c.verbose = a["verbose"];
    }

    return config;
}

EngineConfig EngineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json j;
    file >> j;
    return from_json(j);
}

json EngineConfig::to_json() const {
    json j;

    j["graph"] = {
        {"layer_days", graph.layer_days},
        {"naive_offset_minutes", graph.naive_offset_minutes},
        {"verbose", graph.verbose}
    };

    j["traversal"] = {
        {"time_window_days", traversal.time_window_days},
        {"max_hops", traversal.max_hops},
        {"max_results", traversal.max_results},
        {"path_max_hops", traversal.path_max_hops}
    };

    j["similarity"] = {
        {"min_token_length", similarity.min_token_length},
        {"remove_stopwords", similarity.remove_stopwords},
        {"attention_window_days", similarity.attention_window_days},
        {"attention_max_hops", similarity.attention_max_hops},
        {"max_cached_pairs", similarity.max_cached_pairs}
    };

    j["analyzer"] = {
        {"chunk_size_days", analyzer.chunk_size_days},
        {"max_days", analyzer.max_days},
        {"max_carryover_events", analyzer.max_carryover_events},
        {"max_carryover_entities", analyzer.max_carryover_entities},
        {"max_carryover_chains", analyzer.max_carryover_chains},
        {"max_carryover_attention", analyzer.max_carryover_attention},
        {"max_open_questions", analyzer.max_open_questions},
        {"max_chain_length", analyzer.max_chain_length},
        {"weight_connectivity", analyzer.weight_connectivity},
        {"weight_attention", analyzer.weight_attention},
        {"weight_recency", analyzer.weight_recency},
        {"min_entity_length", analyzer.min_entity_length},
        {"min_entity_mentions", analyzer.min_entity_mentions},
        {"carry_max_hops", analyzer.carry_max_hops},
        {"max_chain_enumeration", analyzer.max_chain_enumeration},
        {"event_summary_chars", analyzer.event_summary_chars},
        {"verbose", analyzer.verbose}
    };

    return j;
}

void EngineConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;

    env_int("TEMPO_LAYER_DAYS", config.graph.layer_days);
    env_int("TEMPO_NAIVE_OFFSET_MINUTES", config.graph.naive_offset_minutes);

    env_int("TEMPO_TIME_WINDOW_DAYS", config.traversal.time_window_days);
    env_int("TEMPO_MAX_HOPS", config.traversal.max_hops);
    env_size("TEMPO_MAX_RESULTS", config.traversal.max_results);

    env_int("TEMPO_CHUNK_SIZE_DAYS", config.analyzer.chunk_size_days);
    env_int("TEMPO_MAX_DAYS", config.analyzer.max_days);

    bool verbose = false;
    env_bool("TEMPO_VERBOSE", verbose);
    config.graph.verbose = verbose;
    config.analyzer.verbose = verbose;

    return config;
}

bool EngineConfig::validate(std::string& error_message) const {
    if (graph.layer_days <= 0) {
        error_message = "Layer width must be positive";
        return false;
    }

    if (graph.naive_offset_minutes < -24 * 60 || graph.naive_offset_minutes > 24 * 60) {
        error_message = "Naive offset must lie within +/-24 hours";
        return false;
    }

    if (traversal.time_window_days < 0 || traversal.max_hops < 0 || traversal.path_max_hops < 0) {
        error_message = "Traversal bounds must not be negative";
        return false;
    }

    if (similarity.attention_window_days < 0 || similarity.attention_max_hops < 0) {
        error_message = "Attention bounds must not be negative";
        return false;
    }

    if (analyzer.chunk_size_days <= 0) {
        error_message = "Chunk size must be positive";
        return false;
    }

    if (analyzer.max_days < 0) {
        error_message = "Analysis horizon must not be negative";
        return false;
    }

    if (analyzer.max_carryover_events == 0 || analyzer.max_carryover_entities == 0 ||
        analyzer.max_carryover_chains == 0 || analyzer.max_carryover_attention == 0) {
        error_message = "Carryover capacities must be positive";
        return false;
    }

    if (analyzer.max_chain_length < 2) {
        error_message = "Chains must be allowed at least two documents";
        return false;
    }

    if (analyzer.weight_connectivity < 0.0 || analyzer.weight_attention < 0.0 ||
        analyzer.weight_recency < 0.0) {
        error_message = "Importance weights must not be negative";
        return false;
    }

    return true;
}

EngineConfig load_config_with_fallback(const std::string& config_path) {
    if (!config_path.empty() && file_exists(config_path)) {
        return EngineConfig::from_json_file(config_path);
    }

    if (file_exists(".tempo_config.json")) {
        return EngineConfig::from_json_file(".tempo_config.json");
    }

    return EngineConfig::from_environment();
}

} // namespace tempo
