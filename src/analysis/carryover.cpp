#include "analysis/carryover.hpp"
#include <algorithm>

namespace tempo {

// ==========================================
// CriticalEvent
// ==========================================

nlohmann::json CriticalEvent::to_json() const {
    nlohmann::json j;
    j["doc_id"] = doc_id;
    j["timestamp"] = timestamp.to_iso8601();
    j["importance"] = importance;
    j["summary"] = summary;
    j["window_index"] = window_index;
    return j;
}

CriticalEvent CriticalEvent::from_json(const nlohmann::json& j) {
    CriticalEvent event;
    event.doc_id = j.at("doc_id").get<std::string>();
    event.timestamp = Timestamp::parse_zoned(j.at("timestamp").get<std::string>());
    event.importance = j.value("importance", 0.0);
    event.summary = j.value("summary", "");
    event.window_index = j.value("window_index", static_cast<size_t>(0));
    return event;
}

// ==========================================
// CausalChain
// ==========================================

bool CausalChain::contains(const CausalChain& other) const {
    if (other.documents.empty() || other.documents.size() > documents.size()) {
        return false;
    }
    return std::search(documents.begin(), documents.end(),
                       other.documents.begin(), other.documents.end()) != documents.end();
}

void CausalChain::truncate_front(size_t max_length) {
    if (documents.size() > max_length) {
        documents.erase(documents.begin(), documents.end() - static_cast<std::ptrdiff_t>(max_length));
    }
}

nlohmann::json CausalChain::to_json() const {
    return nlohmann::json(documents);
}

CausalChain CausalChain::from_json(const nlohmann::json& j) {
    CausalChain chain;
    chain.documents = j.get<std::vector<std::string>>();
    return chain;
}

// ==========================================
// OpenQuestion
// ==========================================

nlohmann::json OpenQuestion::to_json() const {
    nlohmann::json j;
    j["doc_id"] = doc_id;
    j["text"] = text;
    return j;
}

OpenQuestion OpenQuestion::from_json(const nlohmann::json& j) {
    OpenQuestion question;
    question.doc_id = j.at("doc_id").get<std::string>();
    question.text = j.value("text", "");
    return question;
}

// ==========================================
// CarryoverState
// ==========================================

size_t CarryoverState::size() const {
    return critical_events.size() +
           key_entities.size() +
           causal_chains.size() +
           attention.size() +
           open_questions.size();
}

bool CarryoverState::within_capacity(const AnalyzerConfig& config) const {
    if (critical_events.size() > config.max_carryover_events) return false;
    if (key_entities.size() > config.max_carryover_entities) return false;
    if (causal_chains.size() > config.max_carryover_chains) return false;
    if (attention.size() > config.max_carryover_attention) return false;
    if (open_questions.size() > config.max_open_questions) return false;

    for (const auto& chain : causal_chains) {
        if (chain.size() > config.max_chain_length) return false;
    }
    return true;
}

std::set<std::string> CarryoverState::flagged_documents() const {
    std::set<std::string> flagged;
    for (const auto& [id, score] : attention) {
        flagged.insert(id);
    }
    for (const auto& chain : causal_chains) {
        if (!chain.empty()) {
            flagged.insert(chain.tail());
        }
    }
    for (const auto& question : open_questions) {
        flagged.insert(question.doc_id);
    }
    return flagged;
}

nlohmann::json CarryoverState::to_json() const {
    nlohmann::json j;

    j["critical_events"] = nlohmann::json::array();
    for (const auto& event : critical_events) {
        j["critical_events"].push_back(event.to_json());
    }

    j["key_entities"] = key_entities;

    j["causal_chains"] = nlohmann::json::array();
    for (const auto& chain : causal_chains) {
        j["causal_chains"].push_back(chain.to_json());
    }

    j["attention"] = attention;

    j["open_questions"] = nlohmann::json::array();
    for (const auto& question : open_questions) {
        j["open_questions"].push_back(question.to_json());
    }

    j["window_index"] = window_index;
    j["documents_seen"] = documents_seen;
    j["size"] = size();
    return j;
}

CarryoverState CarryoverState::from_json(const nlohmann::json& j) {
    CarryoverState state;

    if (j.contains("critical_events")) {
        for (const auto& e : j["critical_events"]) {
            state.critical_events.push_back(CriticalEvent::from_json(e));
        }
    }
    if (j.contains("key_entities")) {
        state.key_entities = j["key_entities"].get<std::map<std::string, size_t>>();
    }
    if (j.contains("causal_chains")) {
        for (const auto& c : j["causal_chains"]) {
            state.causal_chains.push_back(CausalChain::from_json(c));
        }
    }
    if (j.contains("attention")) {
        state.attention = j["attention"].get<std::map<std::string, double>>();
    }
    if (j.contains("open_questions")) {
        for (const auto& q : j["open_questions"]) {
            state.open_questions.push_back(OpenQuestion::from_json(q));
        }
    }

    state.window_index = j.value("window_index", static_cast<size_t>(0));
    state.documents_seen = j.value("documents_seen", static_cast<size_t>(0));
    return state;
}

} // namespace tempo
