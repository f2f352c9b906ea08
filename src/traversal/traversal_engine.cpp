#include "traversal/traversal_engine.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace tempo {

namespace {

void check_bounds(int time_window_days, int max_hops) {
    if (time_window_days < 0) {
        throw std::invalid_argument("Time window must not be negative");
    }
    if (max_hops < 0) {
        throw std::invalid_argument("Hop bound must not be negative");
    }
}

const std::string& neighbour_of(const Relationship& rel, Direction direction) {
    return direction == Direction::Forward ? rel.to : rel.from;
}

} // namespace

std::string direction_to_string(Direction direction) {
    return direction == Direction::Forward ? "forward" : "backward";
}

nlohmann::json ReachabilityResult::to_json() const {
    nlohmann::json j;
    j["source"] = source;
    j["direction"] = direction_to_string(direction);
    j["documents"] = documents;
    j["count"] = documents.size();
    j["hops_explored"] = hops_explored;
    j["status"] = result_status_to_string(status);
    return j;
}

nlohmann::json PathResult::to_json() const {
    nlohmann::json j;
    j["from"] = from;
    j["to"] = to;
    j["path"] = path;
    j["length"] = length();
    j["status"] = result_status_to_string(status);
    return j;
}

TraversalEngine::TraversalEngine(const TemporalGraph& graph, const TraversalConfig& config)
    : graph_(graph), config_(config) {}

// ==========================================
// Reachability
// ==========================================

ReachabilityResult TraversalEngine::reachable_in_range(const TemporalGraph::ReadView& view,
                                                       const std::string& id,
                                                       Direction direction,
                                                       const Timestamp& lo,
                                                       const Timestamp& hi,
                                                       int max_hops,
                                                       const CancellationToken* cancel,
                                                       const NodeFilter& allowed) const {
    check_bounds(0, max_hops);
    view.document(id);  // throws NotFoundError

    graph_.record_traversal();

    ReachabilityResult result;
    result.source = id;
    result.direction = direction;

    std::unordered_set<std::string> visited = {id};
    std::vector<std::string> frontier = {id};
    std::vector<const Document*> found;

    int hops = 0;
    while (!frontier.empty() && hops < max_hops) {
        if (CancellationToken::requested(cancel)) {
            result.status = ResultStatus::Cancelled;
            break;
        }

        std::vector<std::string> next;
        for (const auto& current : frontier) {
            const auto& edges = direction == Direction::Forward ? view.outgoing(current)
                                                                : view.incoming(current);
            for (size_t index : edges) {
                const std::string& neighbour = neighbour_of(view.relationship(index), direction);
                if (visited.count(neighbour)) {
                    continue;
                }
                visited.insert(neighbour);
                if (allowed && !allowed(neighbour)) {
                    continue;
                }

                const Document& doc = view.document(neighbour);
                bool beyond = direction == Direction::Forward ? doc.timestamp > hi
                                                              : doc.timestamp < lo;
                if (beyond) {
                    continue;
                }
                if (doc.timestamp >= lo && doc.timestamp <= hi) {
                    found.push_back(&doc);
                }
                next.push_back(neighbour);
            }
        }

        ++hops;
        frontier = std::move(next);
    }
    result.hops_explored = hops;

    if (direction == Direction::Forward) {
        std::sort(found.begin(), found.end(), [](const Document* a, const Document* b) {
            if (a->timestamp != b->timestamp) return a->timestamp < b->timestamp;
            return a->id < b->id;
        });
    } else {
        std::sort(found.begin(), found.end(), [](const Document* a, const Document* b) {
            if (a->timestamp != b->timestamp) return a->timestamp > b->timestamp;
            return a->id < b->id;
        });
    }

    result.documents.reserve(found.size());
    for (const Document* doc : found) {
        result.documents.push_back(doc->id);
    }
    return result;
}

ReachabilityResult TraversalEngine::reachable_in_range(const std::string& id,
                                                       Direction direction,
                                                       const Timestamp& lo,
                                                       const Timestamp& hi,
                                                       int max_hops,
                                                       const CancellationToken* cancel) const {
    auto view = graph_.read();
    return reachable_in_range(view, id, direction, lo, hi, max_hops, cancel);
}

ReachabilityResult TraversalEngine::reachable(const TemporalGraph::ReadView& view,
                                              const std::string& id,
                                              Direction direction,
                                              int time_window_days,
                                              int max_hops,
                                              size_t max_results,
                                              const CancellationToken* cancel) const {
    check_bounds(time_window_days, max_hops);

    const Timestamp source_ts = view.document(id).timestamp;
    const Timestamp lo = direction == Direction::Forward
                             ? source_ts
                             : source_ts.plus_days(-static_cast<int64_t>(time_window_days));
    const Timestamp hi = direction == Direction::Forward
                             ? source_ts.plus_days(time_window_days)
                             : source_ts;

    ReachabilityResult result = reachable_in_range(view, id, direction, lo, hi, max_hops, cancel);
    if (result.documents.size() > max_results) {
        result.documents.resize(max_results);
    }
    return result;
}

ReachabilityResult TraversalEngine::forward_reachable(const std::string& id,
                                                      int time_window_days,
                                                      int max_hops,
                                                      size_t max_results,
                                                      const CancellationToken* cancel) const {
    auto view = graph_.read();
    return reachable(view, id, Direction::Forward, time_window_days, max_hops, max_results, cancel);
}

ReachabilityResult TraversalEngine::forward_reachable(const std::string& id,
                                                      const CancellationToken* cancel) const {
    return forward_reachable(id, config_.time_window_days, config_.max_hops,
                             config_.max_results, cancel);
}

ReachabilityResult TraversalEngine::backward_reachable(const std::string& id,
                                                       int time_window_days,
                                                       int max_hops,
                                                       size_t max_results,
                                                       const CancellationToken* cancel) const {
    auto view = graph_.read();
    return reachable(view, id, Direction::Backward, time_window_days, max_hops, max_results, cancel);
}

ReachabilityResult TraversalEngine::backward_reachable(const std::string& id,
                                                       const CancellationToken* cancel) const {
    return backward_reachable(id, config_.time_window_days, config_.max_hops,
                              config_.max_results, cancel);
}

// ==========================================
// Paths
// ==========================================

PathResult TraversalEngine::find_path(const std::string& from,
                                      const std::string& to,
                                      int max_hops,
                                      const CancellationToken* cancel) const {
    check_bounds(0, max_hops);

    auto view = graph_.read();
    view.document(from);
    view.document(to);

    graph_.record_traversal();

    PathResult result;
    result.from = from;
    result.to = to;

    if (from == to) {
        result.path = {from};
        result.status = ResultStatus::Complete;
        return result;
    }

    // First discovery wins; neighbours are expanded earliest-first so the
    // winning parent is the one whose hop comes earliest in time.
    std::unordered_map<std::string, std::string> parent;
    std::unordered_set<std::string> visited = {from};
    std::vector<std::string> frontier = {from};
    bool reached = false;

    for (int hops = 0; hops < max_hops && !frontier.empty() && !reached; ++hops) {
        if (CancellationToken::requested(cancel)) {
            result.status = ResultStatus::Cancelled;
            return result;
        }

        std::vector<std::string> next;
        for (const auto& current : frontier) {
            std::vector<const Document*> neighbours;
            for (size_t index : view.outgoing(current)) {
                const std::string& target = view.relationship(index).to;
                if (!visited.count(target)) {
                    neighbours.push_back(&view.document(target));
                }
            }
            std::sort(neighbours.begin(), neighbours.end(), [](const Document* a, const Document* b) {
                if (a->timestamp != b->timestamp) return a->timestamp < b->timestamp;
                return a->id < b->id;
            });

            for (const Document* doc : neighbours) {
                if (visited.count(doc->id)) {
                    continue;  // parallel edges to the same target
                }
                visited.insert(doc->id);
                parent[doc->id] = current;
                next.push_back(doc->id);
                if (doc->id == to) {
                    reached = true;
                    break;
                }
            }
            if (reached) break;
        }
        frontier = std::move(next);
    }

    if (!reached) {
        result.status = ResultStatus::NoPath;
        return result;
    }

    for (std::string node = to; ; node = parent[node]) {
        result.path.push_back(node);
        if (node == from) break;
    }
    std::reverse(result.path.begin(), result.path.end());
    result.status = ResultStatus::Complete;
    return result;
}

PathResult TraversalEngine::find_path(const std::string& from, const std::string& to) const {
    return find_path(from, to, config_.path_max_hops);
}

bool TraversalEngine::has_path(const std::string& from, const std::string& to, int max_hops) const {
    return find_path(from, to, max_hops).found();
}

} // namespace tempo
