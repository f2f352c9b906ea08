#ifndef TEMPO_TRAVERSAL_TRAVERSAL_ENGINE_HPP
#define TEMPO_TRAVERSAL_TRAVERSAL_ENGINE_HPP

#include "common/cancellation.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "graph/temporal_graph.hpp"
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tempo {

/**
 * @brief Which way edges are followed
 */
enum class Direction {
    Forward,    // from -> to
    Backward    // to -> from
};

std::string direction_to_string(Direction direction);

/**
 * @brief Result of a bounded reachability query
 *
 * Forward results are ordered by timestamp ascending, backward results
 * nearest-first (timestamp descending). Ties are ordered by id.
 */
struct ReachabilityResult {
    std::string source;
    Direction direction = Direction::Forward;
    std::vector<std::string> documents;      // Reachable ids, source excluded
    int hops_explored = 0;                   // BFS levels completed
    ResultStatus status = ResultStatus::Complete;

    bool cancelled() const { return status == ResultStatus::Cancelled; }

    nlohmann::json to_json() const;
};

// Restricts which documents a traversal may pass through
using NodeFilter = std::function<bool(const std::string& id)>;

/**
 * @brief Result of a shortest-path query
 */
struct PathResult {
    std::string from;
    std::string to;
    std::vector<std::string> path;           // from ... to, empty unless found
    ResultStatus status = ResultStatus::NoPath;

    bool found() const { return status == ResultStatus::Complete; }
    size_t length() const { return path.empty() ? 0 : path.size() - 1; }

    nlohmann::json to_json() const;
};

/**
 * @brief Breadth-first navigation over the temporal graph
 *
 * Every query keeps an explicit visited set, so cycles terminate and each
 * reachable document is reported once. Multi-hop connections are always
 * followed up to the hop bound; a query never stops at direct neighbours.
 * Cancellation is checked between BFS levels.
 */
class TraversalEngine {
public:
    explicit TraversalEngine(const TemporalGraph& graph, const TraversalConfig& config = {});

    /**
     * @brief Documents reachable by following edges forward from `id`
     *
     * Only documents with timestamp in [source, source + time_window_days]
     * are reported. Expansion stops at documents past the far bound; an
     * earlier-dated neighbour (a backward-in-time edge) is still expanded.
     *
     * @throws NotFoundError if `id` is unknown
     * @throws std::invalid_argument for negative bounds
     */
    ReachabilityResult forward_reachable(const std::string& id,
                                         int time_window_days,
                                         int max_hops,
                                         size_t max_results,
                                         const CancellationToken* cancel = nullptr) const;

    // Uses the configured defaults
    ReachabilityResult forward_reachable(const std::string& id,
                                         const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Documents reachable by following edges in reverse from `id`
     *
     * Window is [source - time_window_days, source]; results nearest-first.
     */
    ReachabilityResult backward_reachable(const std::string& id,
                                          int time_window_days,
                                          int max_hops,
                                          size_t max_results,
                                          const CancellationToken* cancel = nullptr) const;

    ReachabilityResult backward_reachable(const std::string& id,
                                          const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Same query against a view the caller already holds
     */
    ReachabilityResult reachable(const TemporalGraph::ReadView& view,
                                 const std::string& id,
                                 Direction direction,
                                 int time_window_days,
                                 int max_hops,
                                 size_t max_results,
                                 const CancellationToken* cancel = nullptr) const;

    /**
     * @brief General form: report only documents with timestamp in [lo, hi]
     *
     * Expansion is pruned at the far bound only (past `hi` forward, before
     * `lo` backward). When `allowed` is set, documents it rejects are neither
     * reported nor expanded. Not truncated. Used by the analyzer to follow
     * carried documents into the current window.
     */
    ReachabilityResult reachable_in_range(const TemporalGraph::ReadView& view,
                                          const std::string& id,
                                          Direction direction,
                                          const Timestamp& lo,
                                          const Timestamp& hi,
                                          int max_hops,
                                          const CancellationToken* cancel = nullptr,
                                          const NodeFilter& allowed = nullptr) const;

    ReachabilityResult reachable_in_range(const std::string& id,
                                          Direction direction,
                                          const Timestamp& lo,
                                          const Timestamp& hi,
                                          int max_hops,
                                          const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Shortest hop-count path following edges forward
     *
     * Among equally short paths the one whose next hop has the earliest
     * timestamp wins (then the smaller id). No time window applies.
     *
     * @return PathResult with status NoPath if no route exists within max_hops
     * @throws NotFoundError if either endpoint is unknown
     */
    PathResult find_path(const std::string& from,
                         const std::string& to,
                         int max_hops,
                         const CancellationToken* cancel = nullptr) const;

    PathResult find_path(const std::string& from, const std::string& to) const;

    bool has_path(const std::string& from, const std::string& to, int max_hops) const;

    const TraversalConfig& config() const { return config_; }

private:
    const TemporalGraph& graph_;
    TraversalConfig config_;
};

} // namespace tempo

#endif // TEMPO_TRAVERSAL_TRAVERSAL_ENGINE_HPP
