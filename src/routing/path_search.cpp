/// @file path_search.cpp
/// @brief Graph searches with per-edge constraint evaluation.

#include "routing/path_search.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <queue>
#include <unordered_map>
#include <unordered_set>

namespace starlane::routing
{

namespace
{

void set_stats(SearchStats* out, SearchStats s)
{
    if (out)
    {
        *out = std::move(s);
    }
}

std::vector<PointId> unwind(const std::unordered_map<PointId, PointId>& came_from,
                            PointId start, PointId goal)
{
    std::vector<PointId> path{goal};
    PointId at = goal;
    while (at != start)
    {
        at = came_from.at(at);
        path.push_back(at);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

bool endpoints_known(const SearchInput& input, PointId start, PointId goal)
{
    if (!input.graph.contains(start) || !input.graph.contains(goal))
    {
        SL_CORE_DEBUG("PathSearch: start {} or goal {} is not in the graph", start, goal);
        return false;
    }
    return true;
}

/// Shared best-first search; Dijkstra passes a zero heuristic.
std::optional<std::vector<PointId>> best_first(const SearchInput& input, PointId start, PointId goal,
                                               SearchStats* out_stats,
                                               const std::function<f64(PointId)>& heuristic,
                                               const char* label)
{
    SearchStats stats;

    if (!endpoints_known(input, start, goal))
    {
        set_stats(out_stats, std::move(stats));
        return std::nullopt;
    }
    if (start == goal)
    {
        stats.reached = true;
        stats.visited = 1;
        set_stats(out_stats, std::move(stats));
        return std::vector<PointId>{start};
    }

    struct QN
    {
        f64 f = 0.0;
        f64 g = 0.0;
        u64 seq = 0;   ///< Push order; equal-cost entries pop first-in first-out
        PointId id = 0;
    };

    struct Cmp
    {
        bool operator()(const QN& a, const QN& b) const
        {
            if (a.f != b.f) return a.f > b.f;
            return a.seq > b.seq;
        }
    };

    std::priority_queue<QN, std::vector<QN>, Cmp> open;
    std::unordered_map<PointId, f64> g_score;
    std::unordered_map<PointId, PointId> came_from;
    std::unordered_set<PointId> closed;
    const TraversalState state{};
    u64 seq = 0;
    bool logged_undefined = false;

    g_score[start] = 0.0;
    open.push(QN{heuristic(start), 0.0, seq++, start});
    stats.visited = 1;

    while (!open.empty())
    {
        const QN cur = open.top();
        open.pop();

        if (!closed.insert(cur.id).second)
        {
            continue;
        }
        ++stats.expansions;

        if (cur.id == goal)
        {
            stats.reached = true;
            auto path = unwind(came_from, start, goal);
            SL_CORE_DEBUG("PathSearch[{}]: reached goal after {} expansions, cost {:.3f}",
                          label, stats.expansions, cur.g);
            set_stats(out_stats, std::move(stats));
            return path;
        }

        for (const auto& edge : input.graph.neighbours(cur.id))
        {
            if (closed.contains(edge.target))
            {
                continue;
            }
            if (!edge.distance)
            {
                if (!logged_undefined)
                {
                    SL_CORE_DEBUG("PathSearch[{}]: skipping edges without distance (first: {} -> {})",
                                  label, cur.id, edge.target);
                    logged_undefined = true;
                }
                continue;
            }

            const EdgeCandidate candidate{
                .from   = cur.id,
                .edge   = &edge,
                .target = input.points.find(edge.target),
            };
            const EdgeVerdict verdict = evaluate(input.constraints, candidate, state);
            if (!verdict.allowed)
            {
                stats.tally.record(*verdict.rejected_by);
                continue;
            }

            const f64 tentative = cur.g + *edge.distance;
            const auto it = g_score.find(edge.target);
            if (it == g_score.end() || tentative < it->second)
            {
                if (it == g_score.end())
                {
                    ++stats.visited;
                }
                g_score[edge.target] = tentative;
                came_from[edge.target] = cur.id;
                open.push(QN{tentative + heuristic(edge.target), tentative, seq++, edge.target});
            }
        }
    }

    SL_CORE_DEBUG("PathSearch[{}]: frontier exhausted after {} expansions ({} edges rejected)",
                  label, stats.expansions, stats.tally.total());
    set_stats(out_stats, std::move(stats));
    return std::nullopt;
}

} // namespace

// -----------------------------------------------------------------
// Breadth-first
// -----------------------------------------------------------------

std::optional<std::vector<PointId>> find_route_bfs(const SearchInput& input, PointId start,
                                                   PointId goal, SearchStats* out_stats)
{
    SearchStats stats;

    if (!endpoints_known(input, start, goal))
    {
        set_stats(out_stats, std::move(stats));
        return std::nullopt;
    }
    if (start == goal)
    {
        stats.reached = true;
        stats.visited = 1;
        set_stats(out_stats, std::move(stats));
        return std::vector<PointId>{start};
    }

    std::deque<PointId> frontier{start};
    std::unordered_set<PointId> visited{start};
    std::unordered_map<PointId, PointId> came_from;
    const TraversalState state{};

    while (!frontier.empty())
    {
        const PointId current = frontier.front();
        frontier.pop_front();
        ++stats.expansions;

        for (const auto& edge : input.graph.neighbours(current))
        {
            if (visited.contains(edge.target))
            {
                continue;
            }

            const EdgeCandidate candidate{
                .from   = current,
                .edge   = &edge,
                .target = input.points.find(edge.target),
            };
            const EdgeVerdict verdict = evaluate(input.constraints, candidate, state);
            if (!verdict.allowed)
            {
                stats.tally.record(*verdict.rejected_by);
                continue;
            }

            visited.insert(edge.target);
            came_from[edge.target] = current;

            if (edge.target == goal)
            {
                stats.reached = true;
                stats.visited = visited.size();
                auto path = unwind(came_from, start, goal);
                set_stats(out_stats, std::move(stats));
                return path;
            }
            frontier.push_back(edge.target);
        }
    }

    stats.visited = visited.size();
    SL_CORE_DEBUG("PathSearch[bfs]: frontier exhausted after {} expansions ({} edges rejected)",
                  stats.expansions, stats.tally.total());
    set_stats(out_stats, std::move(stats));
    return std::nullopt;
}

// -----------------------------------------------------------------
// Dijkstra
// -----------------------------------------------------------------

std::optional<std::vector<PointId>> find_route_dijkstra(const SearchInput& input, PointId start,
                                                        PointId goal, SearchStats* stats)
{
    return best_first(input, start, goal, stats, [](PointId) { return 0.0; }, "dijkstra");
}

// -----------------------------------------------------------------
// A*
// -----------------------------------------------------------------

std::optional<std::vector<PointId>> find_route_a_star(const SearchInput& input, PointId start,
                                                      PointId goal, SearchStats* stats)
{
    // Heuristic positions always come from the point-set, never the index.
    const std::optional<Vec3d> goal_position = input.points.position_of(goal);

    const auto heuristic = [&](PointId id) -> f64
    {
        if (!goal_position || id == goal)
        {
            return 0.0;
        }
        const auto p = input.points.position_of(id);
        return p ? distance_between(*p, *goal_position) : 0.0;
    };

    return best_first(input, start, goal, stats, heuristic, "a-star");
}

} // namespace starlane::routing
