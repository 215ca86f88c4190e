#include "terrainpath/pathfinding/SearchEngine.hpp"
#include "terrainpath/pathfinding/Heuristic.hpp"
#include "terrainpath/pathfinding/PathReconstructor.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <queue>
#include <stdexcept>
#include <string>
#include <vector>

namespace terrainpath::pf {

namespace {

struct QN {
    float     f;
    u32       seq; // insertion order; earlier wins ties
    CellIndex id;
    bool operator<(const QN& o) const { return f != o.f ? f > o.f : seq > o.seq; }
};

std::string CostMessage(float cost)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "Path Found! Cost: %.1f", static_cast<double>(cost));
    return buf;
}

} // namespace

const char* to_string(SearchOutcome o) noexcept
{
    switch (o)
    {
    case SearchOutcome::Succeeded: return "succeeded";
    case SearchOutcome::Failed:    return "failed";
    case SearchOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

SearchResult SearchEngine::run()
{
    const auto sid_opt = _grid.start_index();
    const auto gid_opt = _grid.end_index();
    if (!sid_opt || !gid_opt)
        throw std::logic_error("SearchEngine::run requires both Start and End");

    const CellIndex sid = *sid_opt;
    const CellIndex gid = *gid_opt;
    const Coord goal = _grid.coord_of(gid);

    _state = SearchState::Running;
    if (_grid.adjacency_stale())
    {
        spdlog::debug("SearchEngine: adjacency stale, rebuilding before run");
        _grid.rebuild_adjacency();
    }
    _grid.reset_search_state();

    std::priority_queue<QN> open;
    u32 seq = 0;

    Cell& start = _grid.at(sid);
    start.set_costs(0.0f, manhattan(start.coord(), goal));
    start.set_mark(SearchMark::Open);
    open.push({ start.f_cost(), seq++, sid });

    _observer.status("Algorithm Running...");
    spdlog::debug("SearchEngine: run ({}, {}) -> ({}, {}) on {}x{} grid",
                  start.row(), start.col(), goal.row, goal.col, _grid.size(), _grid.size());

    SearchResult result;

    while (!open.empty())
    {
        if (_observer.cancelled())
        {
            _state = SearchState::Cancelled;
            result.outcome = SearchOutcome::Cancelled;
            spdlog::debug("SearchEngine: cancelled after {} expansions", result.expanded);
            return result;
        }

        const QN top = open.top(); open.pop();
        Cell& cur = _grid.at(top.id);
        if (cur.in_closed()) continue; // stale duplicate

        if (top.id == gid)
        {
            cur.set_mark(SearchMark::None);
            _state = SearchState::Succeeded;
            result.outcome = SearchOutcome::Succeeded;
            result.total_cost = cur.g_cost();
            _observer.status(CostMessage(result.total_cost));

            PathReconstructor rec(_grid, &_observer);
            result.path = rec.reconstruct(gid);
            spdlog::debug("SearchEngine: path of {} cells, cost {}, {} expansions",
                          result.path.length(), result.total_cost, result.expanded);
            return result;
        }

        for (const CellIndex nid : cur.neighbors())
        {
            Cell& n = _grid.at(nid);
            if (n.in_closed()) continue;

            const float g_new = cur.g_cost() + n.movement_cost();
            if (g_new < n.g_cost())
            {
                n.set_parent(top.id);
                n.set_costs(g_new, manhattan(n.coord(), goal));
                n.set_mark(SearchMark::Open);
                open.push({ n.f_cost(), seq++, nid });
            }
        }

        cur.set_mark(SearchMark::Closed);
        ++result.expanded;
        _observer.progress({ SearchPhase::Search, cur.coord(), result.expanded });
    }

    _state = SearchState::Failed;
    result.outcome = SearchOutcome::Failed;
    _observer.status("Path Not Found.");
    spdlog::debug("SearchEngine: no path after {} expansions", result.expanded);
    return result;
}

} // namespace terrainpath::pf
