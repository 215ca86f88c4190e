#include "terrainpath/pathfinding/PathReconstructor.hpp"

#include <algorithm>
#include <stdexcept>

namespace terrainpath::pf {

Path PathReconstructor::reconstruct(CellIndex end)
{
    const auto sid = _grid.start_index();
    if (!sid)
        throw std::logic_error("PathReconstructor: grid has no Start");

    Path out;
    out.total_cost = _grid.at(end).g_cost();

    // A parent chain longer than the grid means the links form a cycle.
    const size_t max_steps = _grid.cell_count();
    size_t step = 0;

    CellIndex cur = end;
    while (true)
    {
        Cell& cell = _grid.at(cur);
        out.points.push_back(cell.coord());
        if (cur == *sid)
            break;

        if (cur != end)
            cell.set_mark(SearchMark::Path);

        ++step;
        if (_observer)
            _observer->progress({ SearchPhase::Reconstruct, cell.coord(), step });

        cur = cell.parent();
        if (cur == kNoCell || step > max_steps)
            throw std::logic_error("PathReconstructor: parent chain does not reach Start");
    }

    std::reverse(out.points.begin(), out.points.end());
    return out;
}

} // namespace terrainpath::pf
