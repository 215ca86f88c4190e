#include "terrainpath/pathfinding/RegionFill.hpp"

#include <spdlog/spdlog.h>

#include <deque>
#include <vector>

namespace terrainpath::pf {

namespace {

constexpr int kDirs = 4;
constexpr int kDRow[kDirs] = { 0, 0, 1, -1 };
constexpr int kDCol[kDirs] = { 1, -1, 0, 0 };

// Shared by the seed and every neighbour about to be queued.
bool Fillable(const Grid& g, CellIndex id, TerrainKind source, TerrainKind target)
{
    if (g.role_at(id) != Role::None) return false;
    const TerrainKind t = g.at(id).terrain();
    if (t != source || t == target) return false;
    // Obstacle regions may only be filled towards Obstacle.
    if (t == TerrainKind::Obstacle && target != TerrainKind::Obstacle) return false;
    return true;
}

} // namespace

RegionFillResult fill_region(Grid& grid, Coord seed, TerrainKind target)
{
    const CellIndex sid = grid.index_of(seed);
    const TerrainKind source = grid.at(sid).terrain();

    RegionFillResult result;
    if (!Fillable(grid, sid, source, target))
        return result;

    std::vector<u8> queued(grid.cell_count(), 0);
    std::deque<CellIndex> q;
    q.push_back(sid);
    queued[sid] = 1;

    while (!q.empty())
    {
        const CellIndex id = q.front(); q.pop_front();
        if (!Fillable(grid, id, source, target))
            continue;

        const Coord c = grid.coord_of(id);
        grid.set_terrain(c, target);
        ++result.repainted;

        for (int d = 0; d < kDirs; ++d)
        {
            const Coord n{ c.row + kDRow[d], c.col + kDCol[d] };
            if (!grid.contains(n))
                continue;
            const CellIndex nid = to_index(n, grid.size());
            if (queued[nid] || !Fillable(grid, nid, source, target))
                continue;
            queued[nid] = 1;
            q.push_back(nid);
        }
    }

    spdlog::debug("fill_region: ({}, {}) {} -> {}, {} cells repainted",
                  seed.row, seed.col, terrain_info(source).key, terrain_info(target).key, result.repainted);
    return result;
}

} // namespace terrainpath::pf
