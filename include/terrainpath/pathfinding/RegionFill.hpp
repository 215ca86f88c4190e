#pragma once
#include "Grid.hpp"

namespace terrainpath::pf {

struct RegionFillResult {
    size_t repainted = 0;
    [[nodiscard]] bool changed() const noexcept { return repainted > 0; }
};

// Breadth-first repaint of the 4-connected region sharing the seed's terrain.
//
// Silently does nothing when the seed holds Start/End, already has the target
// terrain, or is an Obstacle being filled with something passable. Start and
// End are never repainted, even inside the region.
// Throws OutOfBounds for a seed outside the grid.
RegionFillResult fill_region(Grid& grid, Coord seed, TerrainKind target);

} // namespace terrainpath::pf
