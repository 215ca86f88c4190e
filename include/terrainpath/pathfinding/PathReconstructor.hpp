#pragma once
#include "Grid.hpp"
#include "Path.hpp"
#include "SearchObserver.hpp"

namespace terrainpath::pf {

// Walks parent links from End back to Start, marking every cell in between
// as on-path and reporting one progress step per cell visited. The returned
// path is reversed into Start -> End order.
class PathReconstructor {
public:
    explicit PathReconstructor(Grid& grid, const SearchObserver* observer = nullptr)
        : _grid(grid), _observer(observer) {}

    // Throws std::logic_error if the parent chain does not reach Start.
    Path reconstruct(CellIndex end);

private:
    Grid& _grid;
    const SearchObserver* _observer;
};

} // namespace terrainpath::pf
