#pragma once
#include "GridTypes.hpp"
#include <vector>

namespace terrainpath::pf {

// Ordered Start -> End, both included.
struct Path {
    std::vector<Coord> points;
    float total_cost = 0.0f;
    [[nodiscard]] bool empty() const noexcept { return points.empty(); }
    [[nodiscard]] size_t length() const noexcept { return points.size(); }
};

} // namespace terrainpath::pf
