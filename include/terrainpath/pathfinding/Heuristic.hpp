#pragma once
#include "GridTypes.hpp"
#include <cstdlib>

namespace terrainpath::pf {

// Manhattan distance. Admissible for 4-dir movement only while every terrain
// costs >= 1.0; Road (0.5) breaks that, so paths over roads are not
// guaranteed optimal.
inline float manhattan(Coord a, Coord b) {
    return static_cast<float>(std::abs(a.row - b.row) + std::abs(a.col - b.col));
}

} // namespace terrainpath::pf
