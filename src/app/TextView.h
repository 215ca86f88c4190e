#pragma once

#include "terrainpath/pathfinding/Grid.hpp"

#include <string>

namespace terrainpath::app {

struct TextViewOptions
{
    bool color = false; // 24-bit ANSI background colours
};

// Glyph and colour for one display state; terrain cells use the catalog.
[[nodiscard]] char GlyphFor(const pf::Grid& grid, pf::Coord c);
[[nodiscard]] pf::Rgb ColorFor(const pf::Grid& grid, pf::Coord c);

// Whole grid, one text line per row, cells separated by a space.
[[nodiscard]] std::string RenderGrid(const pf::Grid& grid, const TextViewOptions& opt = {});

// Brushes, terrain costs and state glyphs.
[[nodiscard]] std::string RenderLegend(const TextViewOptions& opt = {});

// Multi-line description of one cell: position, status, terrain, move cost
// and A* costs ("-" where a cost is still infinite).
// Throws OutOfBounds.
[[nodiscard]] std::string DescribeCell(const pf::Grid& grid, pf::Coord c);

} // namespace terrainpath::app
