#include "app/TextView.h"

#include <cmath>
#include <cstdio>

namespace terrainpath::app {

namespace {

constexpr pf::Rgb kClosedColor{255, 150, 150};
constexpr pf::Rgb kOpenColor{150, 255, 150};
constexpr pf::Rgb kPathColor{128, 0, 128};
constexpr pf::Rgb kStartColor{255, 165, 0};
constexpr pf::Rgb kEndColor{64, 224, 208};

std::string Colored(char glyph, pf::Rgb bg)
{
    char buf[48];
    std::snprintf(buf, sizeof(buf), "\x1b[48;2;%u;%u;%um%c\x1b[0m",
                  static_cast<unsigned>(bg.r), static_cast<unsigned>(bg.g), static_cast<unsigned>(bg.b), glyph);
    return buf;
}

// Costs print with one decimal, or "-" / "Inf" while infinite.
std::string FormatCost(float v, const char* infinite)
{
    if (std::isinf(v))
        return infinite;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", static_cast<double>(v));
    return buf;
}

const char* StatusText(const pf::Grid& grid, pf::Coord c)
{
    switch (grid.display_state(c))
    {
    case pf::DisplayState::Start:  return "Start Node";
    case pf::DisplayState::End:    return "End Node";
    case pf::DisplayState::Path:   return "On Path";
    case pf::DisplayState::Open:   return "In Open Set";
    case pf::DisplayState::Closed: return "In Closed Set";
    case pf::DisplayState::Terrain: break;
    }
    return grid.terrain(c) == pf::TerrainKind::Obstacle ? "Obstacle" : "Idle";
}

} // namespace

char GlyphFor(const pf::Grid& grid, pf::Coord c)
{
    switch (grid.display_state(c))
    {
    case pf::DisplayState::Start:  return 'S';
    case pf::DisplayState::End:    return 'E';
    case pf::DisplayState::Path:   return '*';
    case pf::DisplayState::Open:   return 'o';
    case pf::DisplayState::Closed: return 'x';
    case pf::DisplayState::Terrain: break;
    }
    return pf::terrain_info(grid.terrain(c)).glyph;
}

pf::Rgb ColorFor(const pf::Grid& grid, pf::Coord c)
{
    switch (grid.display_state(c))
    {
    case pf::DisplayState::Start:  return kStartColor;
    case pf::DisplayState::End:    return kEndColor;
    case pf::DisplayState::Path:   return kPathColor;
    case pf::DisplayState::Open:   return kOpenColor;
    case pf::DisplayState::Closed: return kClosedColor;
    case pf::DisplayState::Terrain: break;
    }
    return pf::terrain_info(grid.terrain(c)).color;
}

std::string RenderGrid(const pf::Grid& grid, const TextViewOptions& opt)
{
    const int n = grid.size();
    std::string out;
    out.reserve(static_cast<size_t>(n) * static_cast<size_t>(n) * (opt.color ? 24 : 2));

    for (int r = 0; r < n; ++r)
    {
        for (int col = 0; col < n; ++col)
        {
            const pf::Coord c{ r, col };
            if (col > 0)
                out.push_back(' ');
            if (opt.color)
                out += Colored(GlyphFor(grid, c), ColorFor(grid, c));
            else
                out.push_back(GlyphFor(grid, c));
        }
        out.push_back('\n');
    }
    return out;
}

std::string RenderLegend(const TextViewOptions& opt)
{
    auto swatch = [&](char glyph, pf::Rgb color) {
        return opt.color ? Colored(glyph, color) : std::string(1, glyph);
    };

    std::string out;
    out += swatch('S', kStartColor) + "  Start Node\n";
    out += swatch('E', kEndColor) + "  End Node\n";
    for (const pf::TerrainInfo& t : pf::kTerrainCatalog)
    {
        out += swatch(t.glyph, t.color) + "  " + std::string(t.name);
        if (!std::isinf(t.cost))
            out += " (Cost: " + FormatCost(t.cost, "Inf") + ")";
        out.push_back('\n');
    }
    out += swatch('o', kOpenColor) + "  In Open Set\n";
    out += swatch('x', kClosedColor) + "  In Closed Set\n";
    out += swatch('*', kPathColor) + "  On Path\n";
    return out;
}

std::string DescribeCell(const pf::Grid& grid, pf::Coord c)
{
    const pf::Cell& cell = grid.cell(c);

    std::string out;
    out += "Pos: (" + std::to_string(c.row) + ", " + std::to_string(c.col) + ")\n";
    out += std::string("Status: ") + StatusText(grid, c) + "\n";
    out += "Terrain: " + std::string(pf::terrain_info(cell.terrain()).name) + "\n";
    out += "Move Cost: " + FormatCost(cell.movement_cost(), "Inf") + "\n";
    out += "--- A* Costs ---\n";
    out += "G: " + FormatCost(cell.g_cost(), "-") + "\n";
    out += "H: " + FormatCost(cell.h_cost(), "-") + "\n";
    out += "F: " + FormatCost(cell.f_cost(), "-") + "\n";
    return out;
}

} // namespace terrainpath::app
