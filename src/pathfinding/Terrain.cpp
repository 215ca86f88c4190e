#include "terrainpath/pathfinding/Terrain.hpp"

#include <cctype>

namespace terrainpath::pf {

namespace {

bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }
    return true;
}

} // namespace

std::optional<TerrainKind> parse_terrain(std::string_view text) noexcept
{
    for (const TerrainInfo& t : kTerrainCatalog)
    {
        if (EqualsI(text, t.key) || EqualsI(text, t.name))
            return t.kind;
    }
    return std::nullopt;
}

} // namespace terrainpath::pf
