#pragma once
#include "GridTypes.hpp"
#include <array>
#include <optional>
#include <string_view>

namespace terrainpath::pf {

enum class TerrainKind : u8 {
    Grass,
    Road,
    Dirt,
    Water,
    Obstacle,
};

struct Rgb {
    u8 r{}, g{}, b{};
};

// One row of the terrain catalog.
struct TerrainInfo {
    TerrainKind      kind;
    std::string_view key;   // lower-case token used by scripts and config
    std::string_view name;  // display name
    Rgb              color;
    char             glyph;
    float            cost;  // movement-cost multiplier; infinity = impassable
};

inline constexpr TerrainKind kDefaultTerrain = TerrainKind::Grass;

inline constexpr std::array<TerrainInfo, 5> kTerrainCatalog = {{
    { TerrainKind::Grass,    "grass",    "Grass",    { 34, 139,  34}, '.', 1.0f },
    { TerrainKind::Road,     "road",     "Road",     {160, 160, 160}, '=', 0.5f },
    { TerrainKind::Dirt,     "dirt",     "Dirt",     {139,  69,  19}, ':', 2.0f },
    { TerrainKind::Water,    "water",    "Water",    { 30, 144, 255}, '~', 5.0f },
    { TerrainKind::Obstacle, "obstacle", "Obstacle", { 50,  50,  50}, '#', kInfiniteCost },
}};

[[nodiscard]] constexpr const TerrainInfo& terrain_info(TerrainKind k) noexcept {
    return kTerrainCatalog[static_cast<size_t>(k)];
}

[[nodiscard]] constexpr float movement_cost(TerrainKind k) noexcept { return terrain_info(k).cost; }

[[nodiscard]] constexpr bool is_passable(TerrainKind k) noexcept { return k != TerrainKind::Obstacle; }

// Case-insensitive lookup by key ("road") or display name ("Road").
[[nodiscard]] std::optional<TerrainKind> parse_terrain(std::string_view text) noexcept;

} // namespace terrainpath::pf
