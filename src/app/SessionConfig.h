#pragma once

#include "terrainpath/pathfinding/Terrain.hpp"

#include <filesystem>
#include <string>

namespace terrainpath::app {

// Grid size guardrails (cells per side).
inline constexpr int kMinGridSize = 2;
inline constexpr int kMaxGridSize = 200;

// Per-step animation delay guardrail (milliseconds).
inline constexpr int kMaxStepDelayMs = 1000;

// Persisted settings for a pathfinding session.
//
// Stored as JSON (default file name terrainpath.json):
//   {
//     "version": 1,
//     "grid":      { "size": 30, "defaultTerrain": "grass" },
//     "animation": { "enabled": false, "searchStepDelayMs": 20, "pathStepDelayMs": 30 },
//     "display":   { "color": true },
//     "logging":   { "level": "info", "file": "" }
//   }
struct SessionConfig
{
    int gridSize = 30;

    // Terrain of a fresh grid and of erased cells. Never Obstacle.
    pf::TerrainKind defaultTerrain = pf::kDefaultTerrain;

    // When enabled, the grid is redrawn after every search/path step.
    bool animate = false;
    int searchStepDelayMs = 20;
    int pathStepDelayMs = 30;

    // 24-bit ANSI colours in the text view.
    bool color = true;

    std::string logLevel = "info";
    std::string logFile;
};

inline constexpr const char* kDefaultConfigFileName = "terrainpath.json";

// Returns false (and leaves `out` untouched) if the file is missing or is not
// a JSON object. Individual invalid values keep their current setting.
bool LoadSessionConfig(SessionConfig& out, const std::filesystem::path& file) noexcept;

// Creates the parent directory if needed and writes the latest schema.
bool SaveSessionConfig(const SessionConfig& cfg, const std::filesystem::path& file) noexcept;

[[nodiscard]] int ClampGridSize(int v) noexcept;
[[nodiscard]] int ClampStepDelay(int v) noexcept;

} // namespace terrainpath::app
