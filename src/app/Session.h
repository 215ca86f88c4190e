#pragma once

#include "terrainpath/pathfinding/Grid.hpp"
#include "terrainpath/pathfinding/SearchEngine.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace terrainpath::app {

enum class BrushKind : std::uint8_t { Start, End, Terrain };

struct Brush
{
    BrushKind kind = BrushKind::Start;
    pf::TerrainKind terrain = pf::kDefaultTerrain; // used when kind == Terrain

    static constexpr Brush StartRole() noexcept { return { BrushKind::Start, pf::kDefaultTerrain }; }
    static constexpr Brush EndRole() noexcept { return { BrushKind::End, pf::kDefaultTerrain }; }
    static constexpr Brush Paint(pf::TerrainKind t) noexcept { return { BrushKind::Terrain, t }; }
};

enum class PaintMode : std::uint8_t { SingleTile, FloodFill };

// "start", "end" or a terrain key/name.
[[nodiscard]] std::optional<Brush> ParseBrush(std::string_view text);
[[nodiscard]] std::optional<PaintMode> ParsePaintMode(std::string_view text);
[[nodiscard]] std::string BrushLabel(const Brush& b);
[[nodiscard]] const char* PaintModeLabel(PaintMode m) noexcept;

// One interactive editing session: the grid, the selected brush and paint
// mode, and the status line shown to the user.
//
// Edits are refused while a search is running (they could only come from a
// progress/status callback, since everything runs on one thread).
class Session
{
public:
    // An impassable default terrain falls back to pf::kDefaultTerrain.
    explicit Session(int gridSize, pf::TerrainKind defaultTerrain = pf::kDefaultTerrain);

    [[nodiscard]] pf::Grid&       grid() noexcept { return _grid; }
    [[nodiscard]] const pf::Grid& grid() const noexcept { return _grid; }

    [[nodiscard]] const Brush& brush() const noexcept { return _brush; }
    [[nodiscard]] PaintMode paintMode() const noexcept { return _mode; }
    [[nodiscard]] pf::TerrainKind defaultTerrain() const noexcept { return _defaultTerrain; }
    [[nodiscard]] const std::string& status() const noexcept { return _status; }
    [[nodiscard]] bool running() const noexcept { return _running; }

    void SelectBrush(const Brush& b);
    void SelectPaintMode(PaintMode m);

    // Left click. Start/End brushes move the role (the previous holder is
    // reset to the default terrain); terrain brushes paint one cell or flood
    // the region depending on the paint mode. Returns true if the grid changed.
    bool ApplyBrush(pf::Coord c);

    // Left drag. Single-tile terrain paint that skips Start and End; role
    // brushes are ignored.
    bool DragPaint(pf::Coord c);

    // Right click. Resets the cell to the default terrain, dropping any role.
    bool Erase(pf::Coord c);

    // Rebuilds adjacency and runs A*. Returns nullopt (and sets the status) if
    // Start or End is missing or a run is already in progress.
    std::optional<pf::SearchResult> Run(const pf::SearchObserver& hooks = {});

    // Replaces the grid with a fresh one of the same size.
    void Clear();

    void SetStatus(std::string msg);

private:
    bool EditAllowed() const;

    int _size;
    pf::TerrainKind _defaultTerrain;
    pf::Grid _grid;
    Brush _brush = Brush::StartRole();
    PaintMode _mode = PaintMode::SingleTile;
    std::string _status = "Select Brush & Paint Mode";
    bool _running = false;
};

} // namespace terrainpath::app
