#include "app/Session.h"

#include "terrainpath/pathfinding/RegionFill.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <utility>

namespace terrainpath::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

// Clears the session's running flag on every exit path of Run().
class RunningGuard
{
public:
    explicit RunningGuard(bool& flag) noexcept : _flag(flag) { _flag = true; }
    ~RunningGuard() { _flag = false; }
    RunningGuard(const RunningGuard&) = delete;
    RunningGuard& operator=(const RunningGuard&) = delete;

private:
    bool& _flag;
};

// Erased and displaced cells get this terrain, so it must stay walkable.
pf::TerrainKind PassableDefault(pf::TerrainKind t)
{
    if (pf::is_passable(t))
        return t;
    spdlog::warn("Session: default terrain {} is impassable, using {}",
                 pf::terrain_info(t).key, pf::terrain_info(pf::kDefaultTerrain).key);
    return pf::kDefaultTerrain;
}

} // namespace

std::optional<Brush> ParseBrush(std::string_view text)
{
    const std::string s = ToLower(text);
    if (s == "start") return Brush::StartRole();
    if (s == "end")   return Brush::EndRole();
    if (const auto t = pf::parse_terrain(s)) return Brush::Paint(*t);
    return std::nullopt;
}

std::optional<PaintMode> ParsePaintMode(std::string_view text)
{
    const std::string s = ToLower(text);
    if (s == "single" || s == "single-tile" || s == "single_tile") return PaintMode::SingleTile;
    if (s == "flood" || s == "flood-fill" || s == "flood_fill")    return PaintMode::FloodFill;
    return std::nullopt;
}

std::string BrushLabel(const Brush& b)
{
    switch (b.kind)
    {
    case BrushKind::Start:   return "Start";
    case BrushKind::End:     return "End";
    case BrushKind::Terrain: return std::string(pf::terrain_info(b.terrain).name);
    }
    return "?";
}

const char* PaintModeLabel(PaintMode m) noexcept
{
    return m == PaintMode::FloodFill ? "FLOOD FILL" : "SINGLE TILE";
}

Session::Session(int gridSize, pf::TerrainKind defaultTerrain)
    : _size(gridSize)
    , _defaultTerrain(PassableDefault(defaultTerrain))
    , _grid(gridSize, _defaultTerrain)
{
}

void Session::SetStatus(std::string msg)
{
    spdlog::debug("status: {}", msg);
    _status = std::move(msg);
}

bool Session::EditAllowed() const
{
    if (_running)
    {
        spdlog::warn("Session: grid edit refused while a search is running");
        return false;
    }
    return true;
}

void Session::SelectBrush(const Brush& b)
{
    _brush = b;
    SetStatus("Brush: " + BrushLabel(_brush) + ", " + PaintModeLabel(_mode));
}

void Session::SelectPaintMode(PaintMode m)
{
    _mode = m;
    SetStatus("Mode: " + BrushLabel(_brush) + ", " + PaintModeLabel(_mode));
}

bool Session::ApplyBrush(pf::Coord c)
{
    const pf::CellIndex id = _grid.index_of(c);
    if (!EditAllowed())
        return false;

    if (_brush.kind == BrushKind::Terrain)
    {
        if (_mode == PaintMode::FloodFill)
            return pf::fill_region(_grid, c, _brush.terrain).changed();

        _grid.set_terrain(c, _brush.terrain);
        return true;
    }

    const pf::Role role = _brush.kind == BrushKind::Start ? pf::Role::Start : pf::Role::End;
    if (!_grid.at(id).passable())
    {
        SetStatus("Cannot place " + BrushLabel(_brush) + " on an Obstacle.");
        return false;
    }

    // The previous holder of the role goes back to plain default terrain.
    const auto previous = role == pf::Role::Start ? _grid.start() : _grid.end();
    if (previous)
        _grid.set_terrain(*previous, _defaultTerrain);

    return _grid.assign_role(c, role);
}

bool Session::DragPaint(pf::Coord c)
{
    (void)_grid.index_of(c);
    if (_brush.kind != BrushKind::Terrain || !EditAllowed())
        return false;
    if (_grid.role(c) != pf::Role::None)
        return false;

    _grid.set_terrain(c, _brush.terrain);
    return true;
}

bool Session::Erase(pf::Coord c)
{
    (void)_grid.index_of(c);
    if (!EditAllowed())
        return false;

    _grid.set_terrain(c, _defaultTerrain);
    return true;
}

std::optional<pf::SearchResult> Session::Run(const pf::SearchObserver& hooks)
{
    if (_running)
    {
        spdlog::warn("Session: search already running");
        return std::nullopt;
    }
    if (!_grid.start() || !_grid.end())
    {
        SetStatus("Place Start and End first.");
        return std::nullopt;
    }

    RunningGuard guard(_running);
    _grid.rebuild_adjacency();

    pf::SearchObserver observer;
    observer.on_progress = hooks.on_progress;
    observer.should_cancel = hooks.should_cancel;
    observer.on_status = [this, &hooks](std::string_view msg) {
        SetStatus(std::string(msg));
        hooks.status(msg);
    };

    pf::SearchEngine engine(_grid, observer);
    pf::SearchResult result = engine.run();

    if (result.outcome == pf::SearchOutcome::Cancelled)
    {
        SetStatus("Search Cancelled.");
        hooks.status(_status);
    }

    spdlog::info("Search {}: {} cells expanded{}", pf::to_string(result.outcome), result.expanded,
                 result.outcome == pf::SearchOutcome::Succeeded
                     ? ", path " + std::to_string(result.path.length()) + " cells"
                     : std::string());
    return result;
}

void Session::Clear()
{
    if (!EditAllowed())
        return;

    _grid = pf::Grid(_size, _defaultTerrain);
    SetStatus("Grid Cleared! Select Brush & Paint Mode.");
}

} // namespace terrainpath::app
