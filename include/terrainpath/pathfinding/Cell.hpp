#pragma once
#include "GridTypes.hpp"
#include "Terrain.hpp"
#include <vector>

namespace terrainpath::pf {

enum class Role : u8 { None, Start, End };

// Search flags are mutually exclusive; a cell is in at most one of them.
enum class SearchMark : u8 { None, Open, Closed, Path };

// What a renderer should show for a cell, in precedence order
// (role > on_path > in_open > in_closed > terrain).
enum class DisplayState : u8 { Terrain, Closed, Open, Path, Start, End };

class Grid;

class Cell {
public:
    Cell(Coord c, TerrainKind terrain) : _coord(c), _terrain(terrain) {}

    [[nodiscard]] Coord coord() const noexcept { return _coord; }
    [[nodiscard]] int   row() const noexcept { return _coord.row; }
    [[nodiscard]] int   col() const noexcept { return _coord.col; }

    [[nodiscard]] TerrainKind terrain() const noexcept { return _terrain; }
    [[nodiscard]] float movement_cost() const noexcept { return pf::movement_cost(_terrain); }
    [[nodiscard]] bool  passable() const noexcept { return is_passable(_terrain); }

    [[nodiscard]] float g_cost() const noexcept { return _g; }
    [[nodiscard]] float h_cost() const noexcept { return _h; }
    [[nodiscard]] float f_cost() const noexcept { return _f; }
    [[nodiscard]] CellIndex parent() const noexcept { return _parent; }

    [[nodiscard]] SearchMark mark() const noexcept { return _mark; }
    [[nodiscard]] bool in_open() const noexcept { return _mark == SearchMark::Open; }
    [[nodiscard]] bool in_closed() const noexcept { return _mark == SearchMark::Closed; }
    [[nodiscard]] bool on_path() const noexcept { return _mark == SearchMark::Path; }

    // Cached 4-neighbourhood; valid as of the last Grid::rebuild_adjacency().
    [[nodiscard]] const std::vector<CellIndex>& neighbors() const noexcept { return _neighbors; }

    // f is always kept equal to g + h.
    void set_costs(float g, float h) noexcept { _g = g; _h = h; _f = g + h; }
    void set_parent(CellIndex p) noexcept { _parent = p; }
    void set_mark(SearchMark m) noexcept { _mark = m; }

    void reset_search_state() noexcept {
        _g = _h = _f = kInfiniteCost;
        _parent = kNoCell;
        _mark = SearchMark::None;
    }

private:
    friend class Grid;

    Coord       _coord;
    TerrainKind _terrain;
    float       _g = kInfiniteCost;
    float       _h = kInfiniteCost;
    float       _f = kInfiniteCost;
    CellIndex   _parent = kNoCell;
    SearchMark  _mark = SearchMark::None;
    std::vector<CellIndex> _neighbors;
};

} // namespace terrainpath::pf
