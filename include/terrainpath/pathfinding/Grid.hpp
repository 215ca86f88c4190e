#pragma once
#include "Cell.hpp"
#include <optional>
#include <vector>

namespace terrainpath::pf {

// Square arena of cells addressed by CellIndex (row-major).
//
// The grid is the single owner of Start/End identity: one optional index per
// role. Cells never carry their own role flag, so a repaint cannot leave a
// stale Start/End reference behind.
class Grid {
public:
    // Throws std::invalid_argument if size is outside 1..kMaxGridSide.
    explicit Grid(int size, TerrainKind fill = kDefaultTerrain);

    [[nodiscard]] int    size() const noexcept { return _size; }
    [[nodiscard]] size_t cell_count() const noexcept { return _cells.size(); }

    [[nodiscard]] bool contains(Coord c) const noexcept {
        return c.row >= 0 && c.col >= 0 && c.row < _size && c.col < _size;
    }

    // Throws OutOfBounds.
    [[nodiscard]] CellIndex index_of(Coord c) const;
    [[nodiscard]] Coord     coord_of(CellIndex id) const noexcept { return from_index(id, _size); }

    [[nodiscard]] const Cell& cell(Coord c) const { return _cells[index_of(c)]; }
    [[nodiscard]] Cell&       cell(Coord c) { return _cells[index_of(c)]; }
    [[nodiscard]] const Cell& at(CellIndex id) const { return _cells.at(id); }
    [[nodiscard]] Cell&       at(CellIndex id) { return _cells.at(id); }

    [[nodiscard]] TerrainKind terrain(Coord c) const { return cell(c).terrain(); }

    // Repaints one cell: new terrain, search state reset, any role dropped.
    // Marks adjacency stale. Idempotent.
    void set_terrain(Coord c, TerrainKind kind);

    // Gives `role` to the cell, displacing its previous holder; a cell holding
    // the other role loses it. Start gets g = 0, End a fresh search state, and
    // both lose open/closed/path marks. Returns false (no change) for
    // impassable cells or Role::None.
    bool assign_role(Coord c, Role role);
    void clear_role(Role role) noexcept;

    [[nodiscard]] Role role(Coord c) const;
    [[nodiscard]] Role role_at(CellIndex id) const noexcept;
    [[nodiscard]] std::optional<CellIndex> start_index() const noexcept { return _start; }
    [[nodiscard]] std::optional<CellIndex> end_index() const noexcept { return _end; }
    [[nodiscard]] std::optional<Coord> start() const noexcept;
    [[nodiscard]] std::optional<Coord> end() const noexcept;

    // Recomputes every cell's neighbour list from the current terrain.
    void rebuild_adjacency();
    [[nodiscard]] bool adjacency_stale() const noexcept { return _adjacency_stale; }
    [[nodiscard]] const std::vector<CellIndex>& neighbors(Coord c) const { return cell(c).neighbors(); }

    // Clears g/h/f, parents and marks of every cell. Start keeps g = 0.
    void reset_search_state() noexcept;

    [[nodiscard]] DisplayState display_state(Coord c) const;

private:
    int _size = 0;
    std::vector<Cell> _cells;
    std::optional<CellIndex> _start;
    std::optional<CellIndex> _end;
    bool _adjacency_stale = true;
};

} // namespace terrainpath::pf
