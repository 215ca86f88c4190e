#include "terrainpath/pathfinding/Grid.hpp"

#include <stdexcept>
#include <string>

namespace terrainpath::pf {

namespace {

// Neighbour order is fixed (right, left, down, up) so expansion order is reproducible.
constexpr int kDirs = 4;
constexpr int kDRow[kDirs] = { 0, 0, 1, -1 };
constexpr int kDCol[kDirs] = { 1, -1, 0, 0 };

} // namespace

Grid::Grid(int size, TerrainKind fill)
    : _size(size)
{
    if (size < 1)
        throw std::invalid_argument("grid size must be at least 1, got " + std::to_string(size));
    if (size > kMaxGridSide)
        throw std::invalid_argument("grid size must be at most " + std::to_string(kMaxGridSide) +
                                    ", got " + std::to_string(size));

    _cells.reserve(static_cast<size_t>(size) * static_cast<size_t>(size));
    for (int r = 0; r < size; ++r)
        for (int c = 0; c < size; ++c)
            _cells.emplace_back(Coord{ r, c }, fill);
}

CellIndex Grid::index_of(Coord c) const
{
    if (!contains(c))
        throw OutOfBounds(c, _size);
    return to_index(c, _size);
}

void Grid::set_terrain(Coord c, TerrainKind kind)
{
    const CellIndex id = index_of(c);
    Cell& cell = _cells[id];

    if (_start == id) _start.reset();
    if (_end == id) _end.reset();

    cell._terrain = kind;
    cell.reset_search_state();
    _adjacency_stale = true;
}

bool Grid::assign_role(Coord c, Role role)
{
    const CellIndex id = index_of(c);
    Cell& cell = _cells[id];

    if (role == Role::None || !cell.passable())
        return false;

    if (role == Role::Start)
    {
        if (_end == id) _end.reset();
        _start = id;
        cell.reset_search_state();
        cell._g = 0.0f;
    }
    else
    {
        if (_start == id) _start.reset();
        _end = id;
        cell.reset_search_state();
    }
    return true;
}

void Grid::clear_role(Role role) noexcept
{
    if (role == Role::Start) _start.reset();
    else if (role == Role::End) _end.reset();
}

Role Grid::role(Coord c) const
{
    return role_at(index_of(c));
}

Role Grid::role_at(CellIndex id) const noexcept
{
    if (_start == id) return Role::Start;
    if (_end == id) return Role::End;
    return Role::None;
}

std::optional<Coord> Grid::start() const noexcept
{
    if (!_start) return std::nullopt;
    return coord_of(*_start);
}

std::optional<Coord> Grid::end() const noexcept
{
    if (!_end) return std::nullopt;
    return coord_of(*_end);
}

void Grid::rebuild_adjacency()
{
    for (Cell& cell : _cells)
    {
        cell._neighbors.clear();
        for (int d = 0; d < kDirs; ++d)
        {
            const Coord n{ cell.row() + kDRow[d], cell.col() + kDCol[d] };
            if (!contains(n))
                continue;
            const CellIndex nid = to_index(n, _size);
            if (_cells[nid].passable())
                cell._neighbors.push_back(nid);
        }
    }
    _adjacency_stale = false;
}

void Grid::reset_search_state() noexcept
{
    for (Cell& cell : _cells)
        cell.reset_search_state();
    if (_start)
        _cells[*_start]._g = 0.0f;
}

DisplayState Grid::display_state(Coord c) const
{
    const CellIndex id = index_of(c);
    switch (role_at(id))
    {
    case Role::Start: return DisplayState::Start;
    case Role::End:   return DisplayState::End;
    case Role::None:  break;
    }

    switch (_cells[id].mark())
    {
    case SearchMark::Path:   return DisplayState::Path;
    case SearchMark::Open:   return DisplayState::Open;
    case SearchMark::Closed: return DisplayState::Closed;
    case SearchMark::None:   break;
    }
    return DisplayState::Terrain;
}

} // namespace terrainpath::pf
