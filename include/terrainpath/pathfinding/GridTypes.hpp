#pragma once
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace terrainpath::pf {

using u8  = std::uint8_t;
using u32 = std::uint32_t;

// Grid position. Rows grow downwards, columns to the right.
struct Coord {
    int row{}, col{};
    constexpr bool operator==(const Coord&) const = default;
};

using CellIndex = u32;

constexpr CellIndex kNoCell = std::numeric_limits<CellIndex>::max();

// Largest side length: side * side must fit both int and CellIndex.
inline constexpr int kMaxGridSide = 46340;

inline constexpr float kInfiniteCost = std::numeric_limits<float>::infinity();

// Encode/decode (row,col) <-> CellIndex (row-major, square grid)
inline CellIndex to_index(Coord c, int size) {
    return static_cast<CellIndex>(c.row) * static_cast<CellIndex>(size) + static_cast<CellIndex>(c.col);
}
inline Coord     from_index(CellIndex id, int size) { return { int(id / size), int(id % size) }; }

// Raised by every query/paint operation handed a coordinate outside the grid.
class OutOfBounds : public std::out_of_range {
public:
    OutOfBounds(Coord c, int size)
        : std::out_of_range("cell (" + std::to_string(c.row) + ", " + std::to_string(c.col) +
                            ") is outside the " + std::to_string(size) + "x" + std::to_string(size) + " grid"),
          _coord(c) {}

    [[nodiscard]] Coord coord() const noexcept { return _coord; }

private:
    Coord _coord;
};

} // namespace terrainpath::pf
