#include <doctest/doctest.h>
#include "terrainpath/pathfinding/Grid.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace terrainpath::pf;

TEST_CASE("Grid/FreshCellsAreDefault") {
    Grid g(4);
    CHECK(g.size() == 4);
    CHECK(g.cell_count() == 16u);

    const Cell& c = g.cell({2,3});
    CHECK(c.row() == 2);
    CHECK(c.col() == 3);
    CHECK(c.terrain() == TerrainKind::Grass);
    CHECK(c.movement_cost() == 1.0f);
    CHECK(std::isinf(c.g_cost()));
    CHECK(std::isinf(c.h_cost()));
    CHECK(std::isinf(c.f_cost()));
    CHECK(c.parent() == kNoCell);
    CHECK(c.mark() == SearchMark::None);
    CHECK(g.role({2,3}) == Role::None);
    CHECK_FALSE(g.start().has_value());
    CHECK_FALSE(g.end().has_value());
}

TEST_CASE("Grid/RejectsSizeOutOfRange") {
    CHECK_THROWS_AS(Grid(0), std::invalid_argument);
    CHECK_THROWS_AS(Grid(-3), std::invalid_argument);
    CHECK_THROWS_AS(Grid(kMaxGridSide + 1), std::invalid_argument);
}

TEST_CASE("Grid/IndexOfLargestSide") {
    const int n = kMaxGridSide;
    const Coord last{ n - 1, n - 1 };
    const CellIndex id = to_index(last, n);
    CHECK(id == CellIndex(n) * CellIndex(n) - 1u);
    CHECK(id != kNoCell);
    CHECK(from_index(id, n) == last);
}

TEST_CASE("Grid/OutOfBounds") {
    Grid g(3);
    CHECK_FALSE(g.contains({3,0}));
    CHECK_FALSE(g.contains({0,-1}));
    CHECK_THROWS_AS((void)g.cell({3,0}), OutOfBounds);
    CHECK_THROWS_AS(g.set_terrain({-1,1}, TerrainKind::Road), OutOfBounds);
    CHECK_THROWS_AS(g.assign_role({0,5}, Role::Start), OutOfBounds);
    CHECK_THROWS_AS((void)g.role({9,9}), OutOfBounds);
    CHECK_THROWS_AS((void)g.display_state({3,3}), OutOfBounds);

    try {
        g.set_terrain({4,1}, TerrainKind::Dirt);
        FAIL("expected OutOfBounds");
    } catch (const OutOfBounds& e) {
        CHECK(e.coord() == Coord{4,1});
    }
}

TEST_CASE("Grid/SetTerrainResetsSearchState") {
    Grid g(3);
    Cell& c = g.cell({1,1});
    c.set_costs(3.0f, 2.0f);
    c.set_parent(0);
    c.set_mark(SearchMark::Closed);
    CHECK(c.f_cost() == 5.0f);

    g.set_terrain({1,1}, TerrainKind::Water);
    CHECK(c.terrain() == TerrainKind::Water);
    CHECK(c.movement_cost() == 5.0f);
    CHECK(std::isinf(c.g_cost()));
    CHECK(std::isinf(c.f_cost()));
    CHECK(c.parent() == kNoCell);
    CHECK(c.mark() == SearchMark::None);
    CHECK(g.adjacency_stale());
}

TEST_CASE("Grid/SetTerrainIsIdempotent") {
    Grid once(3), twice(3);
    once.assign_role({0,0}, Role::Start);
    twice.assign_role({0,0}, Role::Start);

    once.set_terrain({0,0}, TerrainKind::Dirt);
    twice.set_terrain({0,0}, TerrainKind::Dirt);
    twice.set_terrain({0,0}, TerrainKind::Dirt);

    const Cell& a = once.cell({0,0});
    const Cell& b = twice.cell({0,0});
    CHECK(a.terrain() == b.terrain());
    CHECK(a.mark() == b.mark());
    CHECK(a.parent() == b.parent());
    CHECK(std::isinf(b.g_cost()));
    CHECK(once.role({0,0}) == twice.role({0,0}));
    CHECK(once.start() == twice.start());
}

TEST_CASE("Grid/PaintingClearsRole") {
    Grid g(3);
    REQUIRE(g.assign_role({0,0}, Role::Start));
    REQUIRE(g.assign_role({2,2}, Role::End));

    g.set_terrain({0,0}, TerrainKind::Obstacle);
    CHECK_FALSE(g.start().has_value());
    CHECK(g.role({0,0}) == Role::None);

    g.set_terrain({2,2}, TerrainKind::Road);
    CHECK_FALSE(g.end().has_value());
}

TEST_CASE("Grid/AssignRole") {
    Grid g(4);

    REQUIRE(g.assign_role({1,1}, Role::Start));
    CHECK(g.start() == Coord{1,1});
    CHECK(g.role({1,1}) == Role::Start);
    CHECK(g.cell({1,1}).g_cost() == 0.0f);

    // Moving the role displaces the previous holder.
    REQUIRE(g.assign_role({2,2}, Role::Start));
    CHECK(g.start() == Coord{2,2});
    CHECK(g.role({1,1}) == Role::None);

    // End on the Start cell takes the role over; Start != End always holds.
    REQUIRE(g.assign_role({2,2}, Role::End));
    CHECK(g.end() == Coord{2,2});
    CHECK_FALSE(g.start().has_value());
    CHECK(std::isinf(g.cell({2,2}).g_cost()));

    g.clear_role(Role::End);
    CHECK_FALSE(g.end().has_value());
    CHECK_FALSE(g.assign_role({0,0}, Role::None));
}

TEST_CASE("Grid/AssignRoleClearsMarks") {
    Grid g(3);
    g.cell({0,1}).set_mark(SearchMark::Path);
    REQUIRE(g.assign_role({0,1}, Role::End));
    CHECK(g.cell({0,1}).mark() == SearchMark::None);
}

TEST_CASE("Grid/ObstacleCannotHoldRole") {
    Grid g(3);
    g.set_terrain({1,1}, TerrainKind::Obstacle);
    CHECK_FALSE(g.assign_role({1,1}, Role::Start));
    CHECK_FALSE(g.assign_role({1,1}, Role::End));
    CHECK_FALSE(g.start().has_value());
    CHECK_FALSE(g.end().has_value());
}

TEST_CASE("Grid/AdjacencyOrderAndObstacles") {
    Grid g(3);
    CHECK(g.adjacency_stale());
    g.rebuild_adjacency();
    CHECK_FALSE(g.adjacency_stale());

    // right, left, down, up
    CHECK(g.neighbors({1,1}) == std::vector<CellIndex>{ 5, 3, 7, 1 });
    CHECK(g.neighbors({0,0}) == std::vector<CellIndex>{ 1, 3 });

    g.set_terrain({0,1}, TerrainKind::Obstacle);
    CHECK(g.adjacency_stale());
    // Snapshot: unchanged until rebuilt.
    CHECK(g.neighbors({0,0}) == std::vector<CellIndex>{ 1, 3 });

    g.rebuild_adjacency();
    CHECK(g.neighbors({0,0}) == std::vector<CellIndex>{ 3 });
    CHECK(g.neighbors({1,1}) == std::vector<CellIndex>{ 5, 3, 7 });
    // The obstacle itself still lists its passable neighbours.
    CHECK(g.neighbors({0,1}).size() == 3u);
}

TEST_CASE("Grid/DisplayPrecedence") {
    Grid g(3);
    Cell& c = g.cell({0,0});

    CHECK(g.display_state({0,0}) == DisplayState::Terrain);
    c.set_mark(SearchMark::Closed);
    CHECK(g.display_state({0,0}) == DisplayState::Closed);
    c.set_mark(SearchMark::Open);
    CHECK(g.display_state({0,0}) == DisplayState::Open);
    c.set_mark(SearchMark::Path);
    CHECK(g.display_state({0,0}) == DisplayState::Path);

    REQUIRE(g.assign_role({0,0}, Role::Start));
    c.set_mark(SearchMark::Closed);
    CHECK(g.display_state({0,0}) == DisplayState::Start);
}

TEST_CASE("Grid/ResetSearchStateKeepsStartAtZero") {
    Grid g(3);
    REQUIRE(g.assign_role({0,0}, Role::Start));
    g.cell({0,0}).set_costs(0.0f, 4.0f);
    g.cell({1,2}).set_costs(2.0f, 1.0f);
    g.cell({1,2}).set_mark(SearchMark::Open);

    g.reset_search_state();
    CHECK(g.cell({0,0}).g_cost() == 0.0f);
    CHECK(std::isinf(g.cell({0,0}).h_cost()));
    CHECK(std::isinf(g.cell({1,2}).g_cost()));
    CHECK(g.cell({1,2}).mark() == SearchMark::None);
    CHECK(g.start() == Coord{0,0});
}
