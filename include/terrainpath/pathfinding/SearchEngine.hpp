#pragma once
#include "Grid.hpp"
#include "Path.hpp"
#include "SearchObserver.hpp"
#include <utility>

namespace terrainpath::pf {

enum class SearchState : u8 { Unstarted, Running, Succeeded, Failed, Cancelled };

enum class SearchOutcome : u8 { Succeeded, Failed, Cancelled };

struct SearchResult {
    SearchOutcome outcome = SearchOutcome::Failed;
    float  total_cost = kInfiniteCost; // End.g on success
    Path   path;                       // empty unless Succeeded
    size_t expanded = 0;               // cells popped and closed
};

[[nodiscard]] const char* to_string(SearchOutcome o) noexcept;

// Weighted A* from the grid's Start to its End over 4-connected cells.
//
// Open-set ties are broken by insertion order, so identical input always
// expands identically. Closed cells are final: they are never re-opened even
// when a cheaper route to them shows up later.
class SearchEngine {
public:
    explicit SearchEngine(Grid& grid, SearchObserver observer = {})
        : _grid(grid), _observer(std::move(observer)) {}

    // Throws std::logic_error if the grid lacks Start or End.
    SearchResult run();

    [[nodiscard]] SearchState state() const noexcept { return _state; }

private:
    Grid& _grid;
    SearchObserver _observer;
    SearchState _state = SearchState::Unstarted;
};

} // namespace terrainpath::pf
