#pragma once
#include "GridTypes.hpp"
#include <functional>
#include <string_view>

namespace terrainpath::pf {

enum class SearchPhase : u8 { Search, Reconstruct };

struct SearchProgress {
    SearchPhase phase = SearchPhase::Search;
    Coord       cell{};   // cell just expanded / just added to the path
    size_t      step = 0; // 1-based within the phase
};

// Hooks the host hands to the search. Every member is optional.
struct SearchObserver {
    std::function<void(const SearchProgress&)> on_progress;
    std::function<void(std::string_view)>      on_status;
    std::function<bool()>                      should_cancel; // polled once per iteration

    void progress(const SearchProgress& p) const { if (on_progress) on_progress(p); }
    void status(std::string_view msg) const { if (on_status) on_status(msg); }
    [[nodiscard]] bool cancelled() const { return should_cancel && should_cancel(); }
};

} // namespace terrainpath::pf
