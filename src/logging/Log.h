#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

namespace terrainpath::logsys {

struct LogOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string file; // empty = console only; otherwise rotating file, 1MB * 4
};

void init(const LogOptions& opt);        // stderr + optional file sink
std::shared_ptr<spdlog::logger> get();   // "terrainpath"

// trace, debug, info, warn/warning, error, critical, off (case-insensitive)
bool parse_level(std::string_view text, spdlog::level::level_enum& out);

} // namespace terrainpath::logsys
