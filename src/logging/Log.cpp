#include "Log.h"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cctype>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

void terrainpath::logsys::init(const LogOptions& opt) {
    std::vector<spdlog::sink_ptr> sinks;
    std::string file_error;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!opt.file.empty()) {
        const fs::path file(opt.file);
        std::error_code ec;
        if (file.has_parent_path()) fs::create_directories(file.parent_path(), ec);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(opt.file, 1 << 20, 4)); // 1MB * 4
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what(); // keep console logging, report below
        }
    }

    g_logger = std::make_shared<spdlog::logger>("terrainpath", sinks.begin(), sinks.end());
    g_logger->set_level(opt.level);
    spdlog::set_default_logger(g_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    if (!file_error.empty()) spdlog::warn("Log file {} unavailable: {}", opt.file, file_error);
    spdlog::debug("Logging started (level {})", spdlog::level::to_string_view(opt.level));
}

std::shared_ptr<spdlog::logger> terrainpath::logsys::get() { return g_logger ? g_logger : spdlog::default_logger(); }

bool terrainpath::logsys::parse_level(std::string_view text, spdlog::level::level_enum& out) {
    std::string s;
    s.reserve(text.size());
    for (char c : text) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (s == "trace")    { out = spdlog::level::trace;    return true; }
    if (s == "debug")    { out = spdlog::level::debug;    return true; }
    if (s == "info")     { out = spdlog::level::info;     return true; }
    if (s == "warn" || s == "warning") { out = spdlog::level::warn; return true; }
    if (s == "error")    { out = spdlog::level::err;      return true; }
    if (s == "critical") { out = spdlog::level::critical; return true; }
    if (s == "off")      { out = spdlog::level::off;      return true; }
    return false;
}
