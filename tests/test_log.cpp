#include <doctest/doctest.h>

#include "logging/Log.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace terrainpath;

TEST_CASE("logsys::parse_level accepts spdlog names case-insensitively")
{
    spdlog::level::level_enum lvl = spdlog::level::info;

    CHECK(logsys::parse_level("DEBUG", lvl));
    CHECK(lvl == spdlog::level::debug);
    CHECK(logsys::parse_level("warning", lvl));
    CHECK(lvl == spdlog::level::warn);
    CHECK(logsys::parse_level("Error", lvl));
    CHECK(lvl == spdlog::level::err);
    CHECK(logsys::parse_level("off", lvl));
    CHECK(lvl == spdlog::level::off);

    CHECK_FALSE(logsys::parse_level("loud", lvl));
    CHECK(lvl == spdlog::level::off); // untouched
}

TEST_CASE("logsys::init installs the terrainpath logger with a file sink")
{
    std::error_code ec;
    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const fs::path file = fs::temp_directory_path(ec) / ("terrainpath_log_tests_" + std::to_string(stamp)) /
                          "logs" / "terrainpath.log";

    logsys::LogOptions opt;
    opt.level = spdlog::level::err;
    opt.file = file.string();
    logsys::init(opt);

    const auto logger = logsys::get();
    REQUIRE(logger);
    CHECK(logger->name() == "terrainpath");
    CHECK(logger->level() == spdlog::level::err);
    CHECK(spdlog::default_logger() == logger);

    spdlog::error("log file check");
    logger->flush();
    CHECK(fs::exists(file));
    CHECK(fs::file_size(file, ec) > 0u);
}
