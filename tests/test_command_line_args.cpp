// tests/test_command_line_args.cpp
//
// Regression coverage for src/app/CommandLineArgs.{h,cpp}.
//
// Goals:
//   - Options are case-insensitive, values keep their case
//   - Both "--opt value" and "--opt=value" / "--opt:value" are supported
//   - Unknown options and bad values are reported in a predictable order

#include <doctest/doctest.h>

#include "app/CommandLineArgs.h"

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace {

[[nodiscard]] terrainpath::app::CommandLineArgs Parse(std::initializer_list<std::string_view> argv)
{
    std::vector<std::string_view> v;
    v.reserve(argv.size());
    for (const auto& a : argv)
        v.push_back(a);
    return terrainpath::app::ParseCommandLineArgsFromArgv(v);
}

} // namespace

TEST_CASE("CommandLineArgs parses basic flags (case-insensitive)")
{
    const auto args = Parse({
        "terrainpath",
        "--ANIMATE",
        "--No-Color",
    });

    REQUIRE(args.animate.has_value());
    REQUIRE(args.color.has_value());
    CHECK(args.animate.value());
    CHECK_FALSE(args.color.value());
    CHECK_FALSE(args.showHelp);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs leaves unset overrides empty")
{
    const auto args = Parse({ "terrainpath" });

    CHECK_FALSE(args.configPath);
    CHECK_FALSE(args.scriptPath);
    CHECK_FALSE(args.gridSize);
    CHECK_FALSE(args.animate);
    CHECK_FALSE(args.color);
    CHECK_FALSE(args.logLevel);
    CHECK_FALSE(args.logFile);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs accepts : and = separators for values")
{
    const auto args = Parse({
        "terrainpath",
        "--size=12",
        "--log-level:debug",
        "--Config=Settings/Custom.json",
        "--script:Maze.txt",
    });

    REQUIRE(args.gridSize);
    REQUIRE(args.logLevel);
    REQUIRE(args.configPath);
    REQUIRE(args.scriptPath);
    CHECK(args.gridSize.value() == 12);
    CHECK(args.logLevel.value() == "debug");
    CHECK(args.configPath.value() == "Settings/Custom.json");
    CHECK(args.scriptPath.value() == "Maze.txt");
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs takes values from the next argument")
{
    const auto args = Parse({
        "terrainpath",
        "-n", "8",
        "-s", "Demo.TXT",
        "-c", "terrainpath.json",
        "--log-file", "Logs/run.log",
    });

    REQUIRE(args.gridSize);
    CHECK(args.gridSize.value() == 8);
    CHECK(args.scriptPath.value_or("") == "Demo.TXT");
    CHECK(args.configPath.value_or("") == "terrainpath.json");
    CHECK(args.logFile.value_or("") == "Logs/run.log");
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs help aliases")
{
    CHECK(Parse({ "terrainpath", "--help" }).showHelp);
    CHECK(Parse({ "terrainpath", "-H" }).showHelp);
    CHECK(Parse({ "terrainpath", "-?" }).showHelp);
}

TEST_CASE("CommandLineArgs collects unknown args and bad values in order")
{
    const auto args = Parse({
        "terrainpath",
        "--bogus",
        "--size", "abc",
        "--size=",
        "--log-file",
    });

    REQUIRE(args.unknown.size() == 5u);
    CHECK(args.unknown[0] == "--bogus");
    CHECK(args.unknown[1] == "--size");
    CHECK(args.unknown[2] == "abc");
    CHECK(args.unknown[3] == "--size=");
    CHECK(args.unknown[4] == "--log-file");
    CHECK_FALSE(args.gridSize);
}

TEST_CASE("CommandLineArgs later flags win")
{
    const auto args = Parse({
        "terrainpath",
        "--animate",
        "--no-animate",
        "--size", "10",
        "--size=20",
    });

    CHECK(args.animate.value_or(true) == false);
    CHECK(args.gridSize.value_or(0) == 20);
}

TEST_CASE("CommandLineArgs help text mentions the script commands")
{
    const std::string help = terrainpath::app::BuildCommandLineHelpText();
    CHECK(help.find("--script") != std::string::npos);
    CHECK(help.find("brush <start|end|grass|road|dirt|water|obstacle>") != std::string::npos);
    CHECK(help.find("mode <single|flood>") != std::string::npos);
}
