#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace terrainpath::app {

// Parsed command-line arguments for the terrainpath executable.
//
// Notes:
//   - All option names are case-insensitive.
//   - Both "--opt=value" and "--opt value" forms are supported.
//   - Anything given here overrides the JSON config file.
struct CommandLineArgs
{
    bool showHelp = false;              // --help / -h / -?

    std::optional<std::string> configPath; // --config <path>
    std::optional<std::string> scriptPath; // --script <path> (default: stdin)

    std::optional<int> gridSize;        // --size <n>
    std::optional<bool> animate;        // --animate / --no-animate
    std::optional<bool> color;          // --color / --no-color

    std::optional<std::string> logLevel; // --log-level <level>
    std::optional<std::string> logFile;  // --log-file <path>

    // Any unknown/unsupported args are collected here (so we can show a useful error).
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace terrainpath::app
