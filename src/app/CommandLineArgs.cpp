#include "app/CommandLineArgs.h"

#include <cctype>
#include <limits>
#include <sstream>

namespace terrainpath::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

[[nodiscard]] bool ConsumeValue(std::string_view arg,
                               std::string_view prefix,
                               std::string_view& outValue)
{
    if (!StartsWith(arg, prefix))
        return false;

    // Accept either:
    //   --opt=value
    //   --opt:value
    const std::size_t n = prefix.size();
    if (arg.size() == n)
        return false;

    const char sep = arg[n];
    if (sep != '=' && sep != ':')
        return false;

    outValue = arg.substr(n + 1);
    return true;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    int sign = 1;
    std::size_t i = 0;
    if (s[0] == '+') {
        i = 1;
    } else if (s[0] == '-') {
        sign = -1;
        i = 1;
    }
    if (i == s.size())
        return std::nullopt;

    long long v = 0;
    for (; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + static_cast<long long>(c - '0');
        if (v > 1'000'000'000LL)
            return std::nullopt; // absurd
    }

    v *= sign;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return std::nullopt;

    return static_cast<int>(v);
}

} // namespace

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv)
{
    std::vector<std::string_view> v;
    v.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0u);
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgsFromArgv(v);
}

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;
    const std::size_t argc = argv.size();

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    for (std::size_t i = 1; i < argc; ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        // Option names are case-insensitive; values (paths) keep their case.
        const std::string lowered = ToLower(raw);
        const std::string_view arg(lowered);

        // Help
        if (arg == "--help" || arg == "-h" || arg == "-?") {
            out.showHelp = true;
            continue;
        }

        // Boolean overrides
        if (arg == "--animate") { out.animate = true; continue; }
        if (arg == "--no-animate" || arg == "--noanimate") { out.animate = false; continue; }
        if (arg == "--color" || arg == "--colour") { out.color = true; continue; }
        if (arg == "--no-color" || arg == "--no-colour") { out.color = false; continue; }

        // Options with values
        std::string_view value;

        const auto takeNextString = [&](std::optional<std::string>& dst) {
            if (i + 1 >= argc) {
                addUnknown(raw);
                return;
            }
            dst = std::string(argv[i + 1]);
            ++i;
        };

        const auto takeNextInt = [&](std::optional<int>& dst) {
            if (i + 1 >= argc) {
                addUnknown(raw);
                return;
            }
            const auto parsed = ParseInt(argv[i + 1]);
            if (!parsed) {
                addUnknown(raw);
                return;
            }
            dst = *parsed;
            ++i;
        };

        // For --opt=value the value is sliced from `raw` so it keeps its case.
        const auto rawValue = [&]() {
            return raw.substr(raw.size() - value.size());
        };

        if (arg == "--config" || arg == "-c") { takeNextString(out.configPath); continue; }
        if (ConsumeValue(arg, "--config", value)) { out.configPath = std::string(rawValue()); continue; }

        if (arg == "--script" || arg == "-s") { takeNextString(out.scriptPath); continue; }
        if (ConsumeValue(arg, "--script", value)) { out.scriptPath = std::string(rawValue()); continue; }

        if (arg == "--log-file") { takeNextString(out.logFile); continue; }
        if (ConsumeValue(arg, "--log-file", value)) { out.logFile = std::string(rawValue()); continue; }

        if (arg == "--log-level") { takeNextString(out.logLevel); continue; }
        if (ConsumeValue(arg, "--log-level", value)) { out.logLevel = std::string(value); continue; }

        if (arg == "--size" || arg == "-n") { takeNextInt(out.gridSize); continue; }
        if (ConsumeValue(arg, "--size", value)) {
            const auto parsed = ParseInt(value);
            if (parsed)
                out.gridSize = *parsed;
            else
                addUnknown(raw);
            continue;
        }

        // Anything else is unknown.
        addUnknown(raw);
    }

    return out;
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "terrainpath - weighted grid A* with terrain painting\n\n";
    oss << "Usage: terrainpath [options] [--script FILE]\n";
    oss << "Commands are read from FILE, or from standard input when no script is given.\n\n";

    oss << "Options\n";
    oss << "  --config <path>          JSON settings file (default terrainpath.json if present)\n";
    oss << "  --script <path>          Command script to run\n";
    oss << "  --size <n>               Grid cells per side (2..200, default 30)\n";
    oss << "  --animate / --no-animate Redraw the grid after every search step\n";
    oss << "  --color / --no-color     24-bit ANSI colours in grid output\n";
    oss << "  --log-level <level>      trace, debug, info, warn, error, critical, off\n";
    oss << "  --log-file <path>        Also log to a rotating file\n";
    oss << "  --help, -h               Show this help\n\n";

    oss << "Script commands\n";
    oss << "  brush <start|end|grass|road|dirt|water|obstacle>\n";
    oss << "  mode <single|flood>\n";
    oss << "  click <row> <col>        Apply the brush (single tile or flood fill)\n";
    oss << "  drag <row> <col>         Paint one tile, skipping Start/End\n";
    oss << "  erase <row> <col>        Reset a tile to the default terrain\n";
    oss << "  run                      Run A* from Start to End (Ctrl+C cancels)\n";
    oss << "  clear | show | legend | status | inspect <row> <col> | quit\n\n";

    oss << "Examples\n";
    oss << "  terrainpath --script maze.txt --no-color\n";
    oss << "  terrainpath --size 10 --animate < demo.txt\n";
    return oss.str();
}

} // namespace terrainpath::app
