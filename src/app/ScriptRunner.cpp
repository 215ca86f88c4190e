#include "app/ScriptRunner.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace terrainpath::app {

namespace {

[[nodiscard]] std::vector<std::string_view> Tokenize(std::string_view line)
{
    std::vector<std::string_view> out;
    std::size_t i = 0;
    while (i < line.size())
    {
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i])))
            ++i;
        const std::size_t begin = i;
        while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i])))
            ++i;
        if (i > begin)
            out.push_back(line.substr(begin, i - begin));
    }
    return out;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view sv) noexcept
{
    int v = 0;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end)
        return std::nullopt;
    return v;
}

[[nodiscard]] std::string Lower(std::string_view s)
{
    std::string out(s);
    for (char& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string FormatPath(const pf::Path& p)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "Path (%zu cells, cost %.1f):", p.length(), static_cast<double>(p.total_cost));
    std::string out = buf;
    for (const pf::Coord& c : p.points)
        out += " (" + std::to_string(c.row) + "," + std::to_string(c.col) + ")";
    out.push_back('\n');
    return out;
}

// Pairs onRunBegin with onRunEnd on every exit path of RunSearch().
class RunScope
{
public:
    explicit RunScope(const ScriptOptions& opt) : _opt(opt)
    {
        if (_opt.onRunBegin)
            _opt.onRunBegin();
    }
    ~RunScope()
    {
        if (_opt.onRunEnd)
            _opt.onRunEnd();
    }
    RunScope(const RunScope&) = delete;
    RunScope& operator=(const RunScope&) = delete;

private:
    const ScriptOptions& _opt;
};

void Pause(int ms)
{
    if (ms > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace

ScriptRunner::ScriptRunner(Session& session, std::ostream& out, std::ostream& err, ScriptOptions opt)
    : _session(session)
    , _out(out)
    , _err(err)
    , _opt(std::move(opt))
{
}

bool ScriptRunner::Fail(std::size_t lineNo, std::string_view msg)
{
    ++_errors;
    _err << "error: line " << lineNo << ": " << msg << '\n';
    spdlog::warn("script line {}: {}", lineNo, msg);
    return false;
}

std::size_t ScriptRunner::RunStream(std::istream& in)
{
    std::string line;
    std::size_t lineNo = 0;
    while (!_quit && std::getline(in, line))
    {
        ++lineNo;
        (void)ExecuteLine(line, lineNo);
    }
    return _errors;
}

bool ScriptRunner::ExecuteLine(std::string_view line, std::size_t lineNo)
{
    const auto tokens = Tokenize(line);
    if (tokens.empty() || tokens[0].front() == '#')
        return true;

    const std::string cmd = Lower(tokens[0]);
    const std::size_t argc = tokens.size() - 1;

    // Commands taking a cell. Coordinates are checked here so the session
    // never sees an out-of-range cell.
    auto cellArg = [&]() -> std::optional<pf::Coord> {
        if (argc != 2)
        {
            Fail(lineNo, cmd + " expects <row> <col>");
            return std::nullopt;
        }
        const auto r = ParseInt(tokens[1]);
        const auto c = ParseInt(tokens[2]);
        if (!r || !c)
        {
            Fail(lineNo, "invalid coordinates '" + std::string(tokens[1]) + " " + std::string(tokens[2]) + "'");
            return std::nullopt;
        }
        const pf::Coord coord{ *r, *c };
        if (!_session.grid().contains(coord))
        {
            const int n = _session.grid().size();
            Fail(lineNo, "cell (" + std::to_string(*r) + ", " + std::to_string(*c) + ") is outside the " +
                             std::to_string(n) + "x" + std::to_string(n) + " grid");
            return std::nullopt;
        }
        return coord;
    };

    auto noArgs = [&]() -> bool {
        if (argc != 0)
            return Fail(lineNo, cmd + " takes no arguments");
        return true;
    };

    if (cmd == "brush")
    {
        if (argc != 1)
            return Fail(lineNo, "brush expects one of start, end, grass, road, dirt, water, obstacle");
        const auto b = ParseBrush(tokens[1]);
        if (!b)
            return Fail(lineNo, "unknown brush '" + std::string(tokens[1]) + "'");
        _session.SelectBrush(*b);
        return true;
    }
    if (cmd == "mode")
    {
        if (argc != 1)
            return Fail(lineNo, "mode expects single or flood");
        const auto m = ParsePaintMode(tokens[1]);
        if (!m)
            return Fail(lineNo, "unknown paint mode '" + std::string(tokens[1]) + "'");
        _session.SelectPaintMode(*m);
        return true;
    }
    if (cmd == "click" || cmd == "drag" || cmd == "erase" || cmd == "inspect")
    {
        const auto c = cellArg();
        if (!c)
            return false;
        if (cmd == "click")
            (void)_session.ApplyBrush(*c);
        else if (cmd == "drag")
            (void)_session.DragPaint(*c);
        else if (cmd == "erase")
            (void)_session.Erase(*c);
        else
            _out << DescribeCell(_session.grid(), *c);
        return true;
    }
    if (cmd == "run")
    {
        if (!noArgs())
            return false;
        RunSearch();
        return true;
    }
    if (cmd == "clear")
    {
        if (!noArgs())
            return false;
        _session.Clear();
        return true;
    }
    if (cmd == "show")
    {
        if (!noArgs())
            return false;
        _out << RenderGrid(_session.grid(), _opt.view);
        return true;
    }
    if (cmd == "legend")
    {
        if (!noArgs())
            return false;
        _out << RenderLegend(_opt.view);
        return true;
    }
    if (cmd == "status")
    {
        if (!noArgs())
            return false;
        _out << _session.status() << '\n';
        return true;
    }
    if (cmd == "quit" || cmd == "exit")
    {
        _quit = true;
        return true;
    }

    return Fail(lineNo, "unknown command '" + std::string(tokens[0]) + "'");
}

void ScriptRunner::RunSearch()
{
    pf::SearchObserver hooks;
    hooks.should_cancel = _opt.shouldCancel;
    hooks.on_status = [this](std::string_view msg) { _out << "> " << msg << '\n'; };
    if (_opt.animate)
    {
        hooks.on_progress = [this](const pf::SearchProgress& p) {
            _out << RenderGrid(_session.grid(), _opt.view) << '\n';
            Pause(p.phase == pf::SearchPhase::Search ? _opt.searchStepDelayMs : _opt.pathStepDelayMs);
        };
    }

    std::optional<pf::SearchResult> result;
    {
        RunScope scope(_opt);
        result = _session.Run(hooks);
    }
    if (!result)
    {
        _out << "> " << _session.status() << '\n';
        return;
    }

    if (result->outcome == pf::SearchOutcome::Succeeded)
        _out << FormatPath(result->path);
    _out << RenderGrid(_session.grid(), _opt.view);
}

} // namespace terrainpath::app
