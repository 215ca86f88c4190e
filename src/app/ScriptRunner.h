#pragma once

#include "app/Session.h"
#include "app/TextView.h"

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string_view>

namespace terrainpath::app {

struct ScriptOptions
{
    TextViewOptions view{};

    // Redraw after every search/path step, pausing for the step delay.
    bool animate = false;
    int searchStepDelayMs = 20;
    int pathStepDelayMs = 30;

    // Polled once per search iteration (e.g. a SIGINT flag).
    std::function<bool()> shouldCancel;

    // Called around every `run`, also when it is refused or throws. The CLI
    // uses them to arm Ctrl+C as a cancel request only while a search runs.
    std::function<void()> onRunBegin;
    std::function<void()> onRunEnd;
};

// Drives a Session from line commands:
//
//   brush <start|end|grass|road|dirt|water|obstacle>
//   mode <single|flood>
//   click <row> <col>      drag <row> <col>      erase <row> <col>
//   run | clear | show | legend | status | inspect <row> <col> | quit
//
// Blank lines and lines starting with '#' are skipped. A bad line is reported
// on `err` with its line number and counted; execution continues.
class ScriptRunner
{
public:
    ScriptRunner(Session& session, std::ostream& out, std::ostream& err, ScriptOptions opt = {});

    // Runs until end of input or `quit`. Returns the number of failed lines.
    std::size_t RunStream(std::istream& in);

    // Returns false if the line failed.
    bool ExecuteLine(std::string_view line, std::size_t lineNo);

    [[nodiscard]] std::size_t errors() const noexcept { return _errors; }
    [[nodiscard]] bool quitRequested() const noexcept { return _quit; }

private:
    bool Fail(std::size_t lineNo, std::string_view msg);
    void RunSearch();

    Session& _session;
    std::ostream& _out;
    std::ostream& _err;
    ScriptOptions _opt;
    std::size_t _errors = 0;
    bool _quit = false;
};

} // namespace terrainpath::app
