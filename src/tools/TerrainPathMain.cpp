// src/tools/TerrainPathMain.cpp
//
// terrainpath command-line host
// -----------------------------
// Headless front end for the pathfinding session:
// - Loads terrainpath.json (or --config), applies command-line overrides
// - Reads paint/run commands from --script or standard input
// - Prints the grid as text, optionally animated and coloured
// - Ctrl+C cancels a running search; between runs it ends the process

#include "app/CommandLineArgs.h"
#include "app/ScriptRunner.h"
#include "app/Session.h"
#include "app/SessionConfig.h"
#include "logging/Log.h"

#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace
{
    volatile std::sig_atomic_t g_cancelRequested = 0;

    void OnInterrupt(int)
    {
        g_cancelRequested = 1;
    }

    // Ctrl+C cancels only while a search runs. Outside a run the default
    // handler is in place, so it ends the process as usual, and a stale
    // request can never cancel the next run.
    void ArmCancel()
    {
        g_cancelRequested = 0;
        std::signal(SIGINT, OnInterrupt);
    }

    void DisarmCancel()
    {
        std::signal(SIGINT, SIG_DFL);
        g_cancelRequested = 0;
    }

    bool CancelRequested()
    {
        return g_cancelRequested != 0;
    }

    void ApplyOverrides(terrainpath::app::SessionConfig& cfg, const terrainpath::app::CommandLineArgs& args)
    {
        if (args.gridSize)
            cfg.gridSize = terrainpath::app::ClampGridSize(*args.gridSize);
        if (args.animate)
            cfg.animate = *args.animate;
        if (args.color)
            cfg.color = *args.color;
        if (args.logLevel)
            cfg.logLevel = *args.logLevel;
        if (args.logFile)
            cfg.logFile = *args.logFile;
    }
}

int main(int argc, char** argv)
{
    using namespace terrainpath;

    const app::CommandLineArgs args = app::ParseCommandLineArgs(argc, argv);
    if (args.showHelp)
    {
        std::cout << app::BuildCommandLineHelpText();
        return 0;
    }
    if (!args.unknown.empty())
    {
        for (const auto& u : args.unknown)
            std::cerr << "Unknown or incomplete option: " << u << "\n";
        std::cerr << "Use --help for usage.\n";
        return 1;
    }

    try
    {
        app::SessionConfig cfg;
        if (args.configPath)
        {
            if (!app::LoadSessionConfig(cfg, *args.configPath))
                std::cerr << "Could not load config " << *args.configPath << ", using defaults\n";
        }
        else if (std::filesystem::exists(app::kDefaultConfigFileName))
        {
            (void)app::LoadSessionConfig(cfg, app::kDefaultConfigFileName);
        }
        ApplyOverrides(cfg, args);

        logsys::LogOptions logOpt;
        logOpt.file = cfg.logFile;
        const bool levelOk = logsys::parse_level(cfg.logLevel, logOpt.level);
        logsys::init(logOpt);
        if (!levelOk)
            spdlog::warn("Unknown log level '{}', using info", cfg.logLevel);

        app::Session session(app::ClampGridSize(cfg.gridSize), cfg.defaultTerrain);
        spdlog::info("Session started: {}x{} grid", session.grid().size(), session.grid().size());

        app::ScriptOptions opt;
        opt.view.color = cfg.color;
        opt.animate = cfg.animate;
        opt.searchStepDelayMs = cfg.searchStepDelayMs;
        opt.pathStepDelayMs = cfg.pathStepDelayMs;
        opt.shouldCancel = CancelRequested;
        opt.onRunBegin = ArmCancel;
        opt.onRunEnd = DisarmCancel;

        app::ScriptRunner runner(session, std::cout, std::cerr, opt);
        std::size_t errors = 0;
        if (args.scriptPath)
        {
            std::ifstream in(*args.scriptPath);
            if (!in)
            {
                spdlog::error("Cannot open script {}", *args.scriptPath);
                return 2;
            }
            errors = runner.RunStream(in);
        }
        else
        {
            errors = runner.RunStream(std::cin);
        }

        spdlog::info("Session finished with {} script error(s)", errors);
        spdlog::shutdown();
        return errors > 0 ? 3 : 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 2;
    }
}
