#include "app/SessionConfig.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace terrainpath::app {

namespace {
    // NOTE: SaveSessionConfig always writes the latest schema version.
    constexpr int kSessionConfigSchemaVersion = 1;

    constexpr std::size_t kMaxConfigBytes = 1024u * 1024u; // 1 MiB guardrail

    bool ReadFileToString(const std::filesystem::path& p, std::string& out)
    {
        out.clear();

        std::error_code ec;
        const auto size = std::filesystem::file_size(p, ec);
        if (ec || size > kMaxConfigBytes)
            return false;

        std::ifstream f(p, std::ios::binary);
        if (!f)
            return false;
        std::ostringstream oss;
        oss << f.rdbuf();
        out = oss.str();

        // Treat empty files as "no settings".
        return !out.empty();
    }

    // Only passable terrain may be the default; otherwise keep the fallback.
    pf::TerrainKind ParseDefaultTerrain(const nlohmann::json& v, pf::TerrainKind fallback)
    {
        if (!v.is_string())
            return fallback;
        const auto parsed = pf::parse_terrain(v.get<std::string>());
        if (!parsed || !pf::is_passable(*parsed))
            return fallback;
        return *parsed;
    }
}

int ClampGridSize(int v) noexcept
{
    if (v < kMinGridSize) return kMinGridSize;
    if (v > kMaxGridSize) return kMaxGridSize;
    return v;
}

int ClampStepDelay(int v) noexcept
{
    if (v < 0) return 0;
    if (v > kMaxStepDelayMs) return kMaxStepDelayMs;
    return v;
}

bool LoadSessionConfig(SessionConfig& out, const std::filesystem::path& file) noexcept
{
    try
    {
        std::string text;
        if (!ReadFileToString(file, text))
            return false;

        // Allow // comments, and avoid exceptions on malformed input.
        nlohmann::json j = nlohmann::json::parse(text, nullptr, false, /*ignore_comments*/ true);
        if (j.is_discarded() || !j.is_object())
        {
            spdlog::warn("LoadSessionConfig: {} is not a JSON object", file.string());
            return false;
        }

        if (auto v = j.find("version"); v != j.end() && v->is_number_integer() &&
            v->get<int>() > kSessionConfigSchemaVersion)
        {
            // Forward-compat: still read the keys we understand.
            spdlog::warn("LoadSessionConfig: {} has newer schema {}", file.string(), v->get<int>());
        }

        SessionConfig tmp = out;

        if (const auto it = j.find("grid"); it != j.end() && it->is_object())
        {
            if (auto s = it->find("size"); s != it->end() && s->is_number_integer())
                tmp.gridSize = ClampGridSize(s->get<int>());
            if (auto t = it->find("defaultTerrain"); t != it->end())
                tmp.defaultTerrain = ParseDefaultTerrain(*t, tmp.defaultTerrain);
        }

        if (const auto it = j.find("animation"); it != j.end() && it->is_object())
        {
            if (auto e = it->find("enabled"); e != it->end() && e->is_boolean())
                tmp.animate = e->get<bool>();
            if (auto d = it->find("searchStepDelayMs"); d != it->end() && d->is_number_integer())
                tmp.searchStepDelayMs = ClampStepDelay(d->get<int>());
            if (auto d = it->find("pathStepDelayMs"); d != it->end() && d->is_number_integer())
                tmp.pathStepDelayMs = ClampStepDelay(d->get<int>());
        }

        if (const auto it = j.find("display"); it != j.end() && it->is_object())
        {
            if (auto c = it->find("color"); c != it->end() && c->is_boolean())
                tmp.color = c->get<bool>();
        }

        if (const auto it = j.find("logging"); it != j.end() && it->is_object())
        {
            if (auto l = it->find("level"); l != it->end() && l->is_string())
                tmp.logLevel = l->get<std::string>();
            if (auto f = it->find("file"); f != it->end() && f->is_string())
                tmp.logFile = f->get<std::string>();
        }

        out = tmp;
        return true;
    }
    catch (const std::exception& e)
    {
        spdlog::warn("LoadSessionConfig: failed to read {}: {}", file.string(), e.what());
        return false;
    }
}

bool SaveSessionConfig(const SessionConfig& cfg, const std::filesystem::path& file) noexcept
{
    try
    {
        std::error_code ec;
        if (file.has_parent_path())
            std::filesystem::create_directories(file.parent_path(), ec);

        nlohmann::json j;
        j["version"] = kSessionConfigSchemaVersion;
        j["grid"] = {
            {"size", ClampGridSize(cfg.gridSize)},
            {"defaultTerrain", std::string(pf::terrain_info(cfg.defaultTerrain).key)},
        };
        j["animation"] = {
            {"enabled", cfg.animate},
            {"searchStepDelayMs", ClampStepDelay(cfg.searchStepDelayMs)},
            {"pathStepDelayMs", ClampStepDelay(cfg.pathStepDelayMs)},
        };
        j["display"] = {
            {"color", cfg.color},
        };
        j["logging"] = {
            {"level", cfg.logLevel},
            {"file", cfg.logFile},
        };

        std::ofstream f(file, std::ios::binary | std::ios::trunc);
        if (!f)
        {
            spdlog::warn("SaveSessionConfig: cannot open {}", file.string());
            return false;
        }
        f << j.dump(2) << '\n';
        return static_cast<bool>(f);
    }
    catch (const std::exception& e)
    {
        spdlog::warn("SaveSessionConfig: failed to write {}: {}", file.string(), e.what());
        return false;
    }
}

} // namespace terrainpath::app
