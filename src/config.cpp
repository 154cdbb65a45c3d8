#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("api")) {
            auto& a = j["api"];
            if (a.contains("url")) cfg.api.url = a["url"].get<std::string>();
            if (a.contains("language")) cfg.api.language = a["language"].get<std::string>();
            if (a.contains("timeout_seconds")) cfg.api.timeout_seconds = a["timeout_seconds"].get<uint32_t>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("max_seconds")) cfg.audio.max_seconds = a["max_seconds"].get<uint32_t>();
            if (a.contains("long_max_seconds")) cfg.audio.long_max_seconds = a["long_max_seconds"].get<uint32_t>();
            if (a.contains("stop_grace_ms")) cfg.audio.stop_grace_ms = a["stop_grace_ms"].get<uint32_t>();
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("auto_paste")) cfg.output.auto_paste = o["auto_paste"].get<bool>();
            if (o.contains("paste_delay_ms")) cfg.output.paste_delay_ms = o["paste_delay_ms"].get<uint32_t>();
        }

        if (j.contains("ui")) {
            auto& u = j["ui"];
            if (u.contains("indicator")) cfg.ui.indicator = u["indicator"].get<bool>();
            if (u.contains("notifications")) cfg.ui.notifications = u["notifications"].get<bool>();
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
