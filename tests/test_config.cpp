#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "conduit_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.api.url == "https://api.groq.com/openai/v1/audio/transcriptions");
        REQUIRE(cfg.api.language == "en");
        REQUIRE(cfg.api.timeout_seconds == 30);
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.audio.max_seconds == 120);
        REQUIRE(cfg.audio.long_max_seconds == 300);
        REQUIRE(cfg.audio.stop_grace_ms == 3000);
        REQUIRE(cfg.output.auto_paste);
        REQUIRE(cfg.output.paste_delay_ms == 200);
        REQUIRE(cfg.ui.indicator);
        REQUIRE(cfg.ui.notifications);
        REQUIRE(cfg.history.enabled);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "api": {
                "url": "http://localhost:9000/v1/audio/transcriptions",
                "language": "de",
                "timeout_seconds": 60
            },
            "audio": { "max_seconds": 45, "long_max_seconds": 600, "stop_grace_ms": 500 },
            "output": { "auto_paste": false, "paste_delay_ms": 350 },
            "ui": { "indicator": false, "notifications": false },
            "history": { "enabled": false }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.api.url == "http://localhost:9000/v1/audio/transcriptions");
        REQUIRE(cfg.api.language == "de");
        REQUIRE(cfg.api.timeout_seconds == 60);
        REQUIRE(cfg.audio.max_seconds == 45);
        REQUIRE(cfg.audio.long_max_seconds == 600);
        REQUIRE(cfg.audio.stop_grace_ms == 500);
        REQUIRE_FALSE(cfg.output.auto_paste);
        REQUIRE(cfg.output.paste_delay_ms == 350);
        REQUIRE_FALSE(cfg.ui.indicator);
        REQUIRE_FALSE(cfg.ui.notifications);
        REQUIRE_FALSE(cfg.history.enabled);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "api": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.api.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.api.timeout_seconds == 30);
        REQUIRE(cfg.audio.max_seconds == 120);
        REQUIRE(cfg.output.auto_paste);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.api.language == "en");
        REQUIRE(cfg.audio.max_seconds == 120);
    }

    SECTION("WrongTypeKeepsEarlierValues") {
        TmpFile f(R"({ "api": { "language": "es" }, "audio": { "max_seconds": "lots" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.api.language == "es");
        REQUIRE(cfg.audio.max_seconds == 120);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/conduit_test_nonexistent_config_file.json");
        REQUIRE(cfg.api.language == "en");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }
}
