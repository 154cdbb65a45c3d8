#include <catch2/catch_test_macros.hpp>

#include "audio/backend_selector.hpp"
#include "audio/recorders.hpp"
#include "fakes.hpp"

#include <algorithm>

TEST_CASE("AudioBackendSelector", "[audio]") {
    FakeHostProbe probe;

    SECTION("PrefersPipeWireWhenLive") {
        probe.commands = {"pw-record", "parecord", "arecord", "rec"};
        probe.processes = {"pipewire", "pulseaudio"};

        AudioBackendSelector sel(probe, default_recorders());
        auto cap = sel.select();
        REQUIRE(cap.has_value());
        REQUIRE((*cap)->tool() == "pw-record");
    }

    SECTION("PulseViaPipeWirePulse") {
        probe.commands = {"parecord", "arecord"};
        probe.processes = {"pipewire-pulse"};

        AudioBackendSelector sel(probe, default_recorders());
        auto cap = sel.select();
        REQUIRE(cap.has_value());
        REQUIRE((*cap)->tool() == "parecord");
    }

    SECTION("InstalledToolWithDeadDaemonSkipped") {
        // pw-record is installed but nothing is running; arecord needs no daemon
        probe.commands = {"pw-record", "arecord"};

        AudioBackendSelector sel(probe, default_recorders());
        auto cap = sel.select();
        REQUIRE(cap.has_value());
        REQUIRE((*cap)->tool() == "arecord");
    }

    SECTION("SoxAsLastResort") {
        probe.commands = {"rec"};

        AudioBackendSelector sel(probe, default_recorders());
        auto cap = sel.select();
        REQUIRE(cap.has_value());
        REQUIRE((*cap)->tool() == "rec");
    }

    SECTION("FallsBackToInstalledToolWithoutLiveDaemon") {
        probe.commands = {"parecord"};

        AudioBackendSelector sel(probe, default_recorders());
        auto cap = sel.select();
        REQUIRE(cap.has_value());
        REQUIRE((*cap)->tool() == "parecord");
    }

    SECTION("NothingInstalled") {
        probe.processes = {"pipewire"};

        AudioBackendSelector sel(probe, default_recorders());
        auto cap = sel.select();
        REQUIRE_FALSE(cap.has_value());
        REQUIRE(cap.error().find("no audio recording tool") != std::string::npos);
    }

    SECTION("CandidateCount") {
        AudioBackendSelector sel(probe, default_recorders());
        REQUIRE(sel.candidate_count() == 4);
    }
}

TEST_CASE("Recorder commands", "[audio]") {
    AudioFormat fmt;
    const std::string out = "/tmp/out.wav";

    auto has = [](const std::vector<std::string>& argv, const std::string& arg) {
        return std::find(argv.begin(), argv.end(), arg) != argv.end();
    };

    SECTION("PipeWire") {
        PipeWireRecorder r;
        auto argv = r.command(out, fmt, 120);
        REQUIRE(argv.front() == "pw-record");
        REQUIRE(has(argv, "--rate=16000"));
        REQUIRE(has(argv, "--channels=1"));
        REQUIRE(argv.back() == out);
        REQUIRE(r.stop_method() == StopMethod::Signal);
        REQUIRE(r.daemons() == std::vector<std::string>{"pipewire"});
    }

    SECTION("Pulse") {
        PulseRecorder r;
        auto argv = r.command(out, fmt, 120);
        REQUIRE(argv.front() == "parecord");
        REQUIRE(has(argv, "--file-format=wav"));
        REQUIRE(r.stop_method() == StopMethod::Signal);
    }

    SECTION("AlsaStopsItself") {
        AlsaRecorder r;
        auto argv = r.command(out, fmt, 45);
        REQUIRE(argv.front() == "arecord");
        REQUIRE(has(argv, "-d"));
        REQUIRE(has(argv, "45"));
        REQUIRE(r.daemons().empty());
        REQUIRE(r.stop_method() == StopMethod::BuiltIn);
    }

    SECTION("SoxTrimsToLimit") {
        SoxRecorder r;
        auto argv = r.command(out, fmt, 30);
        REQUIRE(argv.front() == "rec");
        REQUIRE(has(argv, "trim"));
        REQUIRE(argv.back() == "30");
        REQUIRE(r.stop_method() == StopMethod::BuiltIn);
    }
}
