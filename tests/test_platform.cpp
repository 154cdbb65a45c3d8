#include <catch2/catch_test_macros.hpp>

#include "cancel_token.hpp"
#include "platform/linux/linux_host_probe.hpp"
#include "platform/linux/subprocess.hpp"
#include "platform/platform_paths.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <unistd.h>

using namespace std::chrono_literals;

TEST_CASE("LinuxHostProbe", "[platform]") {
    LinuxHostProbe probe;

    SECTION("FindsShellOnPath") {
        REQUIRE(probe.has_command("sh"));
        REQUIRE_FALSE(probe.has_command("conduit-no-such-command-xyz"));
        REQUIRE_FALSE(probe.has_command(""));
    }

    SECTION("AbsolutePath") {
        REQUIRE(probe.has_command("/bin/sh"));
    }

    SECTION("OwnProcessIsRunning") {
        auto comm = LinuxHostProbe::read_comm(::getpid());
        REQUIRE_FALSE(comm.empty());
        REQUIRE(probe.is_running(comm));
        REQUIRE_FALSE(probe.is_running("conduit-no-such-process"));
    }

    SECTION("Env") {
        ::setenv("CONDUIT_TEST_VAR", "value", 1);
        REQUIRE(probe.env("CONDUIT_TEST_VAR") == "value");
        ::unsetenv("CONDUIT_TEST_VAR");
        REQUIRE(probe.env("CONDUIT_TEST_VAR").empty());
    }
}

TEST_CASE("platform::run", "[platform]") {

    SECTION("CapturesOutput") {
        auto r = platform::run({"sh", "-c", "echo hi"}, {}, true);
        REQUIRE(r.has_value());
        REQUIRE(r->exit_code == 0);
        REQUIRE(r->output == "hi\n");
    }

    SECTION("FeedsInput") {
        auto r = platform::run({"cat"}, "clipboard text", true);
        REQUIRE(r.has_value());
        REQUIRE(r->output == "clipboard text");
    }

    SECTION("ExitCode") {
        auto r = platform::run({"sh", "-c", "exit 4"});
        REQUIRE(r.has_value());
        REQUIRE(r->exit_code == 4);
    }

    SECTION("MissingCommand") {
        auto r = platform::run({"conduit-no-such-command-xyz"});
        REQUIRE(r.has_value());
        REQUIRE(r->exit_code == 127);
    }

    SECTION("EmptyArgv") {
        REQUIRE_FALSE(platform::run({}).has_value());
    }

    SECTION("FinishesWithinTimeout") {
        auto r = platform::run({"sh", "-c", "echo quick"}, {}, true, 2000ms);
        REQUIRE(r.has_value());
        REQUIRE(r->output == "quick\n");
    }

    SECTION("HungChildIsKilledAtDeadline") {
        auto start = std::chrono::steady_clock::now();
        auto r = platform::run({"sleep", "3600"}, {}, false, 200ms);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().find("timed out") != std::string::npos);
        REQUIRE(elapsed < 5s);
    }

    SECTION("HungChildWhileCapturing") {
        auto start = std::chrono::steady_clock::now();
        auto r = platform::run({"sh", "-c", "echo partial; exec sleep 3600"}, {}, true, 200ms);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    }
}

TEST_CASE("CancelToken", "[platform]") {

    SECTION("NotCancelledInitially") {
        CancelToken token;
        REQUIRE(token.valid());
        REQUIRE_FALSE(token.cancelled());
        REQUIRE(token.signo() == 0);
    }

    SECTION("SignalBecomesCancellation") {
        CancelToken token;
        ::raise(SIGTERM);
        REQUIRE(token.cancelled());
        REQUIRE(token.signo() == SIGTERM);
        // Latched
        REQUIRE(token.cancelled());
    }
}

TEST_CASE("Platform paths", "[platform]") {

    SECTION("XdgOverrides") {
        ::setenv("XDG_CONFIG_HOME", "/tmp/cfg", 1);
        ::setenv("XDG_DATA_HOME", "/tmp/data", 1);
        REQUIRE(platform::config_dir() == "/tmp/cfg/conduit");
        REQUIRE(platform::data_dir() == "/tmp/data/conduit");

        auto candidates = platform::credential_candidates();
        REQUIRE_FALSE(candidates.empty());
        REQUIRE(candidates.back() == "/tmp/cfg/conduit/.env");
        ::unsetenv("XDG_CONFIG_HOME");
        ::unsetenv("XDG_DATA_HOME");
    }

    SECTION("ExecutableDirComesFirst") {
        auto exe = platform::executable_dir();
        REQUIRE_FALSE(exe.empty());
        REQUIRE(platform::credential_candidates().front() == exe + "/.env");
    }
}
