#include <catch2/catch_test_macros.hpp>

#include "cancel_token.hpp"
#include "fakes.hpp"
#include "process_supervisor.hpp"
#include "resource_janitor.hpp"
#include "session.hpp"

#include <csignal>

using namespace std::chrono_literals;

TEST_CASE("ProcessSupervisor", "[supervisor]") {
    CancelToken cancel;
    REQUIRE(cancel.valid());

    TmpDir dir;
    ResourceJanitor janitor(nullptr, dir.path, 500ms);
    RecordingSession session(janitor);
    REQUIRE(session.open().has_value());

    ProcessSupervisor sup(cancel, 500ms);

    SECTION("CompletedRecording") {
        ScriptRecorder rec(R"(printf 'audio' > "$1")");
        auto handle = sup.start(session, rec, 10s);
        REQUIRE(handle.has_value());

        auto out = sup.wait(session);
        REQUIRE(out.kind == ExitOutcome::Kind::Completed);
        REQUIRE(out.exit_status == 0);
        REQUIRE(out.recorded());
        REQUIRE_FALSE(sup.is_alive(*handle));
        REQUIRE(std::filesystem::file_size(session.audio_file()) == 5);
    }

    SECTION("NonZeroExitIsFailure") {
        ScriptRecorder rec("exit 3");
        REQUIRE(sup.start(session, rec, 10s).has_value());

        auto out = sup.wait(session);
        REQUIRE(out.kind == ExitOutcome::Kind::Failed);
        REQUIRE(out.exit_status == 3);
        REQUIRE_FALSE(out.recorded());
    }

    SECTION("MissingToolIsFailure") {
        class Missing : public ScriptRecorder {
        public:
            Missing() : ScriptRecorder("") {}
            std::vector<std::string> command(const std::string&, const AudioFormat&,
                                             uint32_t) const override {
                return {"/nonexistent/conduit-recorder"};
            }
        } rec;
        REQUIRE_FALSE(sup.start(session, rec, 10s).has_value());
        REQUIRE(session.recorder == nullptr);
    }

    SECTION("TimeoutSendsSigterm") {
        ScriptRecorder rec(R"(printf 'partial' > "$1"; exec sleep 30)");
        auto handle = sup.start(session, rec, 1s);
        REQUIRE(handle.has_value());

        auto out = sup.wait(session);
        REQUIRE(out.kind == ExitOutcome::Kind::TimedOut);
        REQUIRE(out.recorded());
        REQUIRE(out.duration_s >= 0.9);
        REQUIRE(out.duration_s < 5.0);
        REQUIRE_FALSE(sup.is_alive(*handle));
    }

    SECTION("IgnoredSigtermEscalatesToKill") {
        ScriptRecorder rec("trap '' TERM; while :; do sleep 0.1; done");
        auto handle = sup.start(session, rec, 1s);
        REQUIRE(handle.has_value());

        auto out = sup.wait(session);
        REQUIRE(out.kind == ExitOutcome::Kind::TimedOut);
        REQUIRE(out.exit_status == 128 + SIGKILL);
        REQUIRE(out.duration_s < 5.0);
        REQUIRE_FALSE(sup.is_alive(*handle));
    }

    SECTION("IndicatorExitStopsRecorder") {
        ScriptRecorder rec("exec sleep 30");
        ScriptIndicator ind("sleep 0.2");
        auto handle = sup.start(session, rec, 20s);
        REQUIRE(handle.has_value());
        REQUIRE(sup.start_indicator(session, ind).has_value());

        auto out = sup.wait(session);
        REQUIRE(out.kind == ExitOutcome::Kind::StoppedByUser);
        REQUIRE(out.recorded());
        REQUIRE(out.duration_s < 5.0);
        REQUIRE_FALSE(sup.is_alive(*handle));
    }

    SECTION("IndicatorThatFailsToStartKeepsRecording") {
        ScriptRecorder rec(R"(sleep 1.5; printf 'audio' > "$1")");
        ScriptIndicator ind("exit 1");
        auto handle = sup.start(session, rec, 20s);
        REQUIRE(handle.has_value());
        REQUIRE(sup.start_indicator(session, ind).has_value());

        auto out = sup.wait(session);
        REQUIRE(out.kind == ExitOutcome::Kind::Completed);
        REQUIRE(out.exit_status == 0);
        REQUIRE(out.duration_s >= 1.0);
        REQUIRE(std::filesystem::file_size(session.audio_file()) == 5);
    }

    SECTION("IndicatorDismissedLaterStopsRecorder") {
        ScriptRecorder rec("exec sleep 30");
        ScriptIndicator ind("sleep 1.3; exit 1");
        auto handle = sup.start(session, rec, 20s);
        REQUIRE(handle.has_value());
        REQUIRE(sup.start_indicator(session, ind).has_value());

        auto out = sup.wait(session);
        REQUIRE(out.kind == ExitOutcome::Kind::StoppedByUser);
        REQUIRE(out.recorded());
        REQUIRE_FALSE(sup.is_alive(*handle));
    }

    SECTION("RecorderExitTearsDownIndicator") {
        ScriptRecorder rec("sleep 0.2");
        ScriptIndicator ind("exec sleep 30");
        REQUIRE(sup.start(session, rec, 20s).has_value());
        auto ind_handle = sup.start_indicator(session, ind);
        REQUIRE(ind_handle.has_value());

        auto out = sup.wait(session);
        REQUIRE(out.kind == ExitOutcome::Kind::Completed);
        REQUIRE_FALSE(sup.is_alive(*ind_handle));
    }

    SECTION("IndicatorNeedsRunningRecorder") {
        ScriptIndicator ind("exec sleep 30");
        REQUIRE_FALSE(sup.start_indicator(session, ind).has_value());
        REQUIRE(session.indicator == nullptr);
    }

    SECTION("CancelWhileWaiting") {
        ScriptRecorder rec("sleep 0.3; kill -INT $PPID; exec sleep 30");
        ScriptIndicator ind("exec sleep 30");
        auto handle = sup.start(session, rec, 20s);
        REQUIRE(handle.has_value());
        auto ind_handle = sup.start_indicator(session, ind);
        REQUIRE(ind_handle.has_value());

        auto out = sup.wait(session);
        REQUIRE(out.kind == ExitOutcome::Kind::Cancelled);
        REQUIRE_FALSE(out.recorded());
        REQUIRE(cancel.signo() == SIGINT);
        REQUIRE_FALSE(sup.is_alive(*handle));
        REQUIRE_FALSE(sup.is_alive(*ind_handle));
    }

    SECTION("StopIsIdempotent") {
        ScriptRecorder rec("exec sleep 30");
        auto handle = sup.start(session, rec, 20s);
        REQUIRE(handle.has_value());

        sup.stop(*handle);
        auto out = sup.wait(session);
        REQUIRE(out.kind == ExitOutcome::Kind::StoppedByUser);

        // Already dead and reaped: no signal, no error
        sup.stop(*handle);
        sup.stop(nullptr);
        REQUIRE_FALSE(sup.is_alive(*handle));
        REQUIRE_FALSE(sup.is_alive(nullptr));
    }

    SECTION("SecondStartRefused") {
        ScriptRecorder rec("exec sleep 30");
        REQUIRE(sup.start(session, rec, 20s).has_value());
        REQUIRE_FALSE(sup.start(session, rec, 20s).has_value());
    }
}
