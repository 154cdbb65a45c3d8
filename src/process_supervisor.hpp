#pragma once

#include "audio/capability.hpp"
#include "cancel_token.hpp"
#include "indicator/indicator.hpp"
#include "platform/linux/child_process.hpp"
#include "session.hpp"

#include <chrono>
#include <expected>
#include <string>

struct ExitOutcome {
    enum class Kind { Completed, StoppedByUser, TimedOut, Failed, Cancelled };

    Kind kind = Kind::Completed;
    int exit_status = 0; // exit code, or 128 + signal number
    double duration_s = 0.0;

    // Timeout counts as a partial recording, not an error.
    bool recorded() const {
        return kind == Kind::Completed || kind == Kind::StoppedByUser || kind == Kind::TimedOut;
    }
};

const char* to_string(ExitOutcome::Kind kind);

// Runs the recorder and the optional status indicator as children of the
// control thread and waits on both plus the cancel token with epoll.
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(CancelToken& cancel,
                               std::chrono::milliseconds grace = std::chrono::milliseconds(3000),
                               AudioFormat format = {});

    // Starts the recorder writing to session.audio_file(). The child is owned
    // by the session's janitor.
    std::expected<ChildProcess*, std::string>
        start(RecordingSession& session, const AudioCapability& cap,
              std::chrono::seconds max_duration);

    // Starts the status indicator linked to the running recorder.
    std::expected<ChildProcess*, std::string>
        start_indicator(RecordingSession& session, const IndicatorCapability& indicator);

    // Blocks until the recorder exits, the limit expires or the token is
    // cancelled. The indicator is always torn down after the recorder.
    ExitOutcome wait(RecordingSession& session);

    // SIGTERM if still alive; no-op otherwise.
    void stop(ChildProcess* handle);

    bool is_alive(ChildProcess* handle) const;

    // An indicator exiting unsuccessfully this soon after start failed to
    // come up (no display, toolkit error) rather than being dismissed.
    static constexpr std::chrono::milliseconds INDICATOR_STARTUP{1000};

private:
    ExitOutcome classify(const RecordingSession& session, bool timed_out) const;
    bool indicator_failed_early(const ChildProcess& indicator) const;

    CancelToken& cancel_;
    std::chrono::milliseconds grace_;
    AudioFormat format_;
    StopMethod stop_method_ = StopMethod::Signal;
    std::chrono::steady_clock::time_point indicator_start_{};
};
