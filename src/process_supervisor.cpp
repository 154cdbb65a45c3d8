#include "process_supervisor.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <print>
#include <sys/epoll.h>
#include <sys/wait.h>
#include <unistd.h>

using clock_type = std::chrono::steady_clock;

const char* to_string(ExitOutcome::Kind kind) {
    switch (kind) {
        case ExitOutcome::Kind::Completed:     return "completed";
        case ExitOutcome::Kind::StoppedByUser: return "stopped";
        case ExitOutcome::Kind::TimedOut:      return "timed out";
        case ExitOutcome::Kind::Failed:        return "failed";
        case ExitOutcome::Kind::Cancelled:     return "cancelled";
    }
    return "unknown";
}

ProcessSupervisor::ProcessSupervisor(CancelToken& cancel, std::chrono::milliseconds grace,
                                     AudioFormat format)
    : cancel_(cancel), grace_(grace), format_(format) {}

std::expected<ChildProcess*, std::string>
ProcessSupervisor::start(RecordingSession& session, const AudioCapability& cap,
                         std::chrono::seconds max_duration) {
    if (session.recorder) {
        return std::unexpected("recorder already started");
    }

    auto argv = cap.command(session.audio_file().string(), format_,
                            static_cast<uint32_t>(max_duration.count()));
    auto child = ChildProcess::spawn(argv, ChildProcess::Options{.own_process_group = true, .quiet = true});
    if (!child) {
        return std::unexpected("failed to start " + cap.tool() + ": " + child.error());
    }

    stop_method_ = cap.stop_method();
    session.recorder = &session.janitor().adopt(std::move(*child));
    session.record_start = clock_type::now();
    session.limit = max_duration;
    session.deadline = session.record_start + max_duration;
    if (stop_method_ == StopMethod::BuiltIn) {
        // The tool stops itself; the deadline is only a backstop
        session.deadline += grace_;
    }
    session.stop_requested = false;
    return session.recorder;
}

std::expected<ChildProcess*, std::string>
ProcessSupervisor::start_indicator(RecordingSession& session,
                                   const IndicatorCapability& indicator) {
    if (!session.recorder || !session.recorder->alive()) {
        return std::unexpected("no running recorder to link the indicator to");
    }
    if (session.indicator) {
        return std::unexpected("indicator already started");
    }

    auto argv = indicator.command(static_cast<int>(session.limit.count()));
    auto child = ChildProcess::spawn(argv, ChildProcess::Options{.own_process_group = true, .quiet = true});
    if (!child) {
        return std::unexpected("failed to start " + indicator.name() + ": " + child.error());
    }

    session.indicator = &session.janitor().adopt(std::move(*child));
    indicator_start_ = clock_type::now();
    return session.indicator;
}

ExitOutcome ProcessSupervisor::wait(RecordingSession& session) {
    ChildProcess* rec = session.recorder;
    if (!rec) {
        return {.kind = ExitOutcome::Kind::Failed, .exit_status = -1, .duration_s = 0.0};
    }

    int epoll_fd = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd < 0) {
        std::println(stderr, "supervisor: epoll_create1 failed: {}", std::strerror(errno));
    }

    auto add_fd = [epoll_fd](int fd) {
        if (epoll_fd < 0 || fd < 0) return;
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        epoll_ctl(epoll_fd, EPOLL_CTL_ADD, fd, &ev);
    };

    add_fd(cancel_.fd());
    add_fd(rec->pidfd());
    bool indicator_live = session.indicator != nullptr;
    if (indicator_live) add_fd(session.indicator->pidfd());

    // Without pidfds or epoll, fall back to polling liveness
    bool need_polling = epoll_fd < 0 || rec->pidfd() < 0 ||
                        (session.indicator && session.indicator->pidfd() < 0);

    bool timed_out = false;
    bool cancelled = false;
    bool killed = false;
    clock_type::time_point grace_deadline{};

    constexpr int MAX_EVENTS = 4;
    epoll_event events[MAX_EVENTS];

    while (rec->alive()) {
        auto now = clock_type::now();

        if (!timed_out && !session.stop_requested && now >= session.deadline) {
            std::println(stderr, "supervisor: recording limit of {}s reached, stopping {}",
                         session.limit.count(), rec->name());
            timed_out = true;
            session.stop_requested = true;
            rec->signal(SIGTERM);
            grace_deadline = now + grace_;
        } else if (session.stop_requested && !killed && now >= grace_deadline) {
            std::println(stderr, "supervisor: {} ignored SIGTERM, killing", rec->name());
            rec->signal(SIGKILL);
            killed = true;
        }

        auto next = session.stop_requested ? grace_deadline : session.deadline;
        auto wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(next - now).count();
        if (killed) wait_ms = 100;
        if (need_polling) wait_ms = std::min<long long>(wait_ms, 50);
        wait_ms = std::max<long long>(wait_ms, 0);

        int n = 0;
        if (epoll_fd >= 0) {
            n = epoll_wait(epoll_fd, events, MAX_EVENTS, static_cast<int>(wait_ms));
            if (n < 0) {
                if (errno == EINTR) continue;
                std::println(stderr, "supervisor: epoll_wait error: {}", std::strerror(errno));
                need_polling = true;
                n = 0;
            }
        } else {
            ::usleep(static_cast<useconds_t>(wait_ms) * 1000);
        }

        for (int i = 0; i < n; i++) {
            if (events[i].data.fd == cancel_.fd() && cancel_.cancelled()) {
                cancelled = true;
            }
        }
        if (epoll_fd < 0 && cancel_.cancelled()) cancelled = true;

        if (cancelled) {
            std::println(stderr, "supervisor: cancelled, stopping {}", rec->name());
            rec->terminate(grace_);
            break;
        }

        if (indicator_live && !session.indicator->alive()) {
            indicator_live = false;
            if (epoll_fd >= 0 && session.indicator->pidfd() >= 0) {
                epoll_ctl(epoll_fd, EPOLL_CTL_DEL, session.indicator->pidfd(), nullptr);
            }
            if (indicator_failed_early(*session.indicator)) {
                std::println(stderr, "supervisor: {} exited unsuccessfully within {}ms of starting, "
                                     "recording continues",
                             session.indicator->name(), INDICATOR_STARTUP.count());
            } else if (rec->alive() && !session.stop_requested) {
                std::println(stderr, "supervisor: stop requested from indicator");
                session.stop_requested = true;
                rec->signal(SIGTERM);
                grace_deadline = clock_type::now() + grace_;
            }
        }
    }

    if (epoll_fd >= 0) ::close(epoll_fd);

    session.record_end = clock_type::now();

    // Only now that the recorder is gone may the indicator go
    if (session.indicator && session.indicator->alive()) {
        session.indicator->terminate(grace_);
    }

    if (cancelled) {
        return {.kind = ExitOutcome::Kind::Cancelled,
                .exit_status = 128 + cancel_.signo(),
                .duration_s = session.recording_duration()};
    }

    return classify(session, timed_out);
}

ExitOutcome ProcessSupervisor::classify(const RecordingSession& session, bool timed_out) const {
    ExitOutcome out;
    out.duration_s = session.recording_duration();

    int status = session.recorder->status().value_or(0);
    bool exited = WIFEXITED(status);
    int code = exited ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    out.exit_status = code;

    if (timed_out) {
        out.kind = ExitOutcome::Kind::TimedOut;
    } else if (session.stop_requested) {
        out.kind = ExitOutcome::Kind::StoppedByUser;
    } else if (exited && code == 0) {
        bool hit_limit = stop_method_ == StopMethod::BuiltIn &&
                         out.duration_s + 0.5 >= static_cast<double>(session.limit.count());
        out.kind = hit_limit ? ExitOutcome::Kind::TimedOut : ExitOutcome::Kind::Completed;
    } else if (exited && code == 124) {
        // timeout(1) convention
        out.kind = ExitOutcome::Kind::TimedOut;
    } else if (!exited && (WTERMSIG(status) == SIGTERM || WTERMSIG(status) == SIGINT)) {
        out.kind = ExitOutcome::Kind::StoppedByUser;
    } else {
        out.kind = ExitOutcome::Kind::Failed;
    }
    return out;
}

bool ProcessSupervisor::indicator_failed_early(const ChildProcess& indicator) const {
    if (clock_type::now() - indicator_start_ >= INDICATOR_STARTUP) return false;

    int status = indicator.status().value_or(0);
    return !(WIFEXITED(status) && WEXITSTATUS(status) == 0);
}

void ProcessSupervisor::stop(ChildProcess* handle) {
    if (!handle || !handle->alive()) return;
    handle->signal(SIGTERM);
}

bool ProcessSupervisor::is_alive(ChildProcess* handle) const {
    return handle && handle->alive();
}
