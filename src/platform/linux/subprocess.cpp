#include "platform/linux/subprocess.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace platform {

using Clock = std::chrono::steady_clock;

int open_pidfd(pid_t pid) {
#ifdef SYS_pidfd_open
    return static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
#else
    (void)pid;
    errno = ENOSYS;
    return -1;
#endif
}

static int ms_left(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return static_cast<int>(std::max<long long>(left.count(), 0));
}

// Polls fd for input until the deadline. False once the deadline has passed.
static bool wait_readable(int fd, Clock::time_point deadline) {
    for (;;) {
        pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
        int rc = ::poll(&pfd, 1, ms_left(deadline));
        if (rc > 0) return true;
        if (rc == 0) return false;
        if (errno != EINTR) return true; // let read() report it
    }
}

// waitpid with a deadline. Returns 1 when reaped, 0 on timeout, -1 on error.
static int wait_until(pid_t pid, int& status, Clock::time_point deadline) {
    int pidfd = open_pidfd(pid);
    int outcome = 0;
    for (;;) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            outcome = 1;
            break;
        }
        if (r < 0 && errno != EINTR) {
            outcome = -1;
            break;
        }
        if (Clock::now() >= deadline) break;

        if (pidfd >= 0) {
            wait_readable(pidfd, deadline);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
    if (pidfd >= 0) {
        int saved = errno;
        ::close(pidfd);
        errno = saved;
    }
    return outcome;
}

std::vector<char*> make_argv(const std::vector<std::string>& args) {
    std::vector<char*> out;
    out.reserve(args.size() + 1);
    for (auto& a : args) out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

void reset_child_signals() {
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);

    for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGPIPE, SIGCHLD}) {
        std::signal(sig, SIG_DFL);
    }
}

std::expected<CommandResult, std::string>
run(const std::vector<std::string>& argv, const std::string& input, bool capture_output,
    std::optional<std::chrono::milliseconds> timeout) {
    if (argv.empty()) {
        return std::unexpected("empty command");
    }

    int in_pipe[2];
    if (::pipe2(in_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    int out_pipe[2] = {-1, -1};
    if (capture_output && ::pipe2(out_pipe, O_CLOEXEC) < 0) {
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    auto args = make_argv(argv);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        if (capture_output) {
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);
        }
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        reset_child_signals();
        ::dup2(in_pipe[0], STDIN_FILENO);
        if (capture_output) {
            ::dup2(out_pipe[1], STDOUT_FILENO);
        } else {
            int devnull = ::open("/dev/null", O_WRONLY);
            if (devnull >= 0) ::dup2(devnull, STDOUT_FILENO);
        }
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    auto deadline = Clock::now() + timeout.value_or(std::chrono::milliseconds(0));
    bool timed_out = false;

    ::close(in_pipe[0]);
    if (capture_output) ::close(out_pipe[1]);

    size_t total_written = 0;
    bool write_failed = false;
    while (total_written < input.size()) {
        ssize_t n = ::write(in_pipe[1], input.data() + total_written, input.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            write_failed = true;
            break;
        }
        total_written += static_cast<size_t>(n);
    }
    ::close(in_pipe[1]);

    CommandResult result;
    if (capture_output) {
        char buf[4096];
        for (;;) {
            if (timeout && !wait_readable(out_pipe[0], deadline)) {
                timed_out = true;
                break;
            }
            ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (n == 0) break;
            result.output.append(buf, static_cast<size_t>(n));
        }
        ::close(out_pipe[0]);
    }

    int status = 0;
    if (timeout) {
        int waited = timed_out ? 0 : wait_until(pid, status, deadline);
        if (waited < 0) {
            return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
        }
        if (waited == 0) {
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            return std::unexpected(argv[0] + " timed out after " +
                                   std::to_string(timeout->count()) + "ms");
        }
    } else {
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
        }
    }

    if (write_failed) {
        return std::unexpected(std::string("write() to ") + argv[0] + " failed");
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

bool spawn_detached(const std::vector<std::string>& argv) {
    if (argv.empty()) return false;

    auto args = make_argv(argv);

    pid_t pid = ::fork();
    if (pid < 0) return false;

    if (pid == 0) {
        reset_child_signals();
        ::setsid();

        // Fork again so the grandchild is reparented and never becomes our zombie
        pid_t inner = ::fork();
        if (inner < 0) ::_exit(1);
        if (inner > 0) ::_exit(0);

        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

} // namespace platform
