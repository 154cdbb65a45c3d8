#include "platform/linux/child_process.hpp"

#include "platform/linux/subprocess.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

std::expected<ChildProcess, std::string>
ChildProcess::spawn(const std::vector<std::string>& argv, const Options& opts) {
    if (argv.empty()) {
        return std::unexpected("empty command");
    }

    // Report exec failure back through a CLOEXEC pipe
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    auto args = platform::make_argv(argv);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::close(err_pipe[0]);
        platform::reset_child_signals();
        if (opts.own_process_group) ::setpgid(0, 0);

        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            if (opts.quiet) {
                ::dup2(devnull, STDOUT_FILENO);
                ::dup2(devnull, STDERR_FILENO);
            }
        }

        ::execvp(args[0], args.data());
        int err = errno;
        ssize_t ignored = ::write(err_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(err_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n == sizeof(child_errno)) {
        ::waitpid(pid, nullptr, 0);
        return std::unexpected(argv[0] + ": " + std::strerror(child_errno));
    }

    ChildProcess child;
    child.pid_ = pid;
    child.name_ = argv[0];
    child.pidfd_ = platform::open_pidfd(pid);
    return child;
}

ChildProcess::~ChildProcess() {
    close_pidfd();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), pidfd_(other.pidfd_), reaped_(other.reaped_),
      status_(other.status_), name_(std::move(other.name_)) {
    other.pid_ = -1;
    other.pidfd_ = -1;
    other.reaped_ = true;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        close_pidfd();
        pid_ = other.pid_;
        pidfd_ = other.pidfd_;
        reaped_ = other.reaped_;
        status_ = other.status_;
        name_ = std::move(other.name_);
        other.pid_ = -1;
        other.pidfd_ = -1;
        other.reaped_ = true;
    }
    return *this;
}

bool ChildProcess::alive() {
    if (pid_ <= 0 || reaped_) return false;

    int status;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == 0) return true;

    reaped_ = true;
    if (r == pid_) status_ = status;
    return false;
}

bool ChildProcess::signal(int sig) {
    if (!alive()) return false;
    return ::kill(pid_, sig) == 0;
}

bool ChildProcess::wait() {
    if (pid_ <= 0 || reaped_) return true;

    int status;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno == EINTR) continue;
        reaped_ = true;
        return false;
    }
    reaped_ = true;
    status_ = status;
    return true;
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (!signal(SIGTERM)) return;

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pidfd_ >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            pollfd pfd{.fd = pidfd_, .events = POLLIN, .revents = 0};
            int rc = ::poll(&pfd, 1, static_cast<int>(std::max<long long>(left.count(), 0)));
            if (rc < 0 && errno != EINTR) break;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        if (!alive()) return;
    }

    if (alive()) {
        ::kill(pid_, SIGKILL);
    }
    wait();
}

void ChildProcess::close_pidfd() {
    if (pidfd_ >= 0) {
        ::close(pidfd_);
        pidfd_ = -1;
    }
}
