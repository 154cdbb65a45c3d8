#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

// A child process started with fork/exec and reaped by its owner.
// Move-only; the destructor closes the pidfd but never signals the child.
class ChildProcess {
public:
    struct Options {
        bool own_process_group = true;
        bool quiet = false; // stdout/stderr to /dev/null
    };

    static std::expected<ChildProcess, std::string>
        spawn(const std::vector<std::string>& argv, const Options& opts);
    static std::expected<ChildProcess, std::string>
        spawn(const std::vector<std::string>& argv) { return spawn(argv, Options{}); }

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }

    // Readable once the child has exited; -1 if pidfd_open is unavailable.
    int pidfd() const { return pidfd_; }

    const std::string& name() const { return name_; }

    // Non-blocking liveness probe. Reaps the child if it has exited.
    bool alive();

    // Sends sig if the child is still alive. Returns false if it was not.
    bool signal(int sig);

    // Blocks until the child exits. Returns false on waitpid failure.
    bool wait();

    // SIGTERM, wait up to `grace`, then SIGKILL. Always reaps.
    void terminate(std::chrono::milliseconds grace);

    bool reaped() const { return reaped_; }

    // Raw waitpid status, set once reaped.
    std::optional<int> status() const { return status_; }

private:
    void close_pidfd();

    pid_t pid_ = -1;
    int pidfd_ = -1;
    bool reaped_ = false;
    std::optional<int> status_;
    std::string name_;
};
