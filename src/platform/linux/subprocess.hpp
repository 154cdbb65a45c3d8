#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace platform {

struct CommandResult {
    int exit_code = 0;
    std::string output; // stdout, only when captured
};

// Upper bound for desktop helpers (clipboard, focus, keystroke tools).
inline constexpr std::chrono::milliseconds HELPER_TIMEOUT{2000};

// Runs argv to completion. `input` is written to the child's stdin.
// Exit code 127 means the command could not be executed.
// With a timeout, a child still running at the deadline is SIGKILLed and
// the call fails.
std::expected<CommandResult, std::string>
run(const std::vector<std::string>& argv, const std::string& input = {},
    bool capture_output = false,
    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

// Starts argv fully detached (double fork, new session, stdio on /dev/null)
// and returns without waiting for it.
bool spawn_detached(const std::vector<std::string>& argv);

// For use between fork() and exec(): clears the signal mask the parent set up
// for signalfd and restores default dispositions.
void reset_child_signals();

// pidfd_open(2); -1 with errno set where the kernel lacks it.
int open_pidfd(pid_t pid);

// Builds a null-terminated argv array pointing into `args`.
std::vector<char*> make_argv(const std::vector<std::string>& args);

} // namespace platform
