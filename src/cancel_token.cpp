#include "cancel_token.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/signalfd.h>
#include <unistd.h>

CancelToken::CancelToken() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);
    sigprocmask(SIG_BLOCK, &mask, &old_mask_);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "cancel: signalfd failed: {}", std::strerror(errno));
    }
}

CancelToken::~CancelToken() {
    if (signal_fd_ >= 0) {
        // Drain so unblocking does not deliver an already-handled signal
        signalfd_siginfo info;
        while (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
        }
        ::close(signal_fd_);
    }
    sigprocmask(SIG_SETMASK, &old_mask_, nullptr);
}

bool CancelToken::cancelled() {
    if (signo_ != 0) return true;
    if (signal_fd_ < 0) return false;

    signalfd_siginfo info;
    ssize_t n;
    do {
        n = ::read(signal_fd_, &info, sizeof(info));
    } while (n < 0 && errno == EINTR);

    if (n == sizeof(info)) {
        signo_ = static_cast<int>(info.ssi_signo);
        return true;
    }
    return false;
}
