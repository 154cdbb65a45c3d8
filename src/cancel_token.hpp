#pragma once

#include <csignal>

// Turns SIGINT, SIGTERM and SIGHUP into a pollable fd via signalfd.
// Construct before any worker threads or children exist: the signals are
// blocked for the calling thread and the mask is inherited.
class CancelToken {
public:
    CancelToken();
    ~CancelToken();

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    bool valid() const { return signal_fd_ >= 0; }

    // Readable when a cancellation signal is pending.
    int fd() const { return signal_fd_; }

    // Consumes a pending signal, if any. Latches once cancelled.
    bool cancelled();

    // Signal that caused cancellation, 0 if none.
    int signo() const { return signo_; }

private:
    int signal_fd_ = -1;
    int signo_ = 0;
    sigset_t old_mask_;
};
