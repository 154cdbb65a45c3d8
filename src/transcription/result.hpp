#pragma once

#include <string>
#include <variant>

struct Transcript {
    std::string text; // trimmed, never empty
    double processing_s = 0.0;
};

struct ApiError {
    long status = 0;
    std::string message;
};

struct EmptyAudio {};

// The API answered 200 but recognised nothing.
struct NoText {};

// No HTTP response at all: DNS, connect, TLS or timeout.
struct NetworkFailure {
    std::string detail;
};

using TranscriptionResult = std::variant<Transcript, ApiError, EmptyAudio, NoText, NetworkFailure>;
