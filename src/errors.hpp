#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    CredentialMissing,
    NoBackendAvailable,
    RecordingFailed,
    EmptyAudio,
    NetworkFailure,
    ApiError,
    NoText,
    // Non-fatal: logged and notified, the pipeline continues.
    CredentialInvalidFormat,
    DeliveryDegraded,
};

struct PipelineError {
    ErrorKind kind;
    std::string message;
    long http_status = 0; // ApiError only
};

inline constexpr int EXIT_CANCELLED = 130;

constexpr bool is_fatal(ErrorKind kind) {
    return kind != ErrorKind::CredentialInvalidFormat && kind != ErrorKind::DeliveryDegraded;
}

// Process exit code for an aborting error. 0 for non-fatal kinds.
constexpr int exit_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CredentialMissing:       return 1;
        case ErrorKind::NoBackendAvailable:      return 2;
        case ErrorKind::RecordingFailed:         return 3;
        case ErrorKind::EmptyAudio:              return 4;
        case ErrorKind::NetworkFailure:          return 5;
        case ErrorKind::ApiError:                return 6;
        case ErrorKind::NoText:                  return 7;
        case ErrorKind::CredentialInvalidFormat:
        case ErrorKind::DeliveryDegraded:        return 0;
    }
    return 1;
}

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CredentialMissing:       return "CredentialMissing";
        case ErrorKind::NoBackendAvailable:      return "NoBackendAvailable";
        case ErrorKind::RecordingFailed:         return "RecordingFailed";
        case ErrorKind::EmptyAudio:              return "EmptyAudio";
        case ErrorKind::NetworkFailure:          return "NetworkFailure";
        case ErrorKind::ApiError:                return "ApiError";
        case ErrorKind::NoText:                  return "NoText";
        case ErrorKind::CredentialInvalidFormat: return "CredentialInvalidFormat";
        case ErrorKind::DeliveryDegraded:        return "DeliveryDegraded";
    }
    return "Unknown";
}
