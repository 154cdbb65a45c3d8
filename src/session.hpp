#pragma once

#include "platform/linux/child_process.hpp"
#include "resource_janitor.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>

enum class PipelineState {
    Idle,
    CapabilitySelected,
    Recording,
    Validating,
    Transcribing,
    Dispatching,
    Done,
    Aborted,
};

const char* to_string(PipelineState state);

// One record -> transcribe -> deliver attempt. Resources are acquired through
// and owned by the janitor; the session only refers to them.
class RecordingSession {
public:
    explicit RecordingSession(ResourceJanitor& janitor);

    RecordingSession(const RecordingSession&) = delete;
    RecordingSession& operator=(const RecordingSession&) = delete;

    // Acquires the audio file and response buffer.
    std::expected<void, std::string> open();

    PipelineState state() const { return state_; }

    // Moves to `next`. Terminal states are final; returns false if refused.
    bool transition(PipelineState next);
    bool finished() const { return state_ == PipelineState::Done || state_ == PipelineState::Aborted; }

    const std::filesystem::path& audio_file() const { return audio_file_; }
    const std::filesystem::path& response_file() const { return response_file_; }

    ResourceJanitor& janitor() { return janitor_; }
    bool released() const { return janitor_.released(); }

    // Set by ProcessSupervisor.
    ChildProcess* recorder = nullptr;
    ChildProcess* indicator = nullptr;
    std::chrono::steady_clock::time_point record_start;
    std::chrono::steady_clock::time_point record_end;
    std::chrono::steady_clock::time_point deadline;
    std::chrono::seconds limit{0};
    bool stop_requested = false;

    double recording_duration() const;

private:
    ResourceJanitor& janitor_;
    PipelineState state_ = PipelineState::Idle;
    std::filesystem::path audio_file_;
    std::filesystem::path response_file_;
};
