#include "session.hpp"

#include <print>

const char* to_string(PipelineState state) {
    switch (state) {
        case PipelineState::Idle:               return "idle";
        case PipelineState::CapabilitySelected: return "capability-selected";
        case PipelineState::Recording:          return "recording";
        case PipelineState::Validating:         return "validating";
        case PipelineState::Transcribing:       return "transcribing";
        case PipelineState::Dispatching:        return "dispatching";
        case PipelineState::Done:               return "done";
        case PipelineState::Aborted:            return "aborted";
    }
    return "unknown";
}

RecordingSession::RecordingSession(ResourceJanitor& janitor)
    : janitor_(janitor) {}

std::expected<void, std::string> RecordingSession::open() {
    auto audio = janitor_.acquire(ResourceKind::AudioFile);
    if (!audio) return std::unexpected(audio.error());
    audio_file_ = *audio;

    auto response = janitor_.acquire(ResourceKind::ResponseBuffer);
    if (!response) return std::unexpected(response.error());
    response_file_ = *response;

    return {};
}

bool RecordingSession::transition(PipelineState next) {
    if (finished()) {
        std::println(stderr, "session: cannot leave terminal state {}", to_string(state_));
        return false;
    }

    if (next != PipelineState::Aborted &&
        static_cast<int>(next) != static_cast<int>(state_) + 1) {
        std::println(stderr, "session: invalid transition {} -> {}",
                     to_string(state_), to_string(next));
        return false;
    }

    state_ = next;
    return true;
}

double RecordingSession::recording_duration() const {
    if (record_start == std::chrono::steady_clock::time_point{}) return 0.0;
    auto end = record_end != std::chrono::steady_clock::time_point{}
        ? record_end : std::chrono::steady_clock::now();
    return std::chrono::duration<double>(end - record_start).count();
}
