#include "pipeline.hpp"

#include "wav.hpp"

#include <format>
#include <print>
#include <variant>

Pipeline::Pipeline(Config config, Credential credential, bool verbose,
                   AudioBackendSelector& selector, ProcessSupervisor& supervisor,
                   TranscriptionClient& client, OutputMethod& output,
                   Notifier& notifier, CancelToken& cancel,
                   const IndicatorCapability* indicator, HistoryDb* history)
    : config_(std::move(config)), credential_(std::move(credential)), verbose_(verbose),
      selector_(selector), supervisor_(supervisor), client_(client),
      output_(output), notifier_(notifier), cancel_(cancel),
      indicator_(indicator), history_(history) {}

int Pipeline::run() {
    state_ = PipelineState::Idle;
    error_.reset();
    delivery_.reset();
    transcript_.clear();
    cancelled_ = false;

    ResourceJanitor janitor(&notifier_, temp_dir_,
                            std::chrono::milliseconds(config_.audio.stop_grace_ms));
    RecordingSession session(janitor);

    int code = execute(session);

    if (cancelled_) {
        janitor.set_exit_reason(ExitReason::Cancelled);
    } else if (error_) {
        janitor.set_exit_reason(ExitReason::Failed, failure_notice(*error_));
    }
    janitor.release_all();

    state_ = session.state();
    log(std::format("Session {} (exit {})", to_string(state_), code));
    return code;
}

int Pipeline::execute(RecordingSession& session) {
    switch (credential_.check()) {
        case CredentialStatus::Missing:
            return abort(session, ErrorKind::CredentialMissing,
                         std::format("{} not set{}", Credential::KEY_NAME,
                                     credential_.source.empty() ? "" : " in " + credential_.source));
        case CredentialStatus::Placeholder:
            return abort(session, ErrorKind::CredentialMissing,
                         std::format("{} in {} is still the placeholder value",
                                     Credential::KEY_NAME, credential_.source));
        case CredentialStatus::InvalidFormat:
            std::println(stderr, "credential: {} does not look like a Groq key "
                                 "(expected {} followed by {} letters or digits), trying anyway",
                         Credential::KEY_NAME, Credential::KEY_PREFIX, Credential::KEY_BODY_LENGTH);
            notifier_.notify("Warning", "API key format appears invalid. Groq keys should start with 'gsk_'",
                             Urgency::Low);
            break;
        case CredentialStatus::Ok:
            break;
    }

    auto selected = selector_.select();
    if (!selected) {
        return abort(session, ErrorKind::NoBackendAvailable, selected.error());
    }
    const AudioCapability& cap = **selected;
    session.transition(PipelineState::CapabilitySelected);
    log("Audio backend: " + cap.name() + " (" + cap.tool() + ")");

    auto opened = session.open();
    if (!opened) {
        return abort(session, ErrorKind::RecordingFailed, opened.error());
    }

    output_.capture_target();
    if (auto target = output_.target()) {
        log("Target window: " + (target->app_id.empty() ? target->window_class : target->app_id));
    }

    if (cancel_.cancelled()) return cancel(session);

    auto limit = std::chrono::seconds(config_.audio.max_seconds);
    auto rec = supervisor_.start(session, cap, limit);
    if (!rec) {
        return abort(session, ErrorKind::RecordingFailed, rec.error());
    }
    session.transition(PipelineState::Recording);
    log(std::format("Recording to {} (limit {}s)", session.audio_file().string(), limit.count()));

    if (indicator_) {
        auto ind = supervisor_.start_indicator(session, *indicator_);
        if (!ind) {
            std::println(stderr, "indicator: {}", ind.error());
        }
    }
    if (!session.indicator) {
        std::println(stderr, "Recording for up to {}s. Press Ctrl+C to cancel.", limit.count());
    }

    auto outcome = supervisor_.wait(session);
    log(std::format("Recorder {} after {:.1f}s (status {})",
                    to_string(outcome.kind), outcome.duration_s, outcome.exit_status));

    if (outcome.kind == ExitOutcome::Kind::Cancelled) return cancel(session);
    if (!outcome.recorded()) {
        return abort(session, ErrorKind::RecordingFailed,
                     std::format("{} exited with status {}", cap.tool(), outcome.exit_status));
    }

    session.transition(PipelineState::Validating);
    auto bytes = wav::payload_bytes(session.audio_file());
    if (bytes == 0) {
        return abort(session, ErrorKind::EmptyAudio, "no audio was recorded");
    }
    log(std::format("Captured {} bytes of audio", bytes));

    session.transition(PipelineState::Transcribing);
    auto result = client_.transcribe(session.audio_file(), credential_, session.response_file());

    if (cancel_.cancelled()) return cancel(session);

    if (auto* err = std::get_if<ApiError>(&result)) {
        return abort(session, ErrorKind::ApiError,
                     std::format("API error (HTTP {}): {}", err->status, err->message), err->status);
    }
    if (auto* net = std::get_if<NetworkFailure>(&result)) {
        return abort(session, ErrorKind::NetworkFailure, "request failed: " + net->detail);
    }
    if (std::holds_alternative<EmptyAudio>(result)) {
        return abort(session, ErrorKind::EmptyAudio, "no audio was recorded");
    }
    if (std::holds_alternative<NoText>(result)) {
        return abort(session, ErrorKind::NoText, "no text was transcribed");
    }

    auto& tr = std::get<Transcript>(result);
    log(std::format("Transcription complete: {:.1f}s processing, {} chars",
                    tr.processing_s, tr.text.size()));

    session.transition(PipelineState::Dispatching);
    return dispatch(session, cap, tr);
}

int Pipeline::dispatch(RecordingSession& session, const AudioCapability& cap, const Transcript& tr) {
    transcript_ = tr.text;

    auto outcome = output_.deliver(tr.text);
    delivery_ = outcome;

    switch (outcome.kind) {
        case DeliveryOutcome::Kind::Pasted:
            log("Pasted via " + outcome.detail);
            break;
        case DeliveryOutcome::Kind::ClipboardOnly:
            std::println(stderr, "Text copied to clipboard, paste it manually ({})", outcome.detail);
            break;
        case DeliveryOutcome::Kind::NoClipboard:
            std::println(stderr, "Clipboard unavailable: {}", outcome.detail);
            break;
    }

    std::println("{}", tr.text);

    if (history_ && history_->is_open()) {
        TranscriptRecord rec{
            .text = tr.text,
            .audio_duration = session.recording_duration(),
            .processing_time = tr.processing_s,
            .recorder = cap.name(),
            .model = TranscriptionClient::MODEL,
            .language = config_.api.language,
            .delivery = to_string(outcome.kind),
            .target = output_.target().value_or(WindowInfo{}),
        };
        if (!history_->insert(rec)) {
            std::println(stderr, "history: transcript not saved");
        }
    }

    session.transition(PipelineState::Done);

    std::string summary;
    switch (outcome.kind) {
        case DeliveryOutcome::Kind::Pasted:        summary = "Text transcribed and pasted: "; break;
        case DeliveryOutcome::Kind::ClipboardOnly: summary = "Text copied to clipboard: "; break;
        case DeliveryOutcome::Kind::NoClipboard:   summary = "Text transcribed: "; break;
    }
    notifier_.notify("Success", summary + preview(tr.text));
    return 0;
}

int Pipeline::abort(RecordingSession& session, ErrorKind kind, std::string message, long http_status) {
    session.transition(PipelineState::Aborted);
    std::println(stderr, "Error: {}", message);
    error_ = PipelineError{.kind = kind, .message = std::move(message), .http_status = http_status};
    return exit_code(kind);
}

int Pipeline::cancel(RecordingSession& session) {
    session.transition(PipelineState::Aborted);
    cancelled_ = true;
    log(std::format("Cancelled by signal {}", cancel_.signo()));
    return EXIT_CANCELLED;
}

std::string Pipeline::failure_notice(const PipelineError& err) {
    switch (err.kind) {
        case ErrorKind::CredentialMissing:
            return "API key not configured. Please check your .env file";
        case ErrorKind::NoBackendAvailable:
            return "No audio recording tool found";
        case ErrorKind::RecordingFailed:
            return "Recording failed. Check the terminal for details.";
        case ErrorKind::EmptyAudio:
            return "No audio was recorded";
        case ErrorKind::NetworkFailure:
            return "Could not reach the transcription service";
        case ErrorKind::ApiError:
            if (err.http_status == 401) return "Invalid API key. Please check your .env file";
            if (err.http_status == 429) return "Rate limit exceeded. Please try again later";
            if (err.http_status >= 500 && err.http_status < 600)
                return "Groq service temporarily unavailable";
            return "Transcription failed. Check the terminal for details.";
        case ErrorKind::NoText:
            return "No text was transcribed";
        case ErrorKind::CredentialInvalidFormat:
        case ErrorKind::DeliveryDegraded:
            break;
    }
    return {};
}

void Pipeline::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[conduit] {}", msg);
    }
}

std::string preview(const std::string& text, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < text.size(); i++) {
        // Count lead bytes only so multi-byte sequences stay whole
        if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) continue;
        if (chars == max_chars) return text.substr(0, i) + "...";
        chars++;
    }
    return text;
}
