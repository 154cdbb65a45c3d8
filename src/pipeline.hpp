#pragma once

#include "audio/backend_selector.hpp"
#include "cancel_token.hpp"
#include "config.hpp"
#include "credential.hpp"
#include "errors.hpp"
#include "indicator/indicator.hpp"
#include "notify/notifier.hpp"
#include "output/output.hpp"
#include "process_supervisor.hpp"
#include "session.hpp"
#include "storage/history_db.hpp"
#include "transcription/transcription_client.hpp"

#include <filesystem>
#include <optional>
#include <string>

class Pipeline {
public:
    Pipeline(Config config, Credential credential, bool verbose,
             AudioBackendSelector& selector, ProcessSupervisor& supervisor,
             TranscriptionClient& client, OutputMethod& output,
             Notifier& notifier, CancelToken& cancel,
             const IndicatorCapability* indicator = nullptr,
             HistoryDb* history = nullptr);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // One session, from backend selection to resource release. Returns the
    // process exit code.
    int run();

    PipelineState state() const { return state_; }
    const std::optional<PipelineError>& error() const { return error_; }
    const std::optional<DeliveryOutcome>& delivery() const { return delivery_; }
    const std::string& transcript() const { return transcript_; }
    bool cancelled() const { return cancelled_; }

    // Where session temp files go; defaults to the system temp directory.
    void set_temp_dir(std::filesystem::path dir) { temp_dir_ = std::move(dir); }

private:
    int execute(RecordingSession& session);
    int dispatch(RecordingSession& session, const AudioCapability& cap, const Transcript& tr);
    int abort(RecordingSession& session, ErrorKind kind, std::string message, long http_status = 0);
    int cancel(RecordingSession& session);

    // Notification text for a fatal error.
    static std::string failure_notice(const PipelineError& err);

    void log(const std::string& msg);

    Config config_;
    Credential credential_;
    bool verbose_;

    AudioBackendSelector& selector_;
    ProcessSupervisor& supervisor_;
    TranscriptionClient& client_;
    OutputMethod& output_;
    Notifier& notifier_;
    CancelToken& cancel_;
    const IndicatorCapability* indicator_;
    HistoryDb* history_;

    std::filesystem::path temp_dir_;
    PipelineState state_ = PipelineState::Idle;
    std::optional<PipelineError> error_;
    std::optional<DeliveryOutcome> delivery_;
    std::string transcript_;
    bool cancelled_ = false;
};

// First `max_chars` code points of a UTF-8 string, with "..." if cut.
std::string preview(const std::string& text, size_t max_chars = 50);
