#include "audio/backend_selector.hpp"
#include "audio/recorders.hpp"
#include "cancel_token.hpp"
#include "config.hpp"
#include "credential.hpp"
#include "indicator/indicators.hpp"
#include "notify/desktop_notifier.hpp"
#include "output/output_dispatcher.hpp"
#include "pipeline.hpp"
#include "platform/linux/linux_host_probe.hpp"
#include "platform/platform_paths.hpp"
#include "process_supervisor.hpp"
#include "storage/history_db.hpp"
#include "transcription/curl_transport.hpp"
#include "transcription/transcription_client.hpp"

#include <cctype>
#include <cstdlib>
#include <print>
#include <string>

static void usage() {
    std::println("Usage: conduit [options]");
    std::println("Records from the microphone, transcribes the speech and pastes the text.");
    std::println("Options:");
    std::println("  -v, --verbose         Enable verbose logging");
    std::println("  -c, --config PATH     Settings file path");
    std::println("  -e, --env PATH        Credential (.env) file path");
    std::println("  -l, --long            Use the long-form recording limit");
    std::println("  -t, --max-seconds N   Recording limit in seconds");
    std::println("      --no-paste        Copy to the clipboard only");
    std::println("      --no-indicator    Do not show the stop indicator");
    std::println("      --history [N]     Print the last N transcripts (default 10) and exit");
    std::println("  -h, --help            Show this help");
}

static bool is_number(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

static std::string history_path() {
    auto data = platform::data_dir();
    if (data.empty()) return "/tmp/conduit/history.db";
    return data + "/history.db";
}

static int print_history(int limit) {
    HistoryDb db;
    if (!db.open(history_path())) return 1;

    auto entries = db.recent(limit);
    if (entries.empty()) {
        std::println("No transcripts yet.");
        return 0;
    }

    for (auto& e : entries) {
        auto& r = e.record;
        std::println("[{}] {}", e.timestamp, r.text);
        std::string app = !r.target.app_id.empty() ? r.target.app_id : r.target.window_class;
        if (!app.empty()) {
            std::println("  App: {}", app);
        }
        std::println("  Audio: {:.1f}s, processing: {:.1f}s, {}", r.audio_duration,
                     r.processing_time, r.delivery.empty() ? "none" : r.delivery);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool long_form = false;
    bool no_paste = false;
    bool no_indicator = false;
    int max_seconds = 0;
    int history_limit = 0;
    std::string config_path;
    std::string env_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--env" || arg == "-e") {
            if (i + 1 < argc) env_path = argv[++i];
        } else if (arg == "--long" || arg == "-l") {
            long_form = true;
        } else if (arg == "--max-seconds" || arg == "-t") {
            if (i + 1 < argc) max_seconds = std::atoi(argv[++i]);
            if (max_seconds <= 0) {
                std::println(stderr, "--max-seconds needs a positive number");
                return 1;
            }
        } else if (arg == "--no-paste") {
            no_paste = true;
        } else if (arg == "--no-indicator") {
            no_indicator = true;
        } else if (arg == "--history") {
            history_limit = 10;
            if (i + 1 < argc && is_number(argv[i + 1])) history_limit = std::atoi(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage();
            return 1;
        }
    }

    if (history_limit > 0) {
        return print_history(history_limit);
    }

    // Block the cancellation signals before any child exists
    CancelToken cancel;

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (long_form) config.audio.max_seconds = config.audio.long_max_seconds;
    if (max_seconds > 0) config.audio.max_seconds = static_cast<uint32_t>(max_seconds);
    if (no_paste) config.output.auto_paste = false;
    if (no_indicator) config.ui.indicator = false;

    auto candidates = env_path.empty() ? platform::credential_candidates()
                                       : std::vector<std::string>{env_path};
    Credential credential;
    if (auto loaded = Credential::load(candidates)) {
        credential = std::move(*loaded);
    } else {
        std::println(stderr, "credential: {}", loaded.error());
    }

    if (verbose) {
        std::println(stderr, "[conduit] Starting (limit {}s, language {}, key from {})",
                     config.audio.max_seconds, config.api.language,
                     credential.source.empty() ? "nowhere" : credential.source);
    }

    LinuxHostProbe probe;
    DesktopNotifier notifier(probe, config.ui.notifications);

    AudioBackendSelector selector(probe, default_recorders());
    ProcessSupervisor supervisor(cancel, std::chrono::milliseconds(config.audio.stop_grace_ms),
                                 AudioFormat{.sample_rate = config.audio.sample_rate});

    auto indicators = default_indicators();
    const IndicatorCapability* indicator =
        config.ui.indicator ? select_indicator(probe, indicators) : nullptr;

    CurlTransport transport(&cancel);
    TranscriptionClient client(transport, TranscriptionClient::Options{
        .url = config.api.url,
        .language = config.api.language,
        .timeout_seconds = static_cast<long>(config.api.timeout_seconds),
    });

    OutputDispatcher output(probe,
                            OutputDispatcher::Options{
                                .auto_paste = config.output.auto_paste,
                                .settle_delay = std::chrono::milliseconds(config.output.paste_delay_ms),
                            },
                            default_clipboards(), default_window_managers(probe), default_keystrokes());

    HistoryDb history;
    HistoryDb* history_ptr = nullptr;
    if (config.history.enabled) {
        if (history.open(history_path())) {
            history_ptr = &history;
        } else {
            std::println(stderr, "Warning: history DB failed to open, history disabled");
        }
    }

    Pipeline pipeline(std::move(config), std::move(credential), verbose,
                      selector, supervisor, client, output, notifier, cancel,
                      indicator, history_ptr);
    return pipeline.run();
}
