#pragma once

#include "audio/capability.hpp"
#include "indicator/indicator.hpp"
#include "notify/notifier.hpp"
#include "output/output.hpp"
#include "platform/host_probe.hpp"
#include "transcription/http_transport.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <unistd.h>
#include <vector>

// Host with a fixed set of installed commands, processes and env vars.
class FakeHostProbe : public HostProbe {
public:
    std::set<std::string> commands;
    std::set<std::string> processes;
    std::map<std::string, std::string> vars;

    bool has_command(const std::string& name) const override { return commands.contains(name); }
    bool is_running(const std::string& name) const override { return processes.contains(name); }
    std::string env(const std::string& name) const override {
        auto it = vars.find(name);
        return it == vars.end() ? "" : it->second;
    }
};

class FakeNotifier : public Notifier {
public:
    struct Note {
        std::string title;
        std::string message;
        Urgency urgency;
    };
    std::vector<Note> notes;

    void notify(const std::string& title, const std::string& message, Urgency urgency) override {
        notes.push_back({title, message, urgency});
    }

    size_t count(const std::string& title) const {
        size_t n = 0;
        for (auto& note : notes) {
            if (note.title == title) n++;
        }
        return n;
    }
};

// Answers every request with the same canned response, or fails them all.
class FakeTransport : public HttpTransport {
public:
    HttpResponse response{.status = 200, .body = R"({"text":"hello world"})"};
    std::string failure; // non-empty: no response
    std::function<void()> during_upload;
    std::vector<HttpRequest> requests;

    std::expected<HttpResponse, std::string> post_multipart(const HttpRequest& request) override {
        requests.push_back(request);
        if (during_upload) during_upload();
        if (!failure.empty()) return std::unexpected(failure);
        return response;
    }
};

class FakeOutput : public OutputMethod {
public:
    DeliveryOutcome outcome{.kind = DeliveryOutcome::Kind::Pasted, .detail = "fake"};
    std::vector<std::string> delivered;
    int captures = 0;

    void capture_target() override { captures++; }
    DeliveryOutcome deliver(const std::string& text) override {
        delivered.push_back(text);
        return outcome;
    }
};

// Recorder backed by a shell snippet; the output path is "$1".
class ScriptRecorder : public AudioCapability {
public:
    explicit ScriptRecorder(std::string script, StopMethod method = StopMethod::Signal)
        : script_(std::move(script)), method_(method) {}

    std::string name() const override { return "script"; }
    std::string tool() const override { return "sh"; }
    std::vector<std::string> daemons() const override { return {}; }
    std::vector<std::string> command(const std::string& output_path, const AudioFormat&,
                                     uint32_t) const override {
        return {"sh", "-c", script_, "sh", output_path};
    }
    StopMethod stop_method() const override { return method_; }

private:
    std::string script_;
    StopMethod method_;
};

class ScriptIndicator : public IndicatorCapability {
public:
    explicit ScriptIndicator(std::string script) : script_(std::move(script)) {}

    std::string name() const override { return "script-indicator"; }
    bool available(const HostProbe&) const override { return true; }
    std::vector<std::string> command(int) const override { return {"sh", "-c", script_}; }

private:
    std::string script_;
};

// RAII temp directory that removes itself with its contents.
struct TmpDir {
    std::filesystem::path path;

    TmpDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "conduit_test_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        path = ::mkdtemp(buf.data());
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    bool empty() const { return std::filesystem::is_empty(path); }

    std::filesystem::path write(const std::string& name, const std::string& content) const {
        auto p = path / name;
        std::ofstream(p, std::ios::binary) << content;
        return p;
    }
};

// PID a test script wrote into `file`, 0 if none.
inline int read_pid(const std::filesystem::path& file) {
    std::ifstream f(file);
    int pid = 0;
    f >> pid;
    return pid;
}
