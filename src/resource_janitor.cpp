#include "resource_janitor.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <print>
#include <unistd.h>

namespace fs = std::filesystem;

static const char* suffix_for(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::AudioFile:      return ".wav";
        case ResourceKind::TextFile:       return ".txt";
        case ResourceKind::ResponseBuffer: return ".json";
        case ResourceKind::Process:        break;
    }
    return "";
}

ResourceJanitor::ResourceJanitor(Notifier* notifier, fs::path temp_dir,
                                 std::chrono::milliseconds grace)
    : notifier_(notifier), temp_dir_(std::move(temp_dir)), grace_(grace) {
    if (temp_dir_.empty()) {
        std::error_code ec;
        temp_dir_ = fs::temp_directory_path(ec);
        if (ec) temp_dir_ = "/tmp";
    }
}

ResourceJanitor::~ResourceJanitor() {
    release_all();
}

std::expected<fs::path, std::string> ResourceJanitor::acquire(ResourceKind kind) {
    if (kind == ResourceKind::Process) {
        return std::unexpected("processes are adopted, not acquired");
    }
    if (released_) {
        return std::unexpected("janitor already released");
    }

    std::string suffix = suffix_for(kind);
    std::string tmpl = (temp_dir_ / "conduit-XXXXXX").string() + suffix;
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        return std::unexpected(std::string("mkstemps failed: ") + std::strerror(errno));
    }
    ::close(fd);

    fs::path path(buf.data());
    entries_.push_back(Entry{.kind = kind, .path = path, .process = nullptr});
    return path;
}

ChildProcess& ResourceJanitor::adopt(ChildProcess child) {
    auto owned = std::make_unique<ChildProcess>(std::move(child));
    auto& ref = *owned;
    entries_.push_back(Entry{.kind = ResourceKind::Process, .path = {}, .process = std::move(owned)});
    return ref;
}

void ResourceJanitor::release_all() noexcept {
    if (released_) return;
    released_ = true;

    for (auto& e : entries_) {
        if (e.kind != ResourceKind::Process || !e.process) continue;
        if (e.process->alive()) {
            e.process->terminate(grace_);
        }
    }

    for (auto& e : entries_) {
        if (e.kind == ResourceKind::Process) continue;
        std::error_code ec;
        fs::remove(e.path, ec);
        if (ec) {
            std::println(stderr, "janitor: could not remove {}: {}", e.path.string(), ec.message());
        }
    }

    announce();
}

void ResourceJanitor::announce() noexcept {
    if (!notifier_) return;
    try {
        switch (reason_) {
            case ExitReason::Completed:
                break;
            case ExitReason::Failed:
                notifier_->notify("Error",
                                  message_.empty() ? "Transcription failed. Check the terminal for details."
                                                   : message_,
                                  Urgency::Critical);
                break;
            case ExitReason::Cancelled:
                notifier_->notify("Cancelled", "Recording cancelled", Urgency::Low);
                break;
        }
    } catch (const std::exception& e) {
        std::println(stderr, "janitor: notification failed: {}", e.what());
    }
}
