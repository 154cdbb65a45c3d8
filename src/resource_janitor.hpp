#pragma once

#include "notify/notifier.hpp"
#include "platform/linux/child_process.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

enum class ResourceKind { AudioFile, TextFile, ResponseBuffer, Process };

enum class ExitReason { Completed, Failed, Cancelled };

// Owns every ephemeral resource of one session and releases each exactly once,
// whichever path leaves the session. Release runs from release_all() or, at the
// latest, from the destructor.
class ResourceJanitor {
public:
    explicit ResourceJanitor(Notifier* notifier = nullptr,
                             std::filesystem::path temp_dir = {},
                             std::chrono::milliseconds grace = std::chrono::milliseconds(3000));
    ~ResourceJanitor();

    ResourceJanitor(const ResourceJanitor&) = delete;
    ResourceJanitor& operator=(const ResourceJanitor&) = delete;

    // Creates an empty, uniquely named temp file (0600) and tracks it.
    std::expected<std::filesystem::path, std::string> acquire(ResourceKind kind);

    // Takes ownership of a running child. The reference stays valid until
    // the janitor is destroyed.
    ChildProcess& adopt(ChildProcess child);

    // Decides which advisory release_all() emits. An empty message keeps the
    // generic wording.
    void set_exit_reason(ExitReason reason, std::string message = {}) {
        reason_ = reason;
        message_ = std::move(message);
    }
    ExitReason exit_reason() const { return reason_; }

    // Terminates live children (acquisition order), then removes files.
    // Only the first call does any work; never throws.
    void release_all() noexcept;

    bool released() const { return released_; }
    size_t tracked() const { return entries_.size(); }

private:
    struct Entry {
        ResourceKind kind;
        std::filesystem::path path;
        std::unique_ptr<ChildProcess> process;
    };

    void announce() noexcept;

    Notifier* notifier_;
    std::filesystem::path temp_dir_;
    std::chrono::milliseconds grace_;
    std::vector<Entry> entries_;
    ExitReason reason_ = ExitReason::Completed;
    std::string message_;
    bool released_ = false;
};
