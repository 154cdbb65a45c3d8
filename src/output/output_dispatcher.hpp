#pragma once

#include "output/clipboard.hpp"
#include "output/keystroke.hpp"
#include "output/output.hpp"
#include "platform/window_manager.hpp"

#include <chrono>
#include <memory>
#include <vector>

// Clipboard first, then an optional paste into the window that had focus when
// recording started. Each mechanism is the first available candidate, chosen
// at construction.
class OutputDispatcher : public OutputMethod {
public:
    struct Options {
        bool auto_paste = true;
        std::chrono::milliseconds settle_delay{200};
    };

    OutputDispatcher(const HostProbe& probe, Options opts,
                     std::vector<std::unique_ptr<ClipboardCapability>> clipboards,
                     std::vector<std::unique_ptr<WindowManager>> focus_trackers,
                     std::vector<std::unique_ptr<KeystrokeCapability>> keystrokes);

    void capture_target() override;
    DeliveryOutcome deliver(const std::string& text) override;
    std::optional<WindowInfo> target() const override { return target_; }

    const ClipboardCapability* clipboard() const { return clipboard_; }
    const WindowManager* focus_tracker() const { return focus_; }
    const KeystrokeCapability* keystroke() const { return keystroke_; }

private:
    Options opts_;
    std::vector<std::unique_ptr<ClipboardCapability>> clipboards_;
    std::vector<std::unique_ptr<WindowManager>> focus_trackers_;
    std::vector<std::unique_ptr<KeystrokeCapability>> keystrokes_;

    ClipboardCapability* clipboard_ = nullptr;
    WindowManager* focus_ = nullptr;
    KeystrokeCapability* keystroke_ = nullptr;
    std::optional<WindowInfo> target_;
};
