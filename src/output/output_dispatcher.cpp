#include "output/output_dispatcher.hpp"

#include <print>
#include <thread>

template <typename T>
static T* first_available(const HostProbe& probe, const std::vector<std::unique_ptr<T>>& candidates) {
    for (auto& c : candidates) {
        if (c->available(probe)) return c.get();
    }
    return nullptr;
}

OutputDispatcher::OutputDispatcher(const HostProbe& probe, Options opts,
                                   std::vector<std::unique_ptr<ClipboardCapability>> clipboards,
                                   std::vector<std::unique_ptr<WindowManager>> focus_trackers,
                                   std::vector<std::unique_ptr<KeystrokeCapability>> keystrokes)
    : opts_(opts)
    , clipboards_(std::move(clipboards))
    , focus_trackers_(std::move(focus_trackers))
    , keystrokes_(std::move(keystrokes)) {
    clipboard_ = first_available(probe, clipboards_);
    focus_ = first_available(probe, focus_trackers_);
    keystroke_ = first_available(probe, keystrokes_);
}

void OutputDispatcher::capture_target() {
    if (!focus_) return;
    target_ = focus_->focused_window();
    if (!target_) {
        std::println(stderr, "output: could not determine focused window via {}", focus_->name());
    }
}

DeliveryOutcome OutputDispatcher::deliver(const std::string& text) {
    using Kind = DeliveryOutcome::Kind;

    if (!clipboard_) {
        return {Kind::NoClipboard, "no clipboard tool found (install wl-clipboard, xclip or xsel)"};
    }

    auto copied = clipboard_->copy(text);
    if (!copied) {
        std::println(stderr, "output: {}", copied.error());
        return {Kind::NoClipboard, copied.error()};
    }

    if (!opts_.auto_paste) return {Kind::ClipboardOnly, "auto-paste disabled"};
    if (!keystroke_) return {Kind::ClipboardOnly, "no keystroke tool found"};
    if (!target_) return {Kind::ClipboardOnly, "no target window"};

    if (!focus_->focus(*target_)) {
        std::println(stderr, "output: failed to restore focus to window {}", target_->window_id);
        return {Kind::ClipboardOnly, "could not restore focus"};
    }

    std::this_thread::sleep_for(opts_.settle_delay);

    auto pasted = keystroke_->paste(target_->is_terminal());
    if (!pasted) {
        std::println(stderr, "output: {}", pasted.error());
        return {Kind::ClipboardOnly, pasted.error()};
    }
    return {Kind::Pasted, keystroke_->name()};
}
