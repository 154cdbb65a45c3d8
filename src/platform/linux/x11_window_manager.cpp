#include "platform/linux/x11_window_manager.hpp"

#include "platform/linux/subprocess.hpp"

#include <print>

static std::string first_line(const std::string& s) {
    auto end = s.find_first_of("\r\n");
    return s.substr(0, end);
}

bool X11WindowManager::available(const HostProbe& probe) const {
    return !probe.env("DISPLAY").empty() && probe.has_command("xdotool");
}

std::optional<WindowInfo> X11WindowManager::focused_window() {
    auto res = platform::run({"xdotool", "getactivewindow"}, {}, true,
                             platform::HELPER_TIMEOUT);
    if (!res || res->exit_code != 0) return std::nullopt;

    WindowInfo info;
    info.window_id = first_line(res->output);
    if (info.window_id.empty()) return std::nullopt;

    auto cls = platform::run({"xdotool", "getwindowclassname", info.window_id}, {}, true,
                             platform::HELPER_TIMEOUT);
    if (cls && cls->exit_code == 0) info.window_class = first_line(cls->output);

    auto title = platform::run({"xdotool", "getwindowname", info.window_id}, {}, true,
                             platform::HELPER_TIMEOUT);
    if (title && title->exit_code == 0) info.title = first_line(title->output);

    return info;
}

bool X11WindowManager::focus(const WindowInfo& window) {
    if (window.window_id.empty()) return false;

    // --sync waits for the window manager to confirm; some never do.
    auto res = platform::run({"xdotool", "windowactivate", "--sync", window.window_id}, {}, false,
                             platform::HELPER_TIMEOUT);
    if (!res) {
        std::println(stderr, "xdotool: {}", res.error());
        return false;
    }
    return res->exit_code == 0;
}
