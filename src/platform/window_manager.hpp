#pragma once

#include "platform/host_probe.hpp"
#include "platform/window_info.hpp"

#include <memory>
#include <optional>
#include <vector>

// Remembers the focused window before recording and gives focus back to it
// before the paste keystroke.
class WindowManager {
public:
    virtual ~WindowManager() = default;
    virtual const char* name() const = 0;
    virtual bool available(const HostProbe& probe) const = 0;
    virtual std::optional<WindowInfo> focused_window() = 0;
    virtual bool focus(const WindowInfo& window) = 0;
};

// Sway IPC, then xdotool.
std::vector<std::unique_ptr<WindowManager>> default_window_managers(const HostProbe& probe);
