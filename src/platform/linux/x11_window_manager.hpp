#pragma once

#include "platform/window_manager.hpp"

// Focus tracking through xdotool.
class X11WindowManager : public WindowManager {
public:
    const char* name() const override { return "xdotool"; }
    bool available(const HostProbe& probe) const override;
    std::optional<WindowInfo> focused_window() override;
    bool focus(const WindowInfo& window) override;
};
