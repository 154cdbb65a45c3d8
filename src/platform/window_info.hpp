#pragma once

#include <string>

struct WindowInfo {
    std::string window_id;     // X11 window id or Sway con_id
    std::string app_id;        // Wayland app_id (e.g. "kitty")
    std::string window_class;  // X11 class (e.g. "Firefox")
    std::string title;         // window title
    int pid = 0;               // window process PID

    bool empty() const { return window_id.empty() && app_id.empty() && window_class.empty() && title.empty() && pid == 0; }

    // Terminal emulators paste with Ctrl+Shift+V.
    bool is_terminal() const;
};
