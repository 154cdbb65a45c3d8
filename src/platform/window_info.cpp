#include "platform/window_info.hpp"

#include <algorithm>
#include <cctype>

bool WindowInfo::is_terminal() const {
    std::string app = !app_id.empty() ? app_id : window_class;
    std::transform(app.begin(), app.end(), app.begin(), ::tolower);
    if (app.empty()) return false;

    for (const char* term : {"kitty", "alacritty", "foot", "wezterm", "terminal",
                             "konsole", "xterm", "urxvt", "tilix", "terminator"}) {
        if (app.find(term) != std::string::npos) return true;
    }
    return false;
}
