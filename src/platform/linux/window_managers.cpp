#include "platform/linux/sway_window_manager.hpp"
#include "platform/linux/x11_window_manager.hpp"

std::vector<std::unique_ptr<WindowManager>> default_window_managers(const HostProbe& probe) {
    std::vector<std::unique_ptr<WindowManager>> out;
    out.push_back(std::make_unique<SwayWindowManager>(probe.env("SWAYSOCK")));
    out.push_back(std::make_unique<X11WindowManager>());
    return out;
}
