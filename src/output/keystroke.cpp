#include "output/keystroke.hpp"

#include "platform/linux/subprocess.hpp"

std::expected<void, std::string> KeystrokeCapability::paste(bool terminal) {
    auto argv = paste_command(terminal);
    auto res = platform::run(argv, {}, false, platform::HELPER_TIMEOUT);
    if (!res) return std::unexpected(res.error());

    if (res->exit_code != 0) {
        return std::unexpected(name() + " paste failed with code " + std::to_string(res->exit_code));
    }
    return {};
}

bool WtypeKeystroke::available(const HostProbe& probe) const {
    return !probe.env("WAYLAND_DISPLAY").empty() && probe.has_command("wtype");
}

std::vector<std::string> WtypeKeystroke::paste_command(bool terminal) const {
    if (terminal) return {"wtype", "-M", "ctrl", "-M", "shift", "-k", "v"};
    return {"wtype", "-M", "ctrl", "-k", "v"};
}

bool XdotoolKeystroke::available(const HostProbe& probe) const {
    return !probe.env("DISPLAY").empty() && probe.has_command("xdotool");
}

std::vector<std::string> XdotoolKeystroke::paste_command(bool terminal) const {
    return {"xdotool", "key", "--clearmodifiers", terminal ? "ctrl+shift+v" : "ctrl+v"};
}

bool YdotoolKeystroke::available(const HostProbe& probe) const {
    return probe.has_command("ydotool") && probe.is_running("ydotoold");
}

std::vector<std::string> YdotoolKeystroke::paste_command(bool terminal) const {
    // Linux input keycodes: 29 = LEFTCTRL, 42 = LEFTSHIFT, 47 = V
    if (terminal) {
        return {"ydotool", "key", "29:1", "42:1", "47:1", "47:0", "42:0", "29:0"};
    }
    return {"ydotool", "key", "29:1", "47:1", "47:0", "29:0"};
}

std::vector<std::unique_ptr<KeystrokeCapability>> default_keystrokes() {
    std::vector<std::unique_ptr<KeystrokeCapability>> out;
    out.push_back(std::make_unique<WtypeKeystroke>());
    out.push_back(std::make_unique<XdotoolKeystroke>());
    out.push_back(std::make_unique<YdotoolKeystroke>());
    return out;
}
