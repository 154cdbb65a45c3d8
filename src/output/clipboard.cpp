#include "output/clipboard.hpp"

#include "platform/linux/subprocess.hpp"

std::expected<void, std::string> ClipboardCapability::copy(const std::string& text) {
    auto argv = command();
    auto res = platform::run(argv, text, false, platform::HELPER_TIMEOUT);
    if (!res) return std::unexpected(res.error());

    if (res->exit_code != 0) {
        return std::unexpected(argv[0] + " exited with code " + std::to_string(res->exit_code));
    }
    return {};
}

bool WlCopyClipboard::available(const HostProbe& probe) const {
    return !probe.env("WAYLAND_DISPLAY").empty() && probe.has_command("wl-copy");
}

bool XclipClipboard::available(const HostProbe& probe) const {
    return !probe.env("DISPLAY").empty() && probe.has_command("xclip");
}

bool XselClipboard::available(const HostProbe& probe) const {
    return !probe.env("DISPLAY").empty() && probe.has_command("xsel");
}

std::vector<std::unique_ptr<ClipboardCapability>> default_clipboards() {
    std::vector<std::unique_ptr<ClipboardCapability>> out;
    out.push_back(std::make_unique<WlCopyClipboard>());
    out.push_back(std::make_unique<XclipClipboard>());
    out.push_back(std::make_unique<XselClipboard>());
    return out;
}
