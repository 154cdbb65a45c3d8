#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/conduit";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/conduit";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/conduit";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/conduit";
}

std::string executable_dir() {
    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return {};
    return exe.parent_path().string();
}

std::vector<std::string> credential_candidates() {
    std::vector<std::string> out;

    auto exe_dir = executable_dir();
    if (!exe_dir.empty()) out.push_back(exe_dir + "/.env");

    const char* home = std::getenv("HOME");
    if (home) out.push_back(std::string(home) + "/.local/bin/speech-tools/.env");

    auto cfg = config_dir();
    if (!cfg.empty()) out.push_back(cfg + "/.env");

    return out;
}

} // namespace platform
