#include "platform/linux/linux_host_probe.hpp"

#include "platform/linux/pipewire_probe.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

bool LinuxHostProbe::has_command(const std::string& name) const {
    if (name.empty()) return false;

    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0;
    }

    const char* path = std::getenv("PATH");
    std::istringstream dirs(path ? path : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        auto candidate = fs::path(dir) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

bool LinuxHostProbe::is_running(const std::string& process_name) const {
    bool found = false;
    for (int pid : list_pids()) {
        if (read_comm(pid) == process_name) {
            found = true;
            break;
        }
    }

    // A pipewire process can outlive its socket; only a live core counts.
    if (found && process_name == "pipewire") {
        return platform::pipewire_reachable();
    }
    return found;
}

std::string LinuxHostProbe::env(const std::string& name) const {
    const char* v = std::getenv(name.c_str());
    return v ? v : "";
}

std::string LinuxHostProbe::read_comm(int pid) {
    std::ifstream f(std::format("/proc/{}/comm", pid));
    if (!f.is_open()) return {};
    std::string comm;
    std::getline(f, comm);
    return comm;
}

std::vector<int> LinuxHostProbe::list_pids() {
    std::vector<int> pids;
    std::error_code ec;
    for (auto& entry : fs::directory_iterator("/proc", ec)) {
        auto name = entry.path().filename().string();
        if (name.empty() || !std::isdigit(static_cast<unsigned char>(name[0]))) continue;
        pids.push_back(std::atoi(name.c_str()));
    }
    return pids;
}
