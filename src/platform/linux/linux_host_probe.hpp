#pragma once

#include "platform/host_probe.hpp"

#include <string>
#include <vector>

class LinuxHostProbe : public HostProbe {
public:
    bool has_command(const std::string& name) const override;
    bool is_running(const std::string& process_name) const override;
    std::string env(const std::string& name) const override;

    // Read /proc/{pid}/comm, return empty on failure.
    static std::string read_comm(int pid);

    // All numeric entries under /proc.
    static std::vector<int> list_pids();
};
