#pragma once

#include <string>

// Questions capabilities ask the host before they are selected.
class HostProbe {
public:
    virtual ~HostProbe() = default;

    // True if an executable with this name is found on $PATH.
    virtual bool has_command(const std::string& name) const = 0;

    // True if a process whose comm equals this name is running.
    virtual bool is_running(const std::string& process_name) const = 0;

    // Value of an environment variable, empty if unset.
    virtual std::string env(const std::string& name) const = 0;
};
