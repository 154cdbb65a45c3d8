#pragma once

#include "platform/host_probe.hpp"

#include <string>
#include <vector>

// A small UI process shown while recording. It exits when the user asks to
// stop; the supervisor turns that exit into a stop of the recorder.
class IndicatorCapability {
public:
    virtual ~IndicatorCapability() = default;
    virtual std::string name() const = 0;
    virtual bool available(const HostProbe& probe) const = 0;
    virtual std::vector<std::string> command(int max_seconds) const = 0;
};
