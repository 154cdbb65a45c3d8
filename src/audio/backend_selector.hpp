#pragma once

#include "audio/capability.hpp"
#include "platform/host_probe.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

class AudioBackendSelector {
public:
    AudioBackendSelector(const HostProbe& probe,
                         std::vector<std::unique_ptr<AudioCapability>> candidates);

    // First candidate whose tool is installed and whose daemon is live.
    // If none is live, the first installed tool. Fails only when no
    // candidate tool is installed.
    std::expected<const AudioCapability*, std::string> select() const;

    size_t candidate_count() const { return candidates_.size(); }

private:
    bool daemon_live(const AudioCapability& cap) const;

    const HostProbe& probe_;
    std::vector<std::unique_ptr<AudioCapability>> candidates_;
};
