#include "audio/backend_selector.hpp"

#include <print>

AudioBackendSelector::AudioBackendSelector(const HostProbe& probe,
                                           std::vector<std::unique_ptr<AudioCapability>> candidates)
    : probe_(probe), candidates_(std::move(candidates)) {}

std::expected<const AudioCapability*, std::string> AudioBackendSelector::select() const {
    const AudioCapability* fallback = nullptr;

    for (const auto& cap : candidates_) {
        if (!probe_.has_command(cap->tool())) continue;

        if (daemon_live(*cap)) {
            return cap.get();
        }

        // Installed but inactive backends tend to block or record silence
        std::println(stderr, "audio: {} installed but its daemon is not running, skipping",
                     cap->tool());
        if (!fallback) fallback = cap.get();
    }

    if (fallback) {
        std::println(stderr, "audio: no live audio daemon found, trying {} anyway",
                     fallback->tool());
        return fallback;
    }

    return std::unexpected(
        "no audio recording tool found (install pipewire, pulseaudio-utils, alsa-utils or sox)");
}

bool AudioBackendSelector::daemon_live(const AudioCapability& cap) const {
    auto daemons = cap.daemons();
    if (daemons.empty()) return true;
    for (const auto& d : daemons) {
        if (probe_.is_running(d)) return true;
    }
    return false;
}
