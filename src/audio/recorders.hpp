#pragma once

#include "audio/capability.hpp"

#include <memory>
#include <vector>

class PipeWireRecorder : public AudioCapability {
public:
    std::string name() const override { return "pipewire"; }
    std::string tool() const override { return "pw-record"; }
    std::vector<std::string> daemons() const override { return {"pipewire"}; }
    std::vector<std::string> command(const std::string& output_path, const AudioFormat& format,
                                     uint32_t max_seconds) const override;
};

class PulseRecorder : public AudioCapability {
public:
    std::string name() const override { return "pulseaudio"; }
    std::string tool() const override { return "parecord"; }
    std::vector<std::string> daemons() const override { return {"pulseaudio", "pipewire-pulse"}; }
    std::vector<std::string> command(const std::string& output_path, const AudioFormat& format,
                                     uint32_t max_seconds) const override;
};

class AlsaRecorder : public AudioCapability {
public:
    std::string name() const override { return "alsa"; }
    std::string tool() const override { return "arecord"; }
    std::vector<std::string> daemons() const override { return {}; }
    std::vector<std::string> command(const std::string& output_path, const AudioFormat& format,
                                     uint32_t max_seconds) const override;
    StopMethod stop_method() const override { return StopMethod::BuiltIn; }
};

class SoxRecorder : public AudioCapability {
public:
    std::string name() const override { return "sox"; }
    std::string tool() const override { return "rec"; }
    std::vector<std::string> daemons() const override { return {}; }
    std::vector<std::string> command(const std::string& output_path, const AudioFormat& format,
                                     uint32_t max_seconds) const override;
    StopMethod stop_method() const override { return StopMethod::BuiltIn; }
};

// PipeWire, PulseAudio, ALSA, SoX, in preference order.
std::vector<std::unique_ptr<AudioCapability>> default_recorders();
