#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct AudioFormat {
    uint32_t sample_rate = 16000;
    uint16_t channels = 1;
    uint16_t bits_per_sample = 16; // signed PCM
};

// How a recorder ends: terminated by the supervisor, or stopping by itself
// once the duration limit handed to it on the command line is reached.
enum class StopMethod { Signal, BuiltIn };

class AudioCapability {
public:
    virtual ~AudioCapability() = default;

    virtual std::string name() const = 0;

    // Command-line tool that does the recording.
    virtual std::string tool() const = 0;

    // Processes of which at least one must be running; empty if none is needed.
    virtual std::vector<std::string> daemons() const = 0;

    // argv writing a WAV file to `output_path`.
    virtual std::vector<std::string> command(const std::string& output_path,
                                             const AudioFormat& format,
                                             uint32_t max_seconds) const = 0;

    virtual StopMethod stop_method() const { return StopMethod::Signal; }
};
