#include "audio/recorders.hpp"

#include <string>

std::vector<std::string> PipeWireRecorder::command(const std::string& output_path,
                                                   const AudioFormat& format,
                                                   uint32_t /*max_seconds*/) const {
    return {
        "pw-record",
        "--format=s" + std::to_string(format.bits_per_sample),
        "--rate=" + std::to_string(format.sample_rate),
        "--channels=" + std::to_string(format.channels),
        output_path,
    };
}

std::vector<std::string> PulseRecorder::command(const std::string& output_path,
                                                const AudioFormat& format,
                                                uint32_t /*max_seconds*/) const {
    return {
        "parecord",
        "--format=s" + std::to_string(format.bits_per_sample) + "le",
        "--rate=" + std::to_string(format.sample_rate),
        "--channels=" + std::to_string(format.channels),
        "--file-format=wav",
        output_path,
    };
}

std::vector<std::string> AlsaRecorder::command(const std::string& output_path,
                                               const AudioFormat& format,
                                               uint32_t max_seconds) const {
    return {
        "arecord", "-q",
        "-f", "S" + std::to_string(format.bits_per_sample) + "_LE",
        "-r", std::to_string(format.sample_rate),
        "-c", std::to_string(format.channels),
        "-t", "wav",
        "-d", std::to_string(max_seconds),
        output_path,
    };
}

std::vector<std::string> SoxRecorder::command(const std::string& output_path,
                                              const AudioFormat& format,
                                              uint32_t max_seconds) const {
    return {
        "rec", "-q",
        "-c", std::to_string(format.channels),
        "-b", std::to_string(format.bits_per_sample),
        "-e", "signed-integer",
        output_path,
        "rate", std::to_string(format.sample_rate),
        "trim", "0", std::to_string(max_seconds),
    };
}

std::vector<std::unique_ptr<AudioCapability>> default_recorders() {
    std::vector<std::unique_ptr<AudioCapability>> out;
    out.push_back(std::make_unique<PipeWireRecorder>());
    out.push_back(std::make_unique<PulseRecorder>());
    out.push_back(std::make_unique<AlsaRecorder>());
    out.push_back(std::make_unique<SoxRecorder>());
    return out;
}
