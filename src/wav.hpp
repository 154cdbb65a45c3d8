#pragma once

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <span>
#include <vector>

namespace wav {

inline constexpr size_t HEADER_SIZE = 44;

// Encodes raw PCM int16 samples into a WAV file in memory.
inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(HEADER_SIZE + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + HEADER_SIZE, samples.data(), data_size);
    }

    return out;
}

// Bytes of audio in a recorded file. Recorders killed mid-write often leave
// the header's size fields at zero, so the file size is what counts: a RIFF
// file contributes everything past its header, anything else its full size.
inline uintmax_t payload_bytes(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec || size == 0) return 0;

    std::ifstream f(path, std::ios::binary);
    char magic[4] = {};
    if (!f.read(magic, 4) || std::memcmp(magic, "RIFF", 4) != 0) {
        return size;
    }
    return size > HEADER_SIZE ? size - HEADER_SIZE : 0;
}

} // namespace wav
