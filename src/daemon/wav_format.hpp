#pragma once

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

// Recordings produced by the audio service are canonical 44-byte-header WAV
// files holding mono 16-bit PCM at 16 kHz.
namespace wav {

constexpr uint64_t header_bytes = 44;
constexpr uint32_t sample_rate = 16000;
constexpr uint16_t channels = 1;
constexpr uint16_t bits_per_sample = 16;
constexpr uint64_t payload_bytes_per_second = uint64_t{sample_rate} * channels * bits_per_sample / 8;

inline int64_t duration_ms_from_size(uint64_t file_size) {
    uint64_t data_bytes = file_size > header_bytes ? file_size - header_bytes : 0;
    return std::llround(static_cast<double>(data_bytes) * 1000.0 / payload_bytes_per_second);
}

// Estimated from the file size alone; the file is not decoded.
inline std::optional<int64_t> estimate_duration_ms(const std::string& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return duration_ms_from_size(size);
}

} // namespace wav
