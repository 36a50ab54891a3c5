#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

// In-memory RIFF/WAVE container for mono 16-bit PCM, as whisper servers expect.
namespace wav {

inline constexpr size_t kHeaderSize = 44;

namespace detail {

inline void put_le(std::vector<uint8_t>& out, uint32_t value, int bytes) {
    for (int i = 0; i < bytes; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

inline void put_tag(std::vector<uint8_t>& out, const char (&tag)[5]) {
    out.insert(out.end(), tag, tag + 4);
}

} // namespace detail

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits = 16;
    const uint32_t data_bytes = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out;
    out.reserve(kHeaderSize + data_bytes);

    detail::put_tag(out, "RIFF");
    detail::put_le(out, 36 + data_bytes, 4);
    detail::put_tag(out, "WAVE");

    detail::put_tag(out, "fmt ");
    detail::put_le(out, 16, 4);                                 // fmt chunk size
    detail::put_le(out, 1, 2);                                  // PCM
    detail::put_le(out, channels, 2);
    detail::put_le(out, sample_rate, 4);
    detail::put_le(out, sample_rate * channels * bits / 8, 4);  // byte rate
    detail::put_le(out, channels * bits / 8, 2);                // block align
    detail::put_le(out, bits, 2);

    detail::put_tag(out, "data");
    detail::put_le(out, data_bytes, 4);
    for (int16_t s : samples) {
        detail::put_le(out, static_cast<uint16_t>(s), 2);
    }
    return out;
}

inline double duration_seconds(size_t sample_count, uint32_t sample_rate) {
    return sample_rate == 0 ? 0.0 : static_cast<double>(sample_count) / sample_rate;
}

} // namespace wav
