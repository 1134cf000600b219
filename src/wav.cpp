/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/wav.hpp"
#include <cmath>
#include <cstring>

namespace castline::wav {

void writeHeader(std::uint8_t* p, std::uint32_t sampleRate, std::uint32_t pcmBytes) {
    const std::uint32_t chunk_size = 36 + pcmBytes;
    const std::uint32_t byte_rate = sampleRate * 2;
    const std::uint16_t block_align = 2;
    const std::uint16_t bits = 16;
    const std::uint16_t channels = 1;
    const std::uint16_t fmt = 1;
    const std::uint32_t fmt_size = 16;
    std::memcpy(p, "RIFF", 4); p += 4;
    std::memcpy(p, &chunk_size, 4); p += 4;
    std::memcpy(p, "WAVE", 4); p += 4;
    std::memcpy(p, "fmt ", 4); p += 4;
    std::memcpy(p, &fmt_size, 4); p += 4;
    std::memcpy(p, &fmt, 2); p += 2;
    std::memcpy(p, &channels, 2); p += 2;
    std::memcpy(p, &sampleRate, 4); p += 4;
    std::memcpy(p, &byte_rate, 4); p += 4;
    std::memcpy(p, &block_align, 2); p += 2;
    std::memcpy(p, &bits, 2); p += 2;
    std::memcpy(p, "data", 4); p += 4;
    std::memcpy(p, &pcmBytes, 4);
}

Bytes silence(double seconds, std::uint32_t sampleRate) {
    if (seconds < 0.0) {
        seconds = 0.0;
    }
    const auto samples = static_cast<std::uint32_t>(std::lround(seconds * sampleRate));
    const std::uint32_t pcm_bytes = samples * 2;
    Bytes out(kHeaderBytes + pcm_bytes, 0);
    writeHeader(out.data(), sampleRate, pcm_bytes);
    return out;
}

bool looksLikeWav(const Bytes& bytes) noexcept {
    return bytes.size() >= kHeaderBytes &&
           std::memcmp(bytes.data(), "RIFF", 4) == 0 &&
           std::memcmp(bytes.data() + 8, "WAVE", 4) == 0;
}

}
