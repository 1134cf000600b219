/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>

#include "castline/job.hpp"

namespace castline::wav {

constexpr std::size_t kHeaderBytes = 44;

// 16-bit mono PCM RIFF header for pcmBytes of sample data.
void writeHeader(std::uint8_t* p, std::uint32_t sampleRate, std::uint32_t pcmBytes);

// Deterministic silent clip used when speech synthesis is unavailable.
[[nodiscard]] Bytes silence(double seconds, std::uint32_t sampleRate);

[[nodiscard]] bool looksLikeWav(const Bytes& bytes) noexcept;

}
