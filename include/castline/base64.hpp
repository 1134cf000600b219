/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "castline/job.hpp"

namespace castline::base64 {

[[nodiscard]] std::string encode(const std::uint8_t* data, std::size_t len);

// Accepts padded or unpadded input and ignores whitespace. A data: URL
// prefix ("data:audio/webm;base64,") is skipped. nullopt on bad characters.
[[nodiscard]] std::optional<Bytes> decode(const std::string& text);

}
