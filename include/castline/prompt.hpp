/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

#include "castline/job.hpp"

namespace castline::prompt {

// "M" -> "male", "F" -> "female", anything else unspecified.
[[nodiscard]] std::string voiceWord(const std::string& code);

[[nodiscard]] std::string speakerInstructions(int speakers, const std::vector<std::string>& voices);

// Localisation context from theme, location and language; empty when none set.
[[nodiscard]] std::string contextInstructions(const JobRecord& record);

// Request that turns the raw idea into a detailed dialogue prompt.
[[nodiscard]] std::string improvementRequest(const JobRecord& record, const std::string& rawInput);

[[nodiscard]] std::string titleRequest(const std::string& transcript, std::size_t maxChars);

[[nodiscard]] std::string transcriptionInstruction();

// Single line, no surrounding quotes, at most maxWords words.
[[nodiscard]] std::string normalizeTitle(const std::string& raw, std::size_t maxWords = 8);

// Title taken from the transcript itself when no title request succeeds.
[[nodiscard]] std::string heuristicTitle(const std::string& transcript, std::size_t maxWords = 8);

}
