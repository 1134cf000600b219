/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace castline {

struct PipelineConfig {
    std::size_t maxWords = 225;
    double maxSeconds = 90.0;
    double wordsPerMinute = 150.0;
    std::chrono::milliseconds generationTimeout{std::chrono::seconds(300)};
    // Transcript prefix handed to the title request
    std::size_t titleContextChars = 6000;
};

struct SynthesisConfig {
    double placeholderSeconds = 3.0;
    std::uint32_t sampleRate = 24000;
};

struct Config {
    PipelineConfig pipeline;
    SynthesisConfig synthesis;
    int workers = 4;
    std::chrono::milliseconds watchdogInterval{250};

    std::string host = "0.0.0.0";
    int port = 8000;
    std::string ttsUrl;
    std::string ttsApiKey;
    std::string ttsModel;
    int ttsTimeoutSec = 120;

    // Defaults overridden by CASTLINE_* environment variables.
    [[nodiscard]] static Config fromEnv();
};

[[nodiscard]] int envInt(const char* name, int defv);
[[nodiscard]] double envDouble(const char* name, double defv);
[[nodiscard]] std::string envString(const char* name, const std::string& defv);

}
