/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/config.hpp"
#include "castline/logger.hpp"
#include <cstdlib>
#include <stdexcept>

namespace castline {

int envInt(const char* name, int defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid integer in ") + name + ": " + val);
        return defv;
    }
}

double envDouble(const char* name, double defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid number in ") + name + ": " + val);
        return defv;
    }
}

std::string envString(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}

Config Config::fromEnv() {
    Config config;

    int maxWords = envInt("CASTLINE_MAX_WORDS", static_cast<int>(config.pipeline.maxWords));
    if (maxWords > 0) {
        config.pipeline.maxWords = static_cast<std::size_t>(maxWords);
    }
    double maxSeconds = envDouble("CASTLINE_MAX_SECONDS", config.pipeline.maxSeconds);
    if (maxSeconds > 0.0) {
        config.pipeline.maxSeconds = maxSeconds;
    }
    double wpm = envDouble("CASTLINE_WPM", config.pipeline.wordsPerMinute);
    if (wpm > 0.0) {
        config.pipeline.wordsPerMinute = wpm;
    }
    int timeoutSec = envInt("CASTLINE_TIMEOUT_SEC", 300);
    if (timeoutSec > 0) {
        config.pipeline.generationTimeout = std::chrono::seconds(timeoutSec);
    }

    double placeholder = envDouble("CASTLINE_PLACEHOLDER_SEC", config.synthesis.placeholderSeconds);
    if (placeholder > 0.0) {
        config.synthesis.placeholderSeconds = placeholder;
    }

    int workers = envInt("CASTLINE_WORKERS", config.workers);
    if (workers > 0) {
        config.workers = workers;
    }

    config.host = envString("CASTLINE_HOST", config.host);
    config.port = envInt("CASTLINE_PORT", config.port);
    config.ttsUrl = envString("CASTLINE_TTS_URL", config.ttsUrl);
    config.ttsApiKey = envString("CASTLINE_TTS_API_KEY", config.ttsApiKey);
    config.ttsModel = envString("CASTLINE_TTS_MODEL", config.ttsModel);
    config.ttsTimeoutSec = envInt("CASTLINE_TTS_TIMEOUT_SEC", config.ttsTimeoutSec);

    return config;
}

}
