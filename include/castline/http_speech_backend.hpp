/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "castline/backend.hpp"

namespace castline {

struct SpeechEndpoint {
    bool https = false;
    std::string host;
    int port = 0;
    std::string path = "/";
};

// Splits an http(s) URL into the pieces an httplib client needs.
[[nodiscard]] bool parseEndpoint(const std::string& url, SpeechEndpoint& out, std::string& error);

// Posts the transcript to an OpenAI-style /v1/audio/speech endpoint and
// returns the audio body. An empty URL makes every call fail, which the
// synthesizer turns into a placeholder clip.
class HttpSpeechBackend final : public SpeechBackend {
public:
    HttpSpeechBackend(std::string url, int timeoutSec, std::string apiKey = "", std::string model = "");

    [[nodiscard]] SpeechResult synthesize(const SpeechRequest& request) override;

    [[nodiscard]] bool configured() const noexcept { return !url_.empty(); }

private:
    std::string url_;
    int timeoutSec_;
    std::string apiKey_;
    std::string model_;
};

}
