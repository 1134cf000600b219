/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "castline/job.hpp"
#include "castline/types.hpp"

namespace castline {

struct GenerationRequest {
    std::string prompt;
    // Allow the backend to ground the answer on web search, if it can.
    bool useSearch = false;
    // 0 keeps the backend default.
    int maxTokens = 0;
};

struct GenerationResult {
    bool ok = false;
    std::string output;
    std::string error;
};

// Receives each decoded fragment in order. Returning false stops generation.
using FragmentCallback = std::function<bool(const std::string&)>;

// Text generation seam. Implementations must poll the cancel token between
// fragments and return promptly once it is raised.
class GenerationBackend {
public:
    virtual ~GenerationBackend() = default;

    [[nodiscard]] virtual GenerationResult stream(const GenerationRequest& request,
                                                  const FragmentCallback& onFragment,
                                                  const CancelToken& cancel) = 0;

    [[nodiscard]] virtual GenerationResult complete(const GenerationRequest& request,
                                                    const CancelToken& cancel) = 0;

    [[nodiscard]] virtual GenerationResult transcribe(const Bytes& audio, const std::string& mimeType,
                                                      const std::string& instruction,
                                                      const CancelToken& cancel) = 0;
};

struct SpeechRequest {
    std::string transcript;
    int speakerCount = 1;
    std::vector<std::string> voices;
    std::optional<std::string> language;
};

struct SpeechResult {
    bool ok = false;
    Bytes audio;
    std::string contentType;
    std::string error;
};

class SpeechBackend {
public:
    virtual ~SpeechBackend() = default;

    [[nodiscard]] virtual SpeechResult synthesize(const SpeechRequest& request) = 0;
};

}
