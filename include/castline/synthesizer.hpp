/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

#include "castline/backend.hpp"
#include "castline/config.hpp"
#include "castline/registry.hpp"

namespace castline {

struct AudioResult {
    bool ok = false;
    AudioPayload audio;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Turns a finished transcript into audio exactly once per job. Concurrent
// callers for the same job share one in-flight synthesis.
class AudioSynthesizer final {
public:
    AudioSynthesizer(Registry& registry, SpeechBackend& backend, SynthesisConfig config);

    AudioSynthesizer(const AudioSynthesizer&) = delete;
    AudioSynthesizer& operator=(const AudioSynthesizer&) = delete;

    // NotFound for unknown jobs, NotReady while generating, JobFailed when
    // generation ended in error, Cancelled when shutdown ended the job.
    // Backend failures yield placeholder audio.
    [[nodiscard]] AudioResult synthesize(const JobId& jobId);

    [[nodiscard]] std::size_t inFlight() const;

private:
    // Backend failures turn into the placeholder. Anything else propagates.
    [[nodiscard]] AudioPayload render(const JobRecord& record);
    [[nodiscard]] AudioPayload placeholder() const;

    Registry& registry_;
    SpeechBackend& backend_;
    SynthesisConfig config_;

    mutable std::mutex flightsMutex_;
    std::unordered_map<JobId, std::shared_future<AudioPayload>> flights_;
};

}
