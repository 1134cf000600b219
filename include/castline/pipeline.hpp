/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

#include "castline/backend.hpp"
#include "castline/config.hpp"
#include "castline/registry.hpp"
#include "castline/types.hpp"

namespace castline {

enum class ProcessResult : uint8_t {
    Success,
    Failed,
    NotFound,
    Cancelled
};

// Drives one job pending -> streaming -> done|error. Holds job ids only;
// every write goes through Registry::update.
class Pipeline {
public:
    Pipeline(Registry& registry, GenerationBackend& backend, PipelineConfig config);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) = delete;
    Pipeline& operator=(Pipeline&&) = delete;

    [[nodiscard]] ProcessResult run(const JobId& jobId) noexcept;

    // Fails and cancels every job running past the generation timeout.
    // Returns how many jobs were expired.
    std::size_t expireOverdue(std::chrono::steady_clock::time_point now) noexcept;

    [[nodiscard]] std::size_t activeCount() const;
    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

private:
    struct StreamState {
        bool truncated = false;
        bool timedOut = false;
        bool lost = false;
    };

    [[nodiscard]] ProcessResult execute(const JobRecord& record, const CancelToken& cancel,
                                        std::chrono::steady_clock::time_point deadline);
    [[nodiscard]] std::string resolveInput(const JobRecord& record, const CancelToken& cancel);
    [[nodiscard]] bool streamTranscript(const JobId& jobId, const std::string& improved,
                                        const CancelToken& cancel,
                                        std::chrono::steady_clock::time_point deadline,
                                        StreamState& state, std::string& error);
    [[nodiscard]] std::string deriveTitle(const std::string& transcript, const CancelToken& cancel);

    bool fail(const JobId& jobId, ErrorCode code, const std::string& message) noexcept;
    void track(const JobId& jobId, std::chrono::steady_clock::time_point deadline);
    void untrack(const JobId& jobId) noexcept;

    Registry& registry_;
    GenerationBackend& backend_;
    PipelineConfig config_;

    mutable std::mutex activeMutex_;
    std::unordered_map<JobId, std::chrono::steady_clock::time_point> deadlines_;
};

}
