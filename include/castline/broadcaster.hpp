/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "castline/registry.hpp"
#include "castline/types.hpp"

namespace castline {

enum class EventType : uint8_t { Meta, Chunk, Done, Error };

struct StreamEvent {
    EventType type = EventType::Chunk;
    std::string delta;
    std::string full;
    std::string title;
    std::string message;
    std::string improvedPrompt;
    bool truncated = false;
    // 1-based position of a chunk in the job's fragment log; 0 otherwise.
    std::uint64_t sequence = 0;
};

// One observer's read cursor over a job's fragment log. Not thread-safe;
// each observer owns its subscription.
class Subscription final {
public:
    Subscription(const Registry& registry, JobId jobId);

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // Next event in production order. Returns nullopt when nothing new
    // arrived within timeout, or once the terminal event was delivered.
    [[nodiscard]] std::optional<StreamEvent> next(std::chrono::milliseconds timeout);

    [[nodiscard]] bool finished() const noexcept { return finished_; }
    [[nodiscard]] const JobId& jobId() const noexcept { return jobId_; }
    [[nodiscard]] std::size_t delivered() const noexcept { return cursor_; }

private:
    [[nodiscard]] std::optional<StreamEvent> poll(std::uint64_t& revision, bool& exists);

    const Registry& registry_;
    JobId jobId_;
    std::size_t cursor_ = 0;
    std::string full_;
    bool metaSent_ = false;
    bool finished_ = false;
};

struct SubscribeResult {
    bool ok = false;
    std::unique_ptr<Subscription> subscription;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Hands out replay-then-live subscriptions. Delivery never blocks the
// pipeline: observers wait on the registry's per-job revision.
class Broadcaster final {
public:
    explicit Broadcaster(const Registry& registry) noexcept : registry_(registry) {}

    [[nodiscard]] SubscribeResult subscribe(const JobId& jobId) const;

private:
    const Registry& registry_;
};

}
