/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/broadcaster.hpp"
#include "castline/logger.hpp"

namespace castline {

Subscription::Subscription(const Registry& registry, JobId jobId)
    : registry_(registry), jobId_(std::move(jobId)) {
}

std::optional<StreamEvent> Subscription::poll(std::uint64_t& revision, bool& exists) {
    std::optional<StreamEvent> event;

    exists = registry_.read(jobId_, [&](const JobRecord& r) {
        revision = r.revision;

        // Failed jobs report the error straight away, without the partial transcript.
        if (r.status == Status::Error) {
            StreamEvent e;
            e.type = EventType::Error;
            e.message = r.error.value_or("Generation failed");
            event = std::move(e);
            return;
        }

        if (!metaSent_ && r.improvedPrompt) {
            metaSent_ = true;
            StreamEvent e;
            e.type = EventType::Meta;
            e.improvedPrompt = *r.improvedPrompt;
            event = std::move(e);
            return;
        }

        if (cursor_ < r.fragments.size()) {
            StreamEvent e;
            e.type = EventType::Chunk;
            e.delta = r.fragments[cursor_];
            ++cursor_;
            full_ += e.delta;
            e.full = full_;
            e.truncated = r.truncated && cursor_ == r.fragments.size();
            e.sequence = cursor_;
            event = std::move(e);
            return;
        }

        if (r.status == Status::Done) {
            StreamEvent e;
            e.type = EventType::Done;
            e.title = r.title.value_or("");
            e.full = r.fullText;
            e.truncated = r.truncated;
            event = std::move(e);
        }
    });

    if (event && (event->type == EventType::Done || event->type == EventType::Error)) {
        finished_ = true;
    }
    return event;
}

std::optional<StreamEvent> Subscription::next(std::chrono::milliseconds timeout) {
    if (finished_) {
        return std::nullopt;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        std::uint64_t revision = 0;
        bool exists = false;
        auto event = poll(revision, exists);
        if (event) {
            return event;
        }
        if (!exists) {
            finished_ = true;
            StreamEvent e;
            e.type = EventType::Error;
            e.message = "Job was deleted";
            return e;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (remaining.count() == 0) {
            remaining = std::chrono::milliseconds(1);
        }
        // Removed falls through to the next poll, which reports the deletion.
        if (registry_.waitForRevision(jobId_, revision, remaining) == WaitResult::Timeout) {
            return std::nullopt;
        }
    }
}

SubscribeResult Broadcaster::subscribe(const JobId& jobId) const {
    auto status = std::optional<Status>();
    registry_.read(jobId, [&](const JobRecord& r) { status = r.status; });
    if (!status) {
        return {false, nullptr, ErrorCode::NotFound, "Job not found"};
    }

    LOG_DEBUG("Observer subscribed to job " + jobId + " (" + toString(*status) + ")");
    auto subscription = std::make_unique<Subscription>(registry_, jobId);
    return {true, std::move(subscription), ErrorCode::None, ""};
}

}
