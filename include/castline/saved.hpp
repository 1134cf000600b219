/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "castline/registry.hpp"

namespace castline {

struct SaveResult {
    bool ok = false;
    // False when the call was a no-op (already saved / not saved).
    bool changed = false;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class SavedIndex final {
public:
    explicit SavedIndex(Registry& registry) noexcept : registry_(registry) {}

    SavedIndex(const SavedIndex&) = delete;
    SavedIndex& operator=(const SavedIndex&) = delete;

    // category overrides the job's own category for the saved listing.
    SaveResult save(const JobId& jobId, std::optional<Category> category = std::nullopt);
    SaveResult unsave(const JobId& jobId);

    // Saved jobs in category, oldest save first.
    [[nodiscard]] std::vector<JobRecord> listSaved(Category category) const;

    // Deletes the job outright and cancels any running pipeline.
    SaveResult remove(const JobId& jobId);

private:
    Registry& registry_;
    std::atomic<std::uint64_t> saveCounter_{0};
};

}
