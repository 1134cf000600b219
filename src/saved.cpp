/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/saved.hpp"
#include "castline/logger.hpp"
#include <algorithm>

namespace castline {

SaveResult SavedIndex::save(const JobId& jobId, std::optional<Category> category) {
    bool changed = false;
    auto result = registry_.update(jobId, [&](JobRecord& r) {
        if (r.saved) {
            return;
        }
        r.saved = true;
        r.savedCategory = category.value_or(r.category);
        r.savedOrder = ++saveCounter_;
        changed = true;
    });
    if (!result) {
        return {false, false, result.error, result.message};
    }
    if (changed) {
        LOG_INFO("Job saved: " + jobId + " (" + toString(result.record->savedCategory) + ")");
    }
    return {true, changed, ErrorCode::None, ""};
}

SaveResult SavedIndex::unsave(const JobId& jobId) {
    bool changed = false;
    auto result = registry_.update(jobId, [&](JobRecord& r) {
        changed = r.saved;
        r.saved = false;
    });
    if (!result) {
        return {false, false, result.error, result.message};
    }
    if (changed) {
        LOG_INFO("Job unsaved: " + jobId);
    }
    return {true, changed, ErrorCode::None, ""};
}

std::vector<JobRecord> SavedIndex::listSaved(Category category) const {
    std::vector<JobRecord> saved;
    for (auto& record : registry_.list()) {
        if (record.saved && record.savedCategory == category) {
            saved.push_back(std::move(record));
        }
    }
    std::sort(saved.begin(), saved.end(), [](const JobRecord& a, const JobRecord& b) {
        return a.savedOrder < b.savedOrder;
    });
    return saved;
}

SaveResult SavedIndex::remove(const JobId& jobId) {
    if (!registry_.remove(jobId)) {
        return {false, false, ErrorCode::NotFound, "Job not found"};
    }
    return {true, true, ErrorCode::None, ""};
}

}
