/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "castline/job.hpp"
#include "castline/types.hpp"

namespace castline {

struct CreateResult {
    bool ok = false;
    JobId id;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct UpdateResult {
    bool ok = false;
    std::optional<JobRecord> record;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

enum class WaitResult : uint8_t { Changed, Timeout, Removed };

using Mutator = std::function<void(JobRecord&)>;
using Reader = std::function<void(const JobRecord&)>;

// Owns every JobRecord. Each job has its own mutex and condition variable;
// the map mutex only guards lookup, insertion and erasure.
class Registry final {
public:
    Registry() noexcept = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = delete;
    Registry& operator=(Registry&&) = delete;

    [[nodiscard]] CreateResult create(JobSpec spec);
    [[nodiscard]] std::optional<JobRecord> get(const JobId& id) const;

    // Runs reader under the job lock without copying the record.
    bool read(const JobId& id, const Reader& reader) const;

    // Applies mutator to a copy and commits it atomically. The commit is
    // refused when it breaks a record invariant (illegal status transition,
    // rewritten transcript, cleared truncation, replaced title or audio).
    [[nodiscard]] UpdateResult update(const JobId& id, const Mutator& mutator);

    // Cancels in-flight work for the job, wakes its waiters and drops it.
    bool remove(const JobId& id);

    [[nodiscard]] std::vector<JobRecord> list() const;
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] WaitResult waitForRevision(const JobId& id, std::uint64_t seenRevision,
                                             std::chrono::milliseconds timeout) const;

    [[nodiscard]] CancelToken cancelToken(const JobId& id) const;

    // Raises every job's cancel flag (shutdown).
    void cancelAll() noexcept;

private:
    struct Entry {
        mutable std::mutex mutex;
        mutable std::condition_variable changed;
        JobRecord record;
        CancelToken cancel = std::make_shared<std::atomic<bool>>(false);
        bool removed = false;
    };

    [[nodiscard]] std::shared_ptr<Entry> find(const JobId& id) const;
    [[nodiscard]] static JobId generateId();
    [[nodiscard]] static std::string checkInvariants(const JobRecord& before, const JobRecord& after);

    mutable std::mutex mapMutex_;
    std::unordered_map<JobId, std::shared_ptr<Entry>> entries_;
    std::vector<JobId> order_;
};

}
