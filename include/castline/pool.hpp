/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "castline/types.hpp"

namespace castline {

using JobProcessor = std::function<void(const JobId&, int workerId)>;

// Fixed set of pipeline threads draining a FIFO of job ids.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobProcessor processor);
    void stop() noexcept;
    bool submit(const JobId& jobId) noexcept;

    [[nodiscard]] std::size_t queueSize() const noexcept;

private:
    void workerLoop(int workerId);

    int workers_;
    JobProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::queue<JobId> jobQueue_;

    std::vector<std::thread> workerThreads_;
};

}
