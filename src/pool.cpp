/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/pool.hpp"
#include "castline/logger.hpp"
#include <system_error>

namespace castline {

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid job processor provided");
        return false;
    }

    processor_ = std::move(processor);
    shutdown_.store(false);
    running_.store(true);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        LOG_INFO("Pool started with " + std::to_string(workers_) + " pipeline threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    jobAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped = jobQueue_.size();
        std::queue<JobId>().swap(jobQueue_);
    }
    if (dropped > 0) {
        LOG_WARN("Pool stopped with " + std::to_string(dropped) + " unclaimed job(s)");
    }

    LOG_INFO("Pool stopped");
}

bool Pool::submit(const JobId& jobId) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_.load() || shutdown_.load()) {
                LOG_DEBUG("Cannot submit job to stopped pool: " + jobId);
                return false;
            }
            jobQueue_.push(jobId);
        }
        jobAvailable_.notify_one();
        LOG_DEBUG("Job queued: " + jobId);
        return true;
    } catch (...) {
        LOG_ERROR("Failed to queue job: " + jobId);
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return jobQueue_.size();
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to read queue size: " + std::string(e.what()));
        return 0;
    }
}

void Pool::workerLoop(int workerId) {
    setThreadName("Pipeline-" + std::to_string(workerId));
    LOG_DEBUG("Pipeline-" + std::to_string(workerId) + " thread started");

    while (true) {
        JobId jobId;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            jobAvailable_.wait(lock, [this] {
                return !jobQueue_.empty() || shutdown_.load();
            });
            if (shutdown_.load()) {
                break;
            }
            jobId = std::move(jobQueue_.front());
            jobQueue_.pop();
        }

        JobLogScope scope(jobId);
        LOG_DEBUG("Pipeline-" + std::to_string(workerId) + " claimed job");
        try {
            processor_(jobId, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Pipeline-" + std::to_string(workerId) + " job error: " +
                      std::string(e.what()) + " (job: " + jobId + ")");
        } catch (...) {
            LOG_ERROR("Pipeline-" + std::to_string(workerId) + " unknown job error (job: " + jobId + ")");
        }
    }

    LOG_DEBUG("Pipeline-" + std::to_string(workerId) + " stopped");
}

}
