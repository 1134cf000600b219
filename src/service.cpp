/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/service.hpp"
#include "castline/logger.hpp"
#include "castline/pipeline.hpp"
#include "castline/pool.hpp"

namespace castline {

// Signal handling belongs to the binaries, not to Service.

Service::Service(GenerationBackend& generator, SpeechBackend& speech, Config config)
    : config_(std::move(config)),
      broadcaster_(registry_),
      synthesizer_(registry_, speech, config_.synthesis),
      saved_(registry_),
      pipeline_(std::make_unique<Pipeline>(registry_, generator, config_.pipeline)),
      pool_(std::make_unique<Pool>(config_.workers)) {
    LOG_DEBUG("Service created - workers: " + std::to_string(config_.workers));
}

Service::~Service() {
    shutdown();
}

bool Service::start() {
    if (running_.load()) {
        LOG_WARN("Service already running");
        return false;
    }

    LOG_INFO("Starting castline service...");
    setThreadName("Main");

    LOG_DEBUG("========================================");
    LOG_DEBUG("Workers: " + std::to_string(config_.workers));
    LOG_DEBUG("Max words: " + std::to_string(config_.pipeline.maxWords));
    LOG_DEBUG("Max seconds: " + std::to_string(config_.pipeline.maxSeconds));
    LOG_DEBUG("Words per minute: " + std::to_string(config_.pipeline.wordsPerMinute));
    LOG_DEBUG("Generation timeout: " + std::to_string(config_.pipeline.generationTimeout.count()) + "ms");
    LOG_DEBUG("========================================");

    try {
        if (!pool_->start([this](const JobId& jobId, int /*workerId*/) {
            (void)pipeline_->run(jobId);
        })) {
            LOG_ERROR("Failed to start pipeline pool");
            return false;
        }

        shutdown_.store(false);
        running_.store(true);
        watchdogThread_ = std::thread(&Service::watchdogLoop, this);

        LOG_DEBUG("Service started successfully");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start service: " + std::string(e.what()));
        pool_->stop();
        return false;
    }
}

void Service::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down service...");

    {
        std::lock_guard<std::mutex> lock(watchdogMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    watchdogWake_.notify_all();
    if (watchdogThread_.joinable()) {
        watchdogThread_.join();
    }

    // Queued and running jobs end in error so every observer gets a
    // terminal event; running pipelines then see their cancel flag.
    const std::size_t ended = failUnfinished("Service shutting down");
    if (ended > 0) {
        LOG_INFO("Ended " + std::to_string(ended) + " unfinished job(s)");
    }
    registry_.cancelAll();
    pool_->stop();

    LOG_INFO("Service shutdown complete");
}

CreateResult Service::submit(JobSpec spec) {
    CreateResult created = registry_.create(std::move(spec));
    if (!created) {
        return created;
    }
    if (!pool_->submit(created.id)) {
        (void)registry_.update(created.id, [](JobRecord& r) {
            r.status = Status::Error;
            r.error = "Service is not accepting jobs";
            r.errorCode = ErrorCode::Cancelled;
        });
        LOG_WARN("Job " + created.id + " created while service stopped");
    }
    return created;
}

std::size_t Service::failUnfinished(const std::string& reason) noexcept {
    std::size_t ended = 0;
    try {
        for (const auto& record : registry_.list()) {
            if (isTerminal(record.status)) {
                continue;
            }
            // Refused when the pipeline finished the job in the meantime.
            auto failed = registry_.update(record.id, [&](JobRecord& r) {
                if (!isTerminal(r.status)) {
                    r.status = Status::Error;
                    r.error = reason;
                    r.errorCode = ErrorCode::Cancelled;
                }
            });
            if (failed && failed.record->errorCode == ErrorCode::Cancelled) {
                ++ended;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to end unfinished jobs: " + std::string(e.what()));
    }
    return ended;
}

std::size_t Service::queueSize() const noexcept {
    return pool_->queueSize();
}

void Service::watchdogLoop() {
    setThreadName("Watchdog");
    LOG_DEBUG("Watchdog loop started");

    while (!shutdown_.load()) {
        std::size_t expired = pipeline_->expireOverdue(std::chrono::steady_clock::now());
        if (expired > 0) {
            LOG_WARN("Watchdog expired " + std::to_string(expired) + " job(s)");
        }

        std::unique_lock<std::mutex> lock(watchdogMutex_);
        watchdogWake_.wait_for(lock, config_.watchdogInterval, [this] { return shutdown_.load(); });
    }

    LOG_DEBUG("Watchdog loop stopped");
}

}
