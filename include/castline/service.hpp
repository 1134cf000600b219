/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "castline/backend.hpp"
#include "castline/broadcaster.hpp"
#include "castline/config.hpp"
#include "castline/registry.hpp"
#include "castline/saved.hpp"
#include "castline/synthesizer.hpp"

namespace castline {

class Pool;
class Pipeline;

// Owns the core components and the threads that drive them.
class Service final {
public:
    Service(GenerationBackend& generator, SpeechBackend& speech, Config config);
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;
    Service(Service&&) = delete;
    Service& operator=(Service&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // Creates the job and queues its pipeline. Returns before generation starts.
    [[nodiscard]] CreateResult submit(JobSpec spec);

    [[nodiscard]] std::optional<JobRecord> snapshot(const JobId& id) const { return registry_.get(id); }
    [[nodiscard]] SubscribeResult subscribe(const JobId& id) const { return broadcaster_.subscribe(id); }
    [[nodiscard]] AudioResult audio(const JobId& id) { return synthesizer_.synthesize(id); }
    SaveResult remove(const JobId& id) { return saved_.remove(id); }

    [[nodiscard]] Registry& registry() noexcept { return registry_; }
    [[nodiscard]] SavedIndex& saved() noexcept { return saved_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] std::size_t queueSize() const noexcept;

private:
    void watchdogLoop();
    // Moves every pending or streaming job to Error (Cancelled).
    std::size_t failUnfinished(const std::string& reason) noexcept;

    Config config_;
    Registry registry_;
    Broadcaster broadcaster_;
    AudioSynthesizer synthesizer_;
    SavedIndex saved_;
    std::unique_ptr<Pipeline> pipeline_;
    std::unique_ptr<Pool> pool_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::mutex watchdogMutex_;
    std::condition_variable watchdogWake_;
    std::thread watchdogThread_;
};

}
