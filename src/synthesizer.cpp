/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/synthesizer.hpp"
#include "castline/logger.hpp"
#include "castline/wav.hpp"
#include <stdexcept>

namespace castline {

namespace {
using FlightMap = std::unordered_map<JobId, std::shared_future<AudioPayload>>;

// Releases a leader's flight on every exit path. Followers of a flight that
// ends without a value get an exception from their future.
class FlightRelease final {
public:
    FlightRelease(std::mutex& mutex, FlightMap& flights, const JobId& jobId,
                  std::promise<AudioPayload>& promise) noexcept
        : mutex_(mutex), flights_(flights), jobId_(jobId), promise_(promise) {}

    ~FlightRelease() {
        if (done_) {
            return;
        }
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            promise_.set_exception(std::make_exception_ptr(std::runtime_error("synthesis aborted")));
            flights_.erase(jobId_);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to release synthesis for job " + jobId_ + ": " + e.what());
        }
    }

    FlightRelease(const FlightRelease&) = delete;
    FlightRelease& operator=(const FlightRelease&) = delete;

    void complete(const AudioPayload& payload) {
        std::lock_guard<std::mutex> lock(mutex_);
        promise_.set_value(payload);
        done_ = true;
        flights_.erase(jobId_);
    }

private:
    std::mutex& mutex_;
    FlightMap& flights_;
    const JobId& jobId_;
    std::promise<AudioPayload>& promise_;
    bool done_ = false;
};

AudioResult readiness(const std::optional<JobRecord>& record) {
    if (!record) {
        return {false, {}, ErrorCode::NotFound, "Job not found"};
    }
    if (record->status == Status::Error && record->errorCode == ErrorCode::Cancelled) {
        return {false, {}, ErrorCode::Cancelled, "Job was cancelled: " + record->error.value_or("cancelled")};
    }
    if (record->status == Status::Error) {
        return {false, {}, ErrorCode::JobFailed, "Job failed: " + record->error.value_or("unknown error")};
    }
    if (record->status != Status::Done) {
        return {false, {}, ErrorCode::NotReady, std::string("Job is still ") + toString(record->status)};
    }
    if (record->audio) {
        return {true, *record->audio, ErrorCode::None, ""};
    }
    return {false, {}, ErrorCode::None, ""};
}
}

AudioSynthesizer::AudioSynthesizer(Registry& registry, SpeechBackend& backend, SynthesisConfig config)
    : registry_(registry), backend_(backend), config_(config) {
}

AudioResult AudioSynthesizer::synthesize(const JobId& jobId) {
    auto record = registry_.get(jobId);
    AudioResult ready = readiness(record);
    if (ready.ok || ready.error != ErrorCode::None) {
        return ready;
    }

    std::promise<AudioPayload> promise;
    std::shared_future<AudioPayload> flight;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lock(flightsMutex_);
        auto it = flights_.find(jobId);
        if (it != flights_.end()) {
            flight = it->second;
        } else {
            // A leader stores its audio before leaving the map, so checking
            // the record again under the lock cannot miss a finished flight.
            record = registry_.get(jobId);
            ready = readiness(record);
            if (ready.ok || ready.error != ErrorCode::None) {
                return ready;
            }
            flight = promise.get_future().share();
            flights_.emplace(jobId, flight);
            leader = true;
        }
    }

    if (!leader) {
        LOG_DEBUG("Joining in-flight synthesis for job " + jobId);
        try {
            AudioPayload shared = flight.get();
            if (shared.empty()) {
                return {false, {}, ErrorCode::NotReady, "Audio could not be produced"};
            }
            return {true, std::move(shared), ErrorCode::None, ""};
        } catch (const std::exception& e) {
            return {false, {}, ErrorCode::NotReady, "Synthesis interrupted: " + std::string(e.what())};
        }
    }

    FlightRelease release(flightsMutex_, flights_, jobId, promise);
    AudioPayload payload;
    UpdateResult stored;
    try {
        payload = render(*record);
        stored = registry_.update(jobId, [&](JobRecord& r) {
            if (!r.audio) {
                r.audio = payload;
            }
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Audio synthesis failed for job " + jobId + ": " + e.what());
        return {false, {}, ErrorCode::NotReady, "Synthesis failed: " + std::string(e.what())};
    }
    if (stored && stored.record->audio) {
        payload = *stored.record->audio;
    }
    release.complete(payload);

    if (!stored) {
        LOG_DEBUG("Job " + jobId + " removed during synthesis");
        return {false, {}, ErrorCode::NotFound, "Job not found"};
    }
    return {true, payload, ErrorCode::None, ""};
}

std::size_t AudioSynthesizer::inFlight() const {
    std::lock_guard<std::mutex> lock(flightsMutex_);
    return flights_.size();
}

AudioPayload AudioSynthesizer::render(const JobRecord& record) {
    try {
        SpeechRequest request;
        request.transcript = record.fullText;
        request.speakerCount = record.speakerCount;
        request.voices = record.voices;
        request.language = record.language;

        LOG_INFO("Synthesizing audio for job " + record.id + " (" + std::to_string(record.fullText.size()) + " chars)");
        SpeechResult result = backend_.synthesize(request);
        if (result.ok && !result.audio.empty()) {
            AudioPayload payload;
            payload.bytes = std::make_shared<const Bytes>(std::move(result.audio));
            payload.contentType = result.contentType.empty() ? "audio/wav" : result.contentType;
            LOG_INFO("Audio ready for job " + record.id + ": " + std::to_string(payload.size()) + " bytes");
            return payload;
        }
        LOG_WARN("Speech synthesis failed for job " + record.id + ", using placeholder: " +
                 (result.error.empty() ? "empty audio" : result.error));
    } catch (const std::exception& e) {
        LOG_WARN("Speech synthesis threw for job " + record.id + ", using placeholder: " + std::string(e.what()));
    }
    return placeholder();
}

AudioPayload AudioSynthesizer::placeholder() const {
    AudioPayload payload;
    payload.bytes = std::make_shared<const Bytes>(wav::silence(config_.placeholderSeconds, config_.sampleRate));
    payload.contentType = "audio/wav";
    payload.placeholder = true;
    return payload;
}

}
