/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/pipeline.hpp"
#include "castline/logger.hpp"
#include "castline/prompt.hpp"
#include <iomanip>
#include <sstream>
#include <vector>

namespace castline {

namespace {
std::string seconds(std::chrono::steady_clock::duration elapsed) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << std::chrono::duration<double>(elapsed).count() << "s";
    return ss.str();
}
}

Pipeline::Pipeline(Registry& registry, GenerationBackend& backend, PipelineConfig config)
    : registry_(registry), backend_(backend), config_(config) {
    LOG_DEBUG("Pipeline created - max words: " + std::to_string(config_.maxWords) +
              ", max seconds: " + std::to_string(config_.maxSeconds) +
              ", timeout: " + std::to_string(config_.generationTimeout.count()) + "ms");
}

ProcessResult Pipeline::run(const JobId& jobId) noexcept {
    LOG_DEBUG("Processing job: " + jobId);

    ProcessResult outcome = ProcessResult::Failed;
    try {
        CancelToken cancel = registry_.cancelToken(jobId);
        auto record = registry_.get(jobId);
        if (!cancel || !record) {
            LOG_DEBUG("Job not found or already deleted: " + jobId);
            return ProcessResult::NotFound;
        }
        if (record->status != Status::Pending) {
            LOG_DEBUG("Job already claimed: " + jobId);
            return ProcessResult::NotFound;
        }

        const auto deadline = std::chrono::steady_clock::now() + config_.generationTimeout;
        track(jobId, deadline);
        outcome = execute(*record, cancel, deadline);
    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing job " + jobId + ": " + std::string(e.what()));
        (void)fail(jobId, ErrorCode::JobFailed, "Internal processing error: " + std::string(e.what()));
        outcome = ProcessResult::Failed;
    } catch (...) {
        LOG_ERROR("Unknown exception processing job: " + jobId);
        (void)fail(jobId, ErrorCode::JobFailed, "Unknown internal processing error");
        outcome = ProcessResult::Failed;
    }

    untrack(jobId);
    return outcome;
}

ProcessResult Pipeline::execute(const JobRecord& record, const CancelToken& cancel,
                                std::chrono::steady_clock::time_point deadline) {
    const JobId& jobId = record.id;
    const auto startTime = std::chrono::steady_clock::now();

    // Step 1: raw input (audio prompts are transcribed first)
    std::string rawInput = resolveInput(record, cancel);
    if (isCancelled(cancel)) {
        return ProcessResult::Cancelled;
    }

    // Step 2: augmentation
    GenerationRequest improveRequest;
    improveRequest.prompt = prompt::improvementRequest(record, rawInput);
    improveRequest.useSearch = record.useSearch;
    GenerationResult improved = backend_.complete(improveRequest, cancel);
    if (isCancelled(cancel)) {
        return ProcessResult::Cancelled;
    }
    if (!improved.ok || improved.output.find_first_not_of(" \t\r\n") == std::string::npos) {
        std::string reason = improved.error.empty() ? "empty response" : improved.error;
        (void)fail(jobId, ErrorCode::UpstreamGeneration, "Prompt augmentation failed: " + reason);
        return ProcessResult::Failed;
    }

    // Step 3: open the stream
    auto opened = registry_.update(jobId, [&](JobRecord& r) {
        r.improvedPrompt = improved.output;
        r.status = Status::Streaming;
    });
    if (!opened) {
        LOG_DEBUG("Job gone before streaming: " + jobId);
        return ProcessResult::Cancelled;
    }

    StreamState state;
    std::string error;
    bool streamed = streamTranscript(jobId, improved.output, cancel, deadline, state, error);

    if (isCancelled(cancel) || state.lost) {
        LOG_INFO("Job cancelled: " + jobId);
        return ProcessResult::Cancelled;
    }
    if (state.timedOut) {
        (void)fail(jobId, ErrorCode::UpstreamGeneration,
                   "Generation timed out after " + seconds(config_.generationTimeout));
        return ProcessResult::Failed;
    }
    if (!streamed) {
        (void)fail(jobId, ErrorCode::UpstreamGeneration, error);
        return ProcessResult::Failed;
    }

    auto current = registry_.get(jobId);
    if (!current) {
        return ProcessResult::Cancelled;
    }
    if (current->fullText.find_first_not_of(" \t\r\n") == std::string::npos) {
        (void)fail(jobId, ErrorCode::UpstreamGeneration, "Generation produced no transcript");
        return ProcessResult::Failed;
    }

    // Step 4: finalize
    std::string title = deriveTitle(current->fullText, cancel);
    if (isCancelled(cancel)) {
        return ProcessResult::Cancelled;
    }

    auto finished = registry_.update(jobId, [&](JobRecord& r) {
        r.title = title;
        r.status = Status::Done;
    });
    if (!finished) {
        LOG_WARN("Failed to finalize job " + jobId + ": " + finished.message);
        return finished.error == ErrorCode::NotFound ? ProcessResult::Cancelled : ProcessResult::Failed;
    }

    LOG_INFO("JOB COMPLETED: " + jobId + " -> " + std::to_string(countWords(finished.record->fullText)) +
             " words" + (finished.record->truncated ? " (truncated)" : "") + " in " +
             seconds(std::chrono::steady_clock::now() - startTime));
    return ProcessResult::Success;
}

std::string Pipeline::resolveInput(const JobRecord& record, const CancelToken& cancel) {
    if (record.mode == PromptMode::Text) {
        return record.text;
    }
    if (!record.inputAudio || record.inputAudio->empty()) {
        return "(Audio transcription failed; proceed with generic prompt)";
    }

    GenerationResult heard = backend_.transcribe(*record.inputAudio, record.inputAudioMime,
                                                 prompt::transcriptionInstruction(), cancel);
    if (!heard.ok) {
        LOG_WARN("Audio transcription failed for job " + record.id + ": " + heard.error);
        return "(Audio transcription failed; proceed with generic prompt)";
    }
    if (heard.output.find_first_not_of(" \t\r\n") == std::string::npos) {
        return "(Audio transcript empty)";
    }
    LOG_DEBUG("Transcribed " + std::to_string(heard.output.size()) + " chars for job " + record.id);
    return heard.output;
}

bool Pipeline::streamTranscript(const JobId& jobId, const std::string& improved,
                                const CancelToken& cancel,
                                std::chrono::steady_clock::time_point deadline,
                                StreamState& state, std::string& error) {
    GenerationRequest request;
    request.prompt = improved;

    auto onFragment = [&](const std::string& fragment) -> bool {
        if (isCancelled(cancel)) {
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            state.timedOut = true;
            return false;
        }
        if (fragment.empty()) {
            return true;
        }

        bool capped = false;
        auto appended = registry_.update(jobId, [&](JobRecord& r) {
            r.appendFragment(fragment);
            // Word cap is checked first; with the defaults both caps meet at
            // 225 words, so it is the one reported.
            const std::size_t words = countWords(r.fullText);
            if (words >= config_.maxWords) {
                r.truncated = true;
                r.truncationReason = TruncationReason::Words;
            } else if (estimateSpokenSeconds(words, config_.wordsPerMinute) >= config_.maxSeconds) {
                r.truncated = true;
                r.truncationReason = TruncationReason::Duration;
            }
            capped = r.truncated;
        });
        if (!appended) {
            // Deleted, or the watchdog already failed the job.
            state.lost = true;
            return false;
        }
        if (capped) {
            state.truncated = true;
            LOG_DEBUG("Content cap reached for job " + jobId + " (" +
                      toString(appended.record->truncationReason) + ")");
            return false;
        }
        return true;
    };

    GenerationResult result = backend_.stream(request, onFragment, cancel);
    if (state.truncated || state.timedOut || state.lost) {
        return true;
    }
    if (!result.ok) {
        error = result.error.empty() ? "Upstream generation failed" : result.error;
        LOG_WARN("Job failed during generation: " + jobId + " - " + error);
        return false;
    }
    return true;
}

std::string Pipeline::deriveTitle(const std::string& transcript, const CancelToken& cancel) {
    GenerationRequest request;
    request.prompt = prompt::titleRequest(transcript, config_.titleContextChars);
    request.maxTokens = 32;

    GenerationResult result = backend_.complete(request, cancel);
    if (result.ok) {
        std::string title = prompt::normalizeTitle(result.output);
        if (!title.empty()) {
            return title;
        }
    } else {
        LOG_DEBUG("Title request failed, using heuristic: " + result.error);
    }
    return prompt::heuristicTitle(transcript);
}

bool Pipeline::fail(const JobId& jobId, ErrorCode code, const std::string& message) noexcept {
    try {
        auto failed = registry_.update(jobId, [&](JobRecord& r) {
            r.status = Status::Error;
            r.error = message;
            r.errorCode = code;
        });
        if (failed) {
            LOG_WARN("Job failed: " + jobId + " - " + message);
            return true;
        }
        LOG_DEBUG("Could not mark job " + jobId + " failed: " + failed.message);
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record failure for job " + jobId + ": " + std::string(e.what()));
        return false;
    }
}

std::size_t Pipeline::expireOverdue(std::chrono::steady_clock::time_point now) noexcept {
    std::vector<JobId> overdue;
    try {
        std::lock_guard<std::mutex> lock(activeMutex_);
        for (auto it = deadlines_.begin(); it != deadlines_.end(); ) {
            if (it->second <= now) {
                overdue.push_back(it->first);
                it = deadlines_.erase(it);
            } else {
                ++it;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Watchdog scan failed: " + std::string(e.what()));
        return 0;
    }

    for (const auto& jobId : overdue) {
        // Fail first so observers see the timeout rather than a cancellation.
        (void)fail(jobId, ErrorCode::UpstreamGeneration,
                   "Generation timed out after " + seconds(config_.generationTimeout));
        if (CancelToken cancel = registry_.cancelToken(jobId)) {
            cancel->store(true);
        }
        LOG_WARN("Watchdog expired job: " + jobId);
    }
    return overdue.size();
}

std::size_t Pipeline::activeCount() const {
    std::lock_guard<std::mutex> lock(activeMutex_);
    return deadlines_.size();
}

void Pipeline::track(const JobId& jobId, std::chrono::steady_clock::time_point deadline) {
    std::lock_guard<std::mutex> lock(activeMutex_);
    deadlines_[jobId] = deadline;
}

void Pipeline::untrack(const JobId& jobId) noexcept {
    try {
        std::lock_guard<std::mutex> lock(activeMutex_);
        deadlines_.erase(jobId);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to release deadline for job " + jobId + ": " + std::string(e.what()));
    }
}

}
