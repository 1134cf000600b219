/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fixtures/scripted_backend.hpp"
#include "castline/wav.hpp"
#include <stdexcept>
#include <thread>

namespace castline::fixtures {

void Gate::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

void Gate::open() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
    }
    cv_.notify_all();
}

bool Gate::pass(const CancelToken& cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!closed_) {
        return true;
    }
    ++blocked_;
    cv_.notify_all();
    while (closed_ && !isCancelled(cancel)) {
        cv_.wait_for(lock, std::chrono::milliseconds(2));
    }
    --blocked_;
    return !isCancelled(cancel);
}

bool Gate::waitUntilBlocked(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return blocked_ > 0; });
}

std::vector<std::string> ScriptedBackend::wordFragments(std::size_t count, std::size_t wordsEach) {
    std::vector<std::string> fragments;
    std::size_t n = 0;
    for (std::size_t i = 0; i < count; ++i) {
        std::string fragment;
        for (std::size_t w = 0; w < wordsEach; ++w) {
            fragment += "word" + std::to_string(++n) + " ";
        }
        fragments.push_back(fragment);
    }
    return fragments;
}

void ScriptedBackend::setFragments(std::vector<std::string> fragments) {
    std::lock_guard<std::mutex> lock(mutex_);
    fragments_ = std::move(fragments);
}

void ScriptedBackend::setImproved(std::string improved) {
    std::lock_guard<std::mutex> lock(mutex_);
    improved_ = std::move(improved);
    improveError_.reset();
}

void ScriptedBackend::failImprove(std::string error) {
    std::lock_guard<std::mutex> lock(mutex_);
    improveError_ = std::move(error);
}

void ScriptedBackend::setTitle(std::string title) {
    std::lock_guard<std::mutex> lock(mutex_);
    title_ = std::move(title);
    titleError_.reset();
}

void ScriptedBackend::failTitle(std::string error) {
    std::lock_guard<std::mutex> lock(mutex_);
    titleError_ = std::move(error);
}

void ScriptedBackend::failStreamAt(std::size_t index, std::string error) {
    std::lock_guard<std::mutex> lock(mutex_);
    failAt_ = index;
    streamError_ = std::move(error);
}

void ScriptedBackend::setFragmentDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    delay_ = delay;
}

void ScriptedBackend::hangAfterFragments(bool hang) {
    std::lock_guard<std::mutex> lock(mutex_);
    hang_ = hang;
}

void ScriptedBackend::gateBeforeFragment(std::size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    gateAt_ = index;
}

void ScriptedBackend::setTranscription(bool ok, std::string text) {
    std::lock_guard<std::mutex> lock(mutex_);
    transcribeOk_ = ok;
    transcription_ = std::move(text);
}

std::string ScriptedBackend::lastImprovePrompt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastImprovePrompt_;
}

std::string ScriptedBackend::lastStreamPrompt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastStreamPrompt_;
}

GenerationResult ScriptedBackend::stream(const GenerationRequest& request,
                                         const FragmentCallback& onFragment,
                                         const CancelToken& cancel) {
    ++streamCalls_;
    std::vector<std::string> fragments;
    std::chrono::milliseconds delay{0};
    std::size_t failAt = kNever;
    std::size_t gateAt = kNever;
    std::string streamError;
    bool hang = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastStreamPrompt_ = request.prompt;
        fragments = fragments_;
        delay = delay_;
        failAt = failAt_;
        gateAt = gateAt_;
        streamError = streamError_;
        hang = hang_;
    }

    std::string output;
    for (std::size_t i = 0; i < fragments.size(); ++i) {
        if (i == gateAt && !fragmentGate.pass(cancel)) {
            return {false, output, "Cancelled"};
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (isCancelled(cancel)) {
            return {false, output, "Cancelled"};
        }
        if (i == failAt) {
            return {false, output, streamError};
        }
        output += fragments[i];
        if (onFragment && !onFragment(fragments[i])) {
            return {true, output, ""};
        }
    }

    if (failAt != kNever && failAt >= fragments.size()) {
        return {false, output, streamError};
    }
    if (hang) {
        while (!isCancelled(cancel)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return {false, output, "Cancelled"};
    }
    return {true, output, ""};
}

GenerationResult ScriptedBackend::complete(const GenerationRequest& request, const CancelToken& cancel) {
    const bool titleRequest = request.prompt.find("podcast episode title") != std::string::npos;
    if (titleRequest) {
        ++titleCalls_;
        std::lock_guard<std::mutex> lock(mutex_);
        if (titleError_) {
            return {false, "", *titleError_};
        }
        return {true, title_, ""};
    }

    ++improveCalls_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastImprovePrompt_ = request.prompt;
    }
    if (!improveGate.pass(cancel)) {
        return {false, "", "Cancelled"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (improveError_) {
        return {false, "", *improveError_};
    }
    return {true, improved_, ""};
}

GenerationResult ScriptedBackend::transcribe(const Bytes& /*audio*/, const std::string& /*mimeType*/,
                                             const std::string& /*instruction*/,
                                             const CancelToken& /*cancel*/) {
    ++transcribeCalls_;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transcribeOk_) {
        return {false, "", transcription_};
    }
    return {true, transcription_, ""};
}

FakeSpeechBackend::FakeSpeechBackend()
    : clip_(wav::silence(0.25, 8000)) {
}

SpeechResult FakeSpeechBackend::synthesize(const SpeechRequest& request) {
    ++calls_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastTranscript_ = request.transcript;
    }
    if (delay_.count() > 0) {
        std::this_thread::sleep_for(delay_);
    }
    if (throws_) {
        throw std::runtime_error("speech backend exploded");
    }
    if (throwsForeign_) {
        throw ForeignError{};
    }
    if (!error_.empty()) {
        return {false, {}, "", error_};
    }
    return {true, clip_, "audio/wav", ""};
}

std::string FakeSpeechBackend::lastTranscript() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastTranscript_;
}

}
