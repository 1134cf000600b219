/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "castline/types.hpp"

namespace castline {

using Bytes = std::vector<std::uint8_t>;

struct AudioPayload {
    std::shared_ptr<const Bytes> bytes;
    std::string contentType;
    bool placeholder = false;

    [[nodiscard]] std::size_t size() const noexcept { return bytes ? bytes->size() : 0; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
};

// What a client asks for. Validated and normalized before a record exists.
struct JobSpec {
    PromptMode mode = PromptMode::Text;
    std::string text;
    Bytes audio;
    std::string audioMime;
    int speakers = 1;
    std::vector<std::string> voices;
    Category category = Category::Generated;
    std::optional<std::string> theme;
    std::optional<std::string> geoLocation;
    std::optional<std::string> language;
    bool useSearch = false;
};

struct JobRecord {
    JobId id;
    Status status = Status::Pending;

    PromptMode mode = PromptMode::Text;
    std::string text;
    std::shared_ptr<const Bytes> inputAudio;
    std::string inputAudioMime;

    int speakerCount = 1;
    std::vector<std::string> voices;
    Category category = Category::Generated;
    std::optional<std::string> theme;
    std::optional<std::string> geoLocation;
    std::optional<std::string> language;
    bool useSearch = false;

    // Append-only. fullText is always the concatenation of fragments.
    std::vector<std::string> fragments;
    std::string fullText;
    std::optional<std::string> improvedPrompt;

    std::optional<std::string> title;
    bool truncated = false;
    TruncationReason truncationReason = TruncationReason::None;

    std::optional<AudioPayload> audio;

    bool saved = false;
    Category savedCategory = Category::Generated;
    std::uint64_t savedOrder = 0;

    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;
    std::optional<std::string> error;
    // Why the job failed. None unless status is Error.
    ErrorCode errorCode = ErrorCode::None;

    // Bumped by the registry on every committed update.
    std::uint64_t revision = 0;

    void appendFragment(const std::string& fragment);
};

struct ValidationResult {
    bool ok = false;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

constexpr std::size_t kMaxPromptBytes = 1'000'000;
constexpr std::size_t kMaxAudioBytes = 25ULL * 1024 * 1024;

// Checks a spec and normalizes it in place (voice codes upper-cased,
// missing voices defaulted).
[[nodiscard]] ValidationResult validate(JobSpec& spec);

[[nodiscard]] std::size_t countWords(const std::string& text) noexcept;

[[nodiscard]] double estimateSpokenSeconds(std::size_t words, double wordsPerMinute) noexcept;

}
