/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace castline {

// Job lifecycle states. Forward only; Done and Error are terminal.
enum class Status : std::uint8_t { Pending, Streaming, Done, Error };

enum class PromptMode : std::uint8_t { Text, Audio };

enum class Category : std::uint8_t { Generated, Localisation };

enum class TruncationReason : std::uint8_t { None, Words, Duration };

enum class ErrorCode : std::uint8_t {
    None = 0,
    Validation,
    NotFound,
    NotReady,
    JobFailed,
    UpstreamGeneration,
    Conflict,
    Cancelled
};

// Opaque job identifier.
using JobId = std::string;

// Shared cooperative cancellation flag, one per job.
using CancelToken = std::shared_ptr<std::atomic<bool>>;

[[nodiscard]] inline bool isCancelled(const CancelToken& token) noexcept {
    return token && token->load();
}

[[nodiscard]] bool canTransition(Status from, Status to) noexcept;
[[nodiscard]] bool isTerminal(Status status) noexcept;

[[nodiscard]] const char* toString(Status status) noexcept;
[[nodiscard]] const char* toString(PromptMode mode) noexcept;
[[nodiscard]] const char* toString(Category category) noexcept;
[[nodiscard]] const char* toString(TruncationReason reason) noexcept;
[[nodiscard]] const char* toString(ErrorCode code) noexcept;

[[nodiscard]] std::optional<PromptMode> parsePromptMode(const std::string& value);
[[nodiscard]] std::optional<Category> parseCategory(const std::string& value);

} // namespace castline
