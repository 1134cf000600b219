/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/types.hpp"
#include <algorithm>
#include <cctype>

namespace castline {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

// Transition table. Rows are the current state, columns the target.
//              Pending  Streaming  Done   Error
// Pending      -        yes        no     yes
// Streaming    no       -          yes    yes
// Done         no       no         -      no
// Error        no       no         no     -
bool canTransition(Status from, Status to) noexcept {
    static constexpr bool table[4][4] = {
        {false, true,  false, true },
        {false, false, true,  true },
        {false, false, false, false},
        {false, false, false, false},
    };
    return table[static_cast<std::uint8_t>(from)][static_cast<std::uint8_t>(to)];
}

bool isTerminal(Status status) noexcept {
    return status == Status::Done || status == Status::Error;
}

const char* toString(Status status) noexcept {
    switch (status) {
        case Status::Pending:   return "pending";
        case Status::Streaming: return "streaming";
        case Status::Done:      return "done";
        case Status::Error:     return "error";
    }
    return "unknown";
}

const char* toString(PromptMode mode) noexcept {
    return mode == PromptMode::Audio ? "audio" : "text";
}

const char* toString(Category category) noexcept {
    return category == Category::Localisation ? "localisation" : "generated";
}

const char* toString(TruncationReason reason) noexcept {
    switch (reason) {
        case TruncationReason::None:     return "none";
        case TruncationReason::Words:    return "words";
        case TruncationReason::Duration: return "duration";
    }
    return "none";
}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:               return "none";
        case ErrorCode::Validation:         return "validation";
        case ErrorCode::NotFound:           return "not_found";
        case ErrorCode::NotReady:           return "not_ready";
        case ErrorCode::JobFailed:          return "job_failed";
        case ErrorCode::UpstreamGeneration: return "upstream_generation";
        case ErrorCode::Conflict:           return "conflict";
        case ErrorCode::Cancelled:          return "cancelled";
    }
    return "unknown";
}

std::optional<PromptMode> parsePromptMode(const std::string& value) {
    std::string lower = toLowerCopy(value);
    if (lower == "text") return PromptMode::Text;
    if (lower == "audio") return PromptMode::Audio;
    return std::nullopt;
}

std::optional<Category> parseCategory(const std::string& value) {
    std::string lower = toLowerCopy(value);
    if (lower == "generated") return Category::Generated;
    if (lower == "localisation" || lower == "localization") return Category::Localisation;
    return std::nullopt;
}

} // namespace castline
