/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "castline/broadcaster.hpp"
#include "castline/job.hpp"

namespace castline {

using json = nlohmann::ordered_json;

[[nodiscard]] const char* eventName(EventType type) noexcept;

// meta {improved_prompt}, chunk {delta, full, truncated},
// done {title, full, truncated}, error {message}
[[nodiscard]] json eventPayload(const StreamEvent& event);

// "event: <name>\ndata: <json>\n\n"
[[nodiscard]] std::string toSse(const StreamEvent& event);

// Full state of one job at call time.
[[nodiscard]] json snapshotJson(const JobRecord& record);

// Short form used by the status listing.
[[nodiscard]] json summaryJson(const JobRecord& record);

// Reads a create request body into spec. Accepts "prompt" or "text",
// base64 "audio" with "audio_mime", voices as an array or "F,M".
// Fields missing from body leave spec as it was.
// False with error set when a field has the wrong type or value.
[[nodiscard]] bool specFromJson(const json& body, JobSpec& spec, std::string& error);

// Invalid UTF-8 is replaced rather than thrown on.
[[nodiscard]] std::string dumpJson(const json& value);

}
