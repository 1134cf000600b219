/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/job.hpp"
#include <algorithm>
#include <cctype>

namespace castline {

namespace {
std::string trimCopy(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

void dropBlank(std::optional<std::string>& field) {
    if (field) {
        *field = trimCopy(*field);
        if (field->empty()) {
            field.reset();
        }
    }
}
}

void JobRecord::appendFragment(const std::string& fragment) {
    fragments.push_back(fragment);
    fullText += fragment;
}

ValidationResult validate(JobSpec& spec) {
    if (spec.mode == PromptMode::Text) {
        if (trimCopy(spec.text).empty()) {
            return {false, "Text prompt empty"};
        }
        if (spec.text.size() > kMaxPromptBytes) {
            return {false, "Prompt exceeds maximum size limit (" + std::to_string(kMaxPromptBytes) + " bytes)"};
        }
    } else {
        if (spec.audio.empty()) {
            return {false, "Audio file missing"};
        }
        if (spec.audio.size() > kMaxAudioBytes) {
            return {false, "Audio exceeds maximum size limit (" + std::to_string(kMaxAudioBytes) + " bytes)"};
        }
        if (spec.audioMime.empty()) {
            spec.audioMime = "audio/webm";
        }
    }

    if (spec.speakers != 1 && spec.speakers != 2) {
        return {false, "Speaker count must be 1 or 2"};
    }

    std::vector<std::string> voices;
    for (const auto& voice : spec.voices) {
        std::string code = toUpperCopy(trimCopy(voice));
        if (!code.empty()) {
            voices.push_back(std::move(code));
        }
    }
    if (voices.empty()) {
        voices.assign(static_cast<std::size_t>(spec.speakers), "F");
    }
    if (voices.size() != static_cast<std::size_t>(spec.speakers)) {
        return {false, "Expected " + std::to_string(spec.speakers) + " voice(s), got " + std::to_string(voices.size())};
    }
    spec.voices = std::move(voices);

    dropBlank(spec.theme);
    dropBlank(spec.geoLocation);
    dropBlank(spec.language);

    return {true, ""};
}

std::size_t countWords(const std::string& text) noexcept {
    std::size_t words = 0;
    bool inWord = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++words;
        }
    }
    return words;
}

double estimateSpokenSeconds(std::size_t words, double wordsPerMinute) noexcept {
    if (wordsPerMinute <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(words) * 60.0 / wordsPerMinute;
}

}
