/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/prompt.hpp"
#include <cctype>
#include <regex>
#include <sstream>

namespace castline::prompt {

namespace {
const char* kImprovementInstruction =
    "Your task:\n"
    "You are a prompt generator that takes a user idea (either spoken or written) and converts it into a detailed, "
    "high-quality prompt to be used for a text-to-speech dialogue model.\n"
    "Analyze the user's input and extract the following information:\n"
    "- Characters: Who are the speakers? What are their personalities?\n"
    "- Scenario / Topic: What is the conversation about?\n"
    "- Tone / Style: What is the mood (e.g., casual, professional, educational)?\n"
    "- Language mix: Are multiple languages or specific accents mentioned?\n"
    "- Special rules: Are there any other instructions like correcting mistakes?\n"
    "Use the extracted data to build the final prompt. If any field is missing, use generic but sensible assumptions.\n"
    "Your output should:\n"
    "- Describe the roles, personalities, and speaking styles of each character.\n"
    "- Clearly explain the scenario and context of the conversation.\n"
    "- Specify the tone and style.\n"
    "- Include clear instructions for language usage.\n"
    "- Provide clear output formatting instructions (e.g., \"Only output dialogue, labeled with character names\").\n"
    "- Avoid adding any extra narration, sound effects, or non-dialogue text.\n"
    "Output ONLY the improved prompt itself, not any commentary or explanation.";

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string firstWords(const std::string& text, std::size_t maxWords) {
    std::istringstream in(text);
    std::string word;
    std::string out;
    std::size_t n = 0;
    while (n < maxWords && in >> word) {
        if (!out.empty()) out += ' ';
        out += word;
        ++n;
    }
    return out;
}
}

std::string voiceWord(const std::string& code) {
    if (code == "M") return "male";
    if (code == "F") return "female";
    return "unspecified gender";
}

std::string speakerInstructions(int speakers, const std::vector<std::string>& voices) {
    if (speakers <= 1) {
        std::string gender = voices.empty() ? "unspecified" : voiceWord(voices[0]);
        return "There is exactly one speaker. It is a " + gender + " host speaking alone. "
               "Write the output as a monologue (no other voices).";
    }
    std::string v1 = voices.size() > 0 ? voiceWord(voices[0]) : "unspecified";
    std::string v2 = voices.size() > 1 ? voiceWord(voices[1]) : "unspecified";
    return "There are exactly two speakers. Speaker 1 is " + v1 + ". Speaker 2 is " + v2 + ". "
           "Alternate their dialogue naturally. Label each line with 'Speaker 1:' or 'Speaker 2:' only. "
           "Do not invent extra characters.";
}

std::string contextInstructions(const JobRecord& record) {
    std::string out;
    if (record.theme) {
        out += "The episode theme is: " + *record.theme + ".\n";
    }
    if (record.geoLocation) {
        out += "Ground the content in this location and its local culture: " + *record.geoLocation + ".\n";
    }
    if (record.language) {
        out += "Write the entire dialogue in " + *record.language + ".\n";
    }
    return out;
}

std::string improvementRequest(const JobRecord& record, const std::string& rawInput) {
    std::string request = kImprovementInstruction;
    request += "\n\n";
    request += speakerInstructions(record.speakerCount, record.voices);
    request += "\n";
    std::string context = contextInstructions(record);
    if (!context.empty()) {
        request += context;
    }
    if (record.useSearch) {
        request += "Use up-to-date facts from a web search where the topic needs them.\n";
    }
    request += "\nUser idea:\n";
    request += rawInput;
    return request;
}

std::string titleRequest(const std::string& transcript, std::size_t maxChars) {
    return "Generate a concise, compelling podcast episode title (max 8 words) based ONLY on this transcript."
           " No quotes, no extra punctuation. Transcript:\n" + transcript.substr(0, maxChars);
}

std::string transcriptionInstruction() {
    return "Transcribe the spoken audio accurately. Output only the plain text transcript without speaker labels. "
           "Do not invent content beyond what is clearly heard.";
}

std::string normalizeTitle(const std::string& raw, std::size_t maxWords) {
    std::string line = trim(raw);
    auto newline = line.find('\n');
    if (newline != std::string::npos) {
        line = trim(line.substr(0, newline));
    }
    static const std::regex labelRegex("^(title|episode title)\\s*:\\s*", std::regex::icase);
    line = std::regex_replace(line, labelRegex, "");

    static const std::string quotes = "\"'`*#";
    while (!line.empty() && quotes.find(line.front()) != std::string::npos) line.erase(0, 1);
    while (!line.empty() && quotes.find(line.back()) != std::string::npos) line.pop_back();

    return firstWords(trim(line), maxWords);
}

std::string heuristicTitle(const std::string& transcript, std::size_t maxWords) {
    // Speaker labels are not part of the content
    static const std::regex speakerRegex("Speaker\\s*\\d+\\s*:", std::regex::icase);
    std::string text = std::regex_replace(transcript, speakerRegex, " ");

    std::string sentence = trim(text);
    auto end = sentence.find_first_of(".!?\n");
    if (end != std::string::npos) {
        sentence = sentence.substr(0, end);
    }
    std::string title = normalizeTitle(sentence, maxWords);
    return title.empty() ? "Untitled Episode" : title;
}

}
