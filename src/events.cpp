/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/events.hpp"
#include "castline/base64.hpp"
#include <chrono>
#include <sstream>

namespace castline {

namespace {
json optionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

long long epochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

bool readOptionalString(const json& body, const char* key, std::optional<std::string>& out, std::string& error) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        error = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}
}

const char* eventName(EventType type) noexcept {
    switch (type) {
        case EventType::Meta:  return "meta";
        case EventType::Chunk: return "chunk";
        case EventType::Done:  return "done";
        case EventType::Error: return "error";
    }
    return "meta";
}

json eventPayload(const StreamEvent& event) {
    switch (event.type) {
        case EventType::Meta:
            return json{{"improved_prompt", event.improvedPrompt}};
        case EventType::Chunk:
            return json{{"delta", event.delta}, {"full", event.full}, {"truncated", event.truncated}};
        case EventType::Done:
            return json{{"title", event.title}, {"full", event.full}, {"truncated", event.truncated}};
        case EventType::Error:
            return json{{"message", event.message}};
    }
    return json::object();
}

std::string toSse(const StreamEvent& event) {
    const char* name = eventName(event.type);
    const std::string data = dumpJson(eventPayload(event));
    std::string msg;
    msg.reserve(16 + data.size());
    msg += "event: ";
    msg += name;
    msg += "\ndata: ";
    msg += data;
    msg += "\n\n";
    return msg;
}

json snapshotJson(const JobRecord& record) {
    json voices = json::array();
    for (const auto& v : record.voices) {
        voices.push_back(v);
    }

    json j;
    j["id"] = record.id;
    j["status"] = toString(record.status);
    j["mode"] = toString(record.mode);
    j["title"] = optionalString(record.title);
    j["transcript"] = record.fullText;
    j["length"] = record.fullText.size();
    j["words"] = countWords(record.fullText);
    j["speakers"] = record.speakerCount;
    j["voices"] = voices;
    j["category"] = toString(record.category);
    j["theme"] = optionalString(record.theme);
    j["geo_location"] = optionalString(record.geoLocation);
    j["language"] = optionalString(record.language);
    j["use_search"] = record.useSearch;
    j["truncated"] = record.truncated;
    j["truncation_reason"] = toString(record.truncationReason);
    j["saved"] = record.saved;
    j["saved_category"] = record.saved ? json(toString(record.savedCategory)) : json(nullptr);
    j["has_audio"] = record.audio.has_value();
    j["audio_placeholder"] = record.audio ? record.audio->placeholder : false;
    j["error"] = optionalString(record.error);
    j["error_code"] = record.errorCode == ErrorCode::None ? json(nullptr) : json(toString(record.errorCode));
    j["created_at"] = epochMillis(record.createdAt);
    j["updated_at"] = epochMillis(record.updatedAt);
    return j;
}

json summaryJson(const JobRecord& record) {
    json voices = json::array();
    for (const auto& v : record.voices) {
        voices.push_back(v);
    }
    return json{
        {"status", toString(record.status)},
        {"title", optionalString(record.title)},
        {"length", record.fullText.size()},
        {"speakers", record.speakerCount},
        {"voices", voices},
    };
}

bool specFromJson(const json& body, JobSpec& spec, std::string& error) {
    if (!body.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    auto mode = body.find("mode");
    if (mode != body.end() && !mode->is_null()) {
        auto parsed = mode->is_string() ? parsePromptMode(mode->get<std::string>()) : std::nullopt;
        if (!parsed) {
            error = "mode must be \"text\" or \"audio\"";
            return false;
        }
        spec.mode = *parsed;
    } else if (body.contains("audio")) {
        spec.mode = PromptMode::Audio;
    }

    for (const char* key : {"prompt", "text"}) {
        auto it = body.find(key);
        if (it != body.end() && !it->is_null()) {
            if (!it->is_string()) {
                error = std::string(key) + " must be a string";
                return false;
            }
            spec.text = it->get<std::string>();
            break;
        }
    }

    auto audio = body.find("audio");
    if (audio != body.end() && !audio->is_null()) {
        if (!audio->is_string()) {
            error = "audio must be a base64 string";
            return false;
        }
        auto decoded = base64::decode(audio->get<std::string>());
        if (!decoded) {
            error = "audio is not valid base64";
            return false;
        }
        spec.audio = std::move(*decoded);
    }
    for (const char* key : {"audio_mime", "mime_type"}) {
        auto it = body.find(key);
        if (it != body.end() && !it->is_null()) {
            if (!it->is_string()) {
                error = std::string(key) + " must be a string";
                return false;
            }
            spec.audioMime = it->get<std::string>();
            break;
        }
    }

    auto speakers = body.find("speakers");
    if (speakers != body.end() && !speakers->is_null()) {
        if (speakers->is_number_integer()) {
            spec.speakers = speakers->get<int>();
        } else if (speakers->is_string()) {
            try {
                spec.speakers = std::stoi(speakers->get<std::string>());
            } catch (const std::exception&) {
                error = "speakers must be a number";
                return false;
            }
        } else {
            error = "speakers must be a number";
            return false;
        }
    }

    auto voices = body.find("voices");
    if (voices != body.end() && !voices->is_null()) {
        spec.voices.clear();
        if (voices->is_array()) {
            for (const auto& v : *voices) {
                if (!v.is_string()) {
                    error = "voices must be strings";
                    return false;
                }
                spec.voices.push_back(v.get<std::string>());
            }
        } else if (voices->is_string()) {
            std::stringstream ss(voices->get<std::string>());
            std::string item;
            while (std::getline(ss, item, ',')) {
                spec.voices.push_back(item);
            }
        } else {
            error = "voices must be an array or a comma separated string";
            return false;
        }
    }

    auto category = body.find("category");
    if (category != body.end() && !category->is_null()) {
        auto parsed = category->is_string() ? parseCategory(category->get<std::string>()) : std::nullopt;
        if (!parsed) {
            error = "category must be \"generated\" or \"localisation\"";
            return false;
        }
        spec.category = *parsed;
    }

    if (!readOptionalString(body, "theme", spec.theme, error) ||
        !readOptionalString(body, "geo_location", spec.geoLocation, error) ||
        !readOptionalString(body, "language", spec.language, error)) {
        return false;
    }

    auto search = body.find("use_search");
    if (search != body.end() && !search->is_null()) {
        if (!search->is_boolean()) {
            error = "use_search must be a boolean";
            return false;
        }
        spec.useSearch = search->get<bool>();
    }
    return true;
}

std::string dumpJson(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

}
