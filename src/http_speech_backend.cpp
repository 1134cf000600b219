/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/http_speech_backend.hpp"
#include "castline/base64.hpp"
#include "castline/logger.hpp"
#include "castline/prompt.hpp"
#include "castline/wav.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace castline {

using json = nlohmann::json;

namespace {
std::string truncateText(const std::string& text, std::size_t limit = 200) {
    return text.size() <= limit ? text : text.substr(0, limit) + "...";
}

std::string lowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

bool parseEndpoint(const std::string& url, SpeechEndpoint& out, std::string& error) {
    static const std::regex re(R"(^(https?)://([^/:?#]+)(?::([0-9]+))?([^?#]*)?(\?[^#]*)?$)", std::regex::icase);
    std::smatch m;
    if (!std::regex_match(url, m, re)) {
        error = "invalid speech URL: " + url;
        return false;
    }

    out.https = lowerCopy(m[1].str()) == "https";
    out.host = m[2].str();
    out.port = out.https ? 443 : 80;
    if (m[3].matched && !m[3].str().empty()) {
        int port = 0;
        try {
            port = std::stoi(m[3].str());
        } catch (const std::exception&) {
            port = 0;
        }
        if (port < 1 || port > 65535) {
            error = "invalid port in speech URL";
            return false;
        }
        out.port = port;
    }
    out.path = m[4].matched ? m[4].str() : "/";
    if (out.path.empty()) {
        out.path = "/";
    }
    if (m[5].matched) {
        out.path += m[5].str();
    }
    return true;
}

HttpSpeechBackend::HttpSpeechBackend(std::string url, int timeoutSec, std::string apiKey, std::string model)
    : url_(std::move(url)), timeoutSec_(timeoutSec > 0 ? timeoutSec : 120),
      apiKey_(std::move(apiKey)), model_(std::move(model)) {}

SpeechResult HttpSpeechBackend::synthesize(const SpeechRequest& request) {
    if (url_.empty()) {
        return {false, {}, "", "speech endpoint not configured"};
    }

    SpeechEndpoint endpoint;
    std::string error;
    if (!parseEndpoint(url_, endpoint, error)) {
        return {false, {}, "", error};
    }

    json body;
    if (!model_.empty()) {
        body["model"] = model_;
    }
    body["input"] = request.transcript;
    body["voice"] = request.voices.empty() ? "female" : prompt::voiceWord(request.voices.front());
    body["voices"] = request.voices;
    body["speakers"] = request.speakerCount;
    if (request.language) {
        body["language"] = *request.language;
    }
    body["response_format"] = "wav";

    httplib::Headers headers;
    if (!apiKey_.empty()) {
        headers.emplace("Authorization", "Bearer " + apiKey_);
    }

    const std::string payload = body.dump();
    httplib::Result res;

    if (endpoint.https) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        httplib::SSLClient cli(endpoint.host, endpoint.port);
        cli.set_follow_location(true);
        cli.set_connection_timeout(timeoutSec_, 0);
        cli.set_read_timeout(timeoutSec_, 0);
        cli.set_write_timeout(timeoutSec_, 0);
        res = cli.Post(endpoint.path.c_str(), headers, payload, "application/json");
#else
        return {false, {}, "", "https speech URL requires CPPHTTPLIB_OPENSSL_SUPPORT"};
#endif
    } else {
        httplib::Client cli(endpoint.host, endpoint.port);
        cli.set_follow_location(true);
        cli.set_connection_timeout(timeoutSec_, 0);
        cli.set_read_timeout(timeoutSec_, 0);
        cli.set_write_timeout(timeoutSec_, 0);
        res = cli.Post(endpoint.path.c_str(), headers, payload, "application/json");
    }

    if (!res) {
        return {false, {}, "", "speech request failed: " + httplib::to_string(res.error())};
    }
    if (res->status < 200 || res->status >= 300) {
        return {false, {}, "", "speech HTTP " + std::to_string(res->status) + ": " + truncateText(res->body)};
    }

    std::string contentType = res->get_header_value("Content-Type");
    if (contentType.rfind("application/json", 0) == 0) {
        // Some servers wrap the clip as {"audio": "<base64>", "content_type": ...}
        json rsp = json::parse(res->body, nullptr, false);
        if (rsp.is_discarded() || !rsp.contains("audio") || !rsp["audio"].is_string()) {
            return {false, {}, "", "speech response carried no audio: " + truncateText(res->body)};
        }
        auto decoded = base64::decode(rsp["audio"].get<std::string>());
        if (!decoded || decoded->empty()) {
            return {false, {}, "", "speech response audio is not valid base64"};
        }
        std::string type = rsp.value("content_type", std::string("audio/wav"));
        return {true, std::move(*decoded), type, ""};
    }

    Bytes audio(res->body.begin(), res->body.end());
    if (audio.empty()) {
        return {false, {}, "", "speech response was empty"};
    }
    if (contentType.empty() || contentType == "application/octet-stream") {
        contentType = wav::looksLikeWav(audio) ? "audio/wav" : "application/octet-stream";
    }
    LOG_DEBUG("Speech backend returned " + std::to_string(audio.size()) + " bytes (" + contentType + ")");
    return {true, std::move(audio), contentType, ""};
}

}
