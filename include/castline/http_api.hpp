/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <string>

#include "castline/service.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace castline {

// HTTP status for a component error code.
[[nodiscard]] int httpStatus(ErrorCode code) noexcept;

// {"error", "code"} body with the mapped status. NotReady also gets a
// Retry-After header.
void sendError(httplib::Response& res, ErrorCode code, const std::string& message);

// Reads a create request, either the web client's multipart form
// (prompt_mode, text, use_internet, speakers, voices, audio_file) or a
// JSON body. False with error set when the request is malformed.
[[nodiscard]] bool specFromRequest(const httplib::Request& req, JobSpec& spec, std::string& error);

// /api routes over a running Service. Streams are served as SSE; each open
// stream holds one server thread until its terminal event.
class HttpApi final {
public:
    explicit HttpApi(Service& service, std::chrono::seconds keepalive = std::chrono::seconds(15)) noexcept
        : service_(service), keepalive_(keepalive) {}

    HttpApi(const HttpApi&) = delete;
    HttpApi& operator=(const HttpApi&) = delete;

    void registerRoutes(httplib::Server& server);

    // Makes open streams end at their next poll.
    void stopStreams() noexcept { stopping_.store(true); }

private:
    Service& service_;
    std::chrono::seconds keepalive_;
    std::atomic<bool> stopping_{false};
};

}
