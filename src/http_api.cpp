/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/http_api.hpp"
#include "castline/events.hpp"
#include "castline/logger.hpp"
#include <memory>

#include <httplib.h>

namespace castline {

namespace {
constexpr const char* kJsonType = "application/json; charset=utf-8";
constexpr std::chrono::milliseconds kStreamPoll{1000};

void sendJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(dumpJson(body), kJsonType);
}

// Multipart form as sent by the web client: prompt_mode, text, use_internet,
// speakers, voices and an optional audio_file upload.
json formToJson(const httplib::Request& req, JobSpec& spec) {
    json body = json::object();
    auto field = [&](const char* name, const char* key) {
        if (req.form.has_field(name)) {
            body[key] = req.form.get_field(name);
        }
    };
    field("prompt_mode", "mode");
    field("mode", "mode");
    field("text", "text");
    field("speakers", "speakers");
    field("voices", "voices");
    field("category", "category");
    field("theme", "theme");
    field("geo_location", "geo_location");
    field("language", "language");

    for (const char* name : {"use_internet", "use_search"}) {
        if (req.form.has_field(name)) {
            const std::string value = req.form.get_field(name);
            body["use_search"] = (value == "true" || value == "1" || value == "on");
        }
    }

    for (const char* name : {"audio_file", "audio"}) {
        if (req.form.has_file(name)) {
            const auto file = req.form.get_file(name);
            spec.audio.assign(file.content.begin(), file.content.end());
            spec.audioMime = file.content_type;
            if (!body.contains("mode")) {
                body["mode"] = "audio";
            }
            break;
        }
    }
    return body;
}
}

void sendError(httplib::Response& res, ErrorCode code, const std::string& message) {
    if (code == ErrorCode::NotReady) {
        res.set_header("Retry-After", "2");
    }
    sendJson(res, httpStatus(code), json{{"error", message}, {"code", toString(code)}});
}

bool specFromRequest(const httplib::Request& req, JobSpec& spec, std::string& error) {
    json body;
    if (req.is_multipart_form_data()) {
        body = formToJson(req, spec);
    } else {
        body = json::parse(req.body, nullptr, false);
        if (body.is_discarded()) {
            error = "Request body is not valid JSON";
            return false;
        }
    }
    try {
        return specFromJson(body, spec, error);
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }
}

int httpStatus(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:               return 200;
        case ErrorCode::Validation:         return 400;
        case ErrorCode::NotFound:           return 404;
        case ErrorCode::NotReady:           return 409;
        case ErrorCode::JobFailed:          return 422;
        case ErrorCode::Conflict:           return 409;
        case ErrorCode::UpstreamGeneration: return 502;
        case ErrorCode::Cancelled:          return 410;
    }
    return 500;
}

void HttpApi::registerRoutes(httplib::Server& server) {
    server.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "Internal error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "Unknown error";
        }
        LOG_ERROR(req.method + " " + req.path + " failed: " + message);
        sendJson(res, 500, json{{"error", message}});
    });

    server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        sendJson(res, 200, json{
            {"status", service_.isRunning() ? "ok" : "stopping"},
            {"jobs", service_.registry().size()},
            {"queued", service_.queueSize()},
        });
    });

    server.Post("/api/generate", [this](const httplib::Request& req, httplib::Response& res) {
        JobSpec spec;
        std::string error;
        if (!specFromRequest(req, spec, error)) {
            sendError(res, ErrorCode::Validation, error);
            return;
        }

        CreateResult created = service_.submit(std::move(spec));
        if (!created) {
            sendError(res, created.error, created.message);
            return;
        }
        LOG_INFO("Accepted job " + created.id);
        sendJson(res, 200, json{{"job_id", created.id}});
    });

    server.Get(R"(/api/stream/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        const JobId id = req.matches[1];
        SubscribeResult subscribed = service_.subscribe(id);
        if (!subscribed) {
            sendError(res, subscribed.error, "Job not found");
            return;
        }

        std::shared_ptr<Subscription> sub(std::move(subscribed.subscription));
        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");
        res.set_chunked_content_provider(
            "text/event-stream; charset=utf-8",
            [this, sub, lastWrite = std::chrono::steady_clock::now()]
            (size_t, httplib::DataSink& sink) mutable -> bool {
                if (stopping_.load()) {
                    sink.done();
                    return true;
                }

                auto event = sub->next(kStreamPoll);
                if (!event) {
                    if (sub->finished()) {
                        sink.done();
                        return true;
                    }
                    auto now = std::chrono::steady_clock::now();
                    if (now - lastWrite < keepalive_) {
                        return true;
                    }
                    lastWrite = now;
                    static const std::string keepalive = ": keepalive\n\n";
                    return sink.write(keepalive.data(), keepalive.size());
                }

                const std::string msg = toSse(*event);
                if (!sink.write(msg.data(), msg.size())) {
                    LOG_DEBUG("Stream observer for " + sub->jobId() + " went away");
                    return false;
                }
                lastWrite = std::chrono::steady_clock::now();
                if (event->type == EventType::Done || event->type == EventType::Error) {
                    sink.done();
                }
                return true;
            });
    });

    server.Get(R"(/api/status/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        auto record = service_.snapshot(req.matches[1]);
        if (!record) {
            sendError(res, ErrorCode::NotFound, "Job not found");
            return;
        }
        sendJson(res, 200, snapshotJson(*record));
    });

    server.Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
        json all = json::object();
        for (const auto& record : service_.registry().list()) {
            all[record.id] = summaryJson(record);
        }
        sendJson(res, 200, all);
    });

    server.Get(R"(/api/audio/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        AudioResult result = service_.audio(req.matches[1]);
        if (!result) {
            sendError(res, result.error, result.message);
            return;
        }
        if (result.audio.empty()) {
            sendError(res, ErrorCode::NotReady, "Audio is not available yet");
            return;
        }
        const auto& bytes = *result.audio.bytes;
        res.status = 200;
        if (result.audio.placeholder) {
            res.set_header("X-Castline-Placeholder", "1");
        }
        res.set_content(reinterpret_cast<const char*>(bytes.data()), bytes.size(), result.audio.contentType);
    });

    server.Post(R"(/api/save/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        std::optional<Category> category;
        if (req.has_param("category")) {
            category = parseCategory(req.get_param_value("category"));
            if (!category) {
                sendError(res, ErrorCode::Validation, "Unknown category");
                return;
            }
        }
        SaveResult saved = service_.saved().save(req.matches[1], category);
        if (!saved) {
            sendError(res, saved.error, saved.message);
            return;
        }
        sendJson(res, 200, json{{"saved", true}, {"changed", saved.changed}});
    });

    server.Delete(R"(/api/save/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        SaveResult result = service_.saved().unsave(req.matches[1]);
        if (!result) {
            sendError(res, result.error, result.message);
            return;
        }
        sendJson(res, 200, json{{"saved", false}, {"changed", result.changed}});
    });

    server.Get("/api/saved", [this](const httplib::Request& req, httplib::Response& res) {
        Category category = Category::Generated;
        if (req.has_param("category")) {
            auto parsed = parseCategory(req.get_param_value("category"));
            if (!parsed) {
                sendError(res, ErrorCode::Validation, "Unknown category");
                return;
            }
            category = *parsed;
        }
        json items = json::array();
        for (const auto& record : service_.saved().listSaved(category)) {
            items.push_back(snapshotJson(record));
        }
        sendJson(res, 200, json{{"category", toString(category)}, {"items", items}});
    });

    server.Delete(R"(/api/jobs/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        SaveResult removed = service_.remove(req.matches[1]);
        if (!removed) {
            sendError(res, removed.error, removed.message);
            return;
        }
        LOG_INFO("Deleted job " + std::string(req.matches[1]));
        res.status = 204;
    });
}

}
