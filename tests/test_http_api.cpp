/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <chrono>
#include <thread>

#include <httplib.h>

#include "castline/events.hpp"
#include "castline/http_api.hpp"
#include "fixtures/scripted_backend.hpp"

namespace castline {
namespace {

using namespace std::chrono_literals;
using fixtures::FakeSpeechBackend;
using fixtures::ScriptedBackend;

// -----------------------------------------------------------------------------
// Status mapping
// -----------------------------------------------------------------------------
TEST(HttpApiTest, ErrorCodesMapToStatus) {
    EXPECT_EQ(httpStatus(ErrorCode::None), 200);
    EXPECT_EQ(httpStatus(ErrorCode::Validation), 400);
    EXPECT_EQ(httpStatus(ErrorCode::NotFound), 404);
    EXPECT_EQ(httpStatus(ErrorCode::NotReady), 409);
    EXPECT_EQ(httpStatus(ErrorCode::JobFailed), 422);
    EXPECT_EQ(httpStatus(ErrorCode::Conflict), 409);
    EXPECT_EQ(httpStatus(ErrorCode::UpstreamGeneration), 502);
    EXPECT_EQ(httpStatus(ErrorCode::Cancelled), 410);
}

TEST(HttpApiTest, NotReadyAsksClientToRetry) {
    httplib::Response res;
    sendError(res, ErrorCode::NotReady, "Job is still streaming");
    EXPECT_EQ(res.status, 409);
    EXPECT_EQ(res.get_header_value("Retry-After"), "2");

    json body = json::parse(res.body);
    EXPECT_EQ(body["code"], "not_ready");
    EXPECT_EQ(body["error"], "Job is still streaming");
}

TEST(HttpApiTest, NotFoundIsFinal) {
    httplib::Response res;
    sendError(res, ErrorCode::NotFound, "Job not found");
    EXPECT_EQ(res.status, 404);
    EXPECT_FALSE(res.has_header("Retry-After"));
    EXPECT_EQ(json::parse(res.body)["code"], "not_found");
}

// -----------------------------------------------------------------------------
// Create requests
// -----------------------------------------------------------------------------
TEST(HttpApiTest, MultipartUploadKeepsAudioType) {
    httplib::Request req;
    req.set_header("Content-Type", "multipart/form-data; boundary=castline");
    auto addField = [&req](const std::string& name, const std::string& value) {
        httplib::FormField field;
        field.name = name;
        field.content = value;
        req.form.fields.emplace(name, field);
    };
    addField("prompt_mode", "audio");
    addField("speakers", "2");
    addField("voices", "f,m");
    addField("use_internet", "true");

    httplib::FormData file;
    file.name = "audio_file";
    file.filename = "idea.mp3";
    file.content = "ID3\x01\x02";
    file.content_type = "audio/mpeg";
    req.form.files.emplace("audio_file", file);

    JobSpec spec;
    std::string error;
    ASSERT_TRUE(specFromRequest(req, spec, error)) << error;
    EXPECT_EQ(spec.mode, PromptMode::Audio);
    EXPECT_EQ(spec.audioMime, "audio/mpeg");
    EXPECT_EQ(spec.audio.size(), 5u);
    EXPECT_EQ(spec.speakers, 2);
    EXPECT_EQ(spec.voices, (std::vector<std::string>{"f", "m"}));
    EXPECT_TRUE(spec.useSearch);

    ASSERT_TRUE(validate(spec));
    EXPECT_EQ(spec.audioMime, "audio/mpeg");
}

TEST(HttpApiTest, JsonBodyIsParsed) {
    httplib::Request req;
    req.set_header("Content-Type", "application/json");
    req.body = R"({"prompt": "Night markets", "category": "localisation", "geo_location": "Taipei"})";

    JobSpec spec;
    std::string error;
    ASSERT_TRUE(specFromRequest(req, spec, error)) << error;
    EXPECT_EQ(spec.text, "Night markets");
    EXPECT_EQ(spec.category, Category::Localisation);
    EXPECT_EQ(spec.geoLocation.value_or(""), "Taipei");
}

TEST(HttpApiTest, MalformedJsonIsRejected) {
    httplib::Request req;
    req.body = "{not json";
    JobSpec spec;
    std::string error;
    EXPECT_FALSE(specFromRequest(req, spec, error));
    EXPECT_EQ(error, "Request body is not valid JSON");
}

// -----------------------------------------------------------------------------
// Routes over a loopback server
// -----------------------------------------------------------------------------
class HttpApiServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config config;
        config.workers = 1;
        config.watchdogInterval = 20ms;
        service_ = std::make_unique<Service>(backend_, speech_, config);
        ASSERT_TRUE(service_->start());

        api_ = std::make_unique<HttpApi>(*service_, 1s);
        api_->registerRoutes(server_);
        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        listener_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    void TearDown() override {
        if (api_) {
            api_->stopStreams();
        }
        if (service_) {
            service_->shutdown();
        }
        server_.stop();
        if (listener_.joinable()) {
            listener_.join();
        }
    }

    httplib::Client Client() const {
        httplib::Client client("127.0.0.1", port_);
        client.set_read_timeout(10, 0);
        return client;
    }

    JobId Create(const std::string& body) {
        auto res = Client().Post("/api/generate", body, "application/json");
        EXPECT_TRUE(res);
        if (!res) {
            return "";
        }
        EXPECT_EQ(res->status, 200) << res->body;
        return json::parse(res->body).value("job_id", "");
    }

    ScriptedBackend backend_;
    FakeSpeechBackend speech_;
    std::unique_ptr<Service> service_;
    std::unique_ptr<HttpApi> api_;
    httplib::Server server_;
    std::thread listener_;
    int port_ = -1;
};

TEST_F(HttpApiServerTest, StreamsEpisodeAsServerSentEvents) {
    backend_.setFragments({"Bonjour ", "Paris."});
    backend_.setTitle("Paris Mornings");
    JobId id = Create(R"({"prompt": "Tell me about Paris", "speakers": 1, "voices": ["F"]})");
    ASSERT_FALSE(id.empty());

    auto stream = Client().Get("/api/stream/" + id);
    ASSERT_TRUE(stream);
    EXPECT_EQ(stream->status, 200);
    EXPECT_NE(stream->get_header_value("Content-Type").find("text/event-stream"), std::string::npos);

    const std::string& sse = stream->body;
    const auto meta = sse.find("event: meta\ndata: {\"improved_prompt\":");
    const auto first = sse.find("event: chunk\ndata: {\"delta\":\"Bonjour \",\"full\":\"Bonjour \",\"truncated\":false}\n\n");
    const auto done = sse.find("event: done\ndata: {\"title\":\"Paris Mornings\",\"full\":\"Bonjour Paris.\",\"truncated\":false}\n\n");
    ASSERT_NE(meta, std::string::npos) << sse;
    ASSERT_NE(first, std::string::npos) << sse;
    ASSERT_NE(done, std::string::npos) << sse;
    EXPECT_LT(meta, first);
    EXPECT_LT(first, done);
    EXPECT_EQ(done + std::string("event: done\ndata: {\"title\":\"Paris Mornings\",\"full\":\"Bonjour Paris.\",\"truncated\":false}\n\n").size(),
              sse.size());

    auto status = Client().Get("/api/status/" + id);
    ASSERT_TRUE(status);
    EXPECT_EQ(status->status, 200);
    json snapshot = json::parse(status->body);
    EXPECT_EQ(snapshot["status"], "done");
    EXPECT_EQ(snapshot["title"], "Paris Mornings");

    auto audio = Client().Get("/api/audio/" + id);
    ASSERT_TRUE(audio);
    EXPECT_EQ(audio->status, 200);
    EXPECT_EQ(audio->get_header_value("Content-Type"), "audio/wav");
    EXPECT_EQ(audio->body.size(), speech_.clip().size());
}

TEST_F(HttpApiServerTest, AudioBeforeDoneIsRetryable) {
    backend_.setFragments({"Later."});
    backend_.improveGate.close();
    JobId id = Create(R"({"prompt": "Tell me about Paris"})");
    ASSERT_FALSE(id.empty());
    ASSERT_TRUE(backend_.improveGate.waitUntilBlocked(2s));

    auto early = Client().Get("/api/audio/" + id);
    ASSERT_TRUE(early);
    EXPECT_EQ(early->status, 409);
    EXPECT_EQ(early->get_header_value("Retry-After"), "2");
    backend_.improveGate.open();

    auto missing = Client().Get("/api/audio/missing");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);
    EXPECT_FALSE(missing->has_header("Retry-After"));
}

TEST_F(HttpApiServerTest, InvalidCreateIsRejected) {
    auto res = Client().Post("/api/generate", R"({"prompt": "x", "speakers": 3})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(json::parse(res->body)["code"], "validation");
    EXPECT_EQ(service_->registry().size(), 0u);
}

}  // namespace
}  // namespace castline
