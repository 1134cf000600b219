/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <vector>

#include "castline/service.hpp"
#include "fixtures/scripted_backend.hpp"

namespace castline {
namespace {

using namespace std::chrono_literals;
using fixtures::FakeSpeechBackend;
using fixtures::ScriptedBackend;

class ServiceScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.workers = 2;
        config_.watchdogInterval = 20ms;
    }

    JobSpec Paris() {
        JobSpec spec;
        spec.text = "Tell me about Paris";
        spec.speakers = 1;
        spec.voices = {"F"};
        return spec;
    }

    // Drains a subscription until its terminal event or the deadline.
    static std::vector<StreamEvent> Drain(Subscription& sub, std::chrono::milliseconds budget = 5s) {
        std::vector<StreamEvent> events;
        const auto deadline = std::chrono::steady_clock::now() + budget;
        while (!sub.finished() && std::chrono::steady_clock::now() < deadline) {
            auto event = sub.next(100ms);
            if (event) {
                events.push_back(*event);
            }
        }
        return events;
    }

    Config config_;
    ScriptedBackend backend_;
    FakeSpeechBackend speech_;
};

// -----------------------------------------------------------------------------
// End to end
// -----------------------------------------------------------------------------
TEST_F(ServiceScenarioTest, ParisEpisodeFromPromptToSavedAudio) {
    backend_.setFragments(ScriptedBackend::wordFragments(20, 15));
    backend_.setTitle("Paris at Dawn");
    backend_.improveGate.close();

    Service service(backend_, speech_, config_);
    ASSERT_TRUE(service.start());

    CreateResult created = service.submit(Paris());
    ASSERT_TRUE(created);
    ASSERT_TRUE(backend_.improveGate.waitUntilBlocked(2s));

    auto pending = service.snapshot(created.id);
    ASSERT_TRUE(pending.has_value());
    EXPECT_EQ(pending->status, Status::Pending);

    AudioResult early = service.audio(created.id);
    EXPECT_FALSE(early);
    EXPECT_EQ(early.error, ErrorCode::NotReady);

    SubscribeResult subscribed = service.subscribe(created.id);
    ASSERT_TRUE(subscribed);
    backend_.improveGate.open();

    std::vector<StreamEvent> events = Drain(*subscribed.subscription);
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events.front().type, EventType::Meta);
    EXPECT_EQ(events.front().improvedPrompt, "Improved: a warm solo episode.");

    std::vector<StreamEvent> chunks;
    for (const auto& e : events) {
        if (e.type == EventType::Chunk) {
            chunks.push_back(e);
        }
    }
    // 15 fragments of 15 words reach the 225 word cap
    ASSERT_EQ(chunks.size(), 15u);
    for (std::size_t i = 0; i + 1 < chunks.size(); ++i) {
        EXPECT_FALSE(chunks[i].truncated);
    }
    EXPECT_TRUE(chunks.back().truncated);

    const StreamEvent& done = events.back();
    ASSERT_EQ(done.type, EventType::Done);
    EXPECT_EQ(done.title, "Paris at Dawn");
    EXPECT_TRUE(done.truncated);
    EXPECT_EQ(done.full, chunks.back().full);
    EXPECT_EQ(countWords(done.full), 225u);

    auto finished = service.snapshot(created.id);
    ASSERT_TRUE(finished.has_value());
    EXPECT_EQ(finished->status, Status::Done);
    EXPECT_EQ(finished->truncationReason, TruncationReason::Words);

    AudioResult audio = service.audio(created.id);
    ASSERT_TRUE(audio) << audio.message;
    EXPECT_EQ(audio.audio.contentType, "audio/wav");
    EXPECT_FALSE(audio.audio.placeholder);
    EXPECT_EQ(speech_.calls(), 1);
    EXPECT_EQ(speech_.lastTranscript(), done.full);

    AudioResult again = service.audio(created.id);
    ASSERT_TRUE(again);
    EXPECT_EQ(speech_.calls(), 1);

    SaveResult saved = service.saved().save(created.id);
    ASSERT_TRUE(saved) << saved.message;
    auto listed = service.saved().listSaved(Category::Generated);
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].id, created.id);
    EXPECT_TRUE(service.saved().listSaved(Category::Localisation).empty());

    service.shutdown();
}

TEST_F(ServiceScenarioTest, LateObserverReplaysWholeEpisode) {
    backend_.setFragments({"Hello ", "from ", "Lisbon."});
    Service service(backend_, speech_, config_);
    ASSERT_TRUE(service.start());

    CreateResult created = service.submit(Paris());
    ASSERT_TRUE(created);

    SubscribeResult first = service.subscribe(created.id);
    ASSERT_TRUE(first);
    std::vector<StreamEvent> live = Drain(*first.subscription);
    ASSERT_FALSE(live.empty());
    ASSERT_EQ(live.back().type, EventType::Done);

    SubscribeResult late = service.subscribe(created.id);
    ASSERT_TRUE(late);
    std::vector<StreamEvent> replay = Drain(*late.subscription);
    ASSERT_EQ(replay.size(), live.size());
    for (std::size_t i = 0; i < replay.size(); ++i) {
        EXPECT_EQ(replay[i].type, live[i].type);
        EXPECT_EQ(replay[i].delta, live[i].delta);
    }
    EXPECT_EQ(replay.back().full, "Hello from Lisbon.");
}

// -----------------------------------------------------------------------------
// Failure and teardown
// -----------------------------------------------------------------------------
TEST_F(ServiceScenarioTest, UpstreamFailureReachesObservers) {
    backend_.setFragments(ScriptedBackend::wordFragments(5, 3));
    backend_.failStreamAt(2, "Upstream generation failed: 503");
    Service service(backend_, speech_, config_);
    ASSERT_TRUE(service.start());

    CreateResult created = service.submit(Paris());
    ASSERT_TRUE(created);
    SubscribeResult subscribed = service.subscribe(created.id);
    ASSERT_TRUE(subscribed);

    std::vector<StreamEvent> events = Drain(*subscribed.subscription);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, EventType::Error);
    EXPECT_EQ(events.back().message, "Upstream generation failed: 503");

    AudioResult audio = service.audio(created.id);
    EXPECT_FALSE(audio);
    EXPECT_EQ(audio.error, ErrorCode::JobFailed);
    EXPECT_EQ(speech_.calls(), 0);
}

TEST_F(ServiceScenarioTest, DeletingStreamingJobEndsObservers) {
    backend_.setFragments(ScriptedBackend::wordFragments(10, 2));
    backend_.gateBeforeFragment(3);
    backend_.fragmentGate.close();

    Service service(backend_, speech_, config_);
    ASSERT_TRUE(service.start());

    CreateResult created = service.submit(Paris());
    ASSERT_TRUE(created);
    ASSERT_TRUE(backend_.fragmentGate.waitUntilBlocked(2s));

    SubscribeResult subscribed = service.subscribe(created.id);
    ASSERT_TRUE(subscribed);

    SaveResult removed = service.remove(created.id);
    ASSERT_TRUE(removed);
    EXPECT_FALSE(service.snapshot(created.id).has_value());

    std::vector<StreamEvent> events = Drain(*subscribed.subscription);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, EventType::Error);
    EXPECT_EQ(events.back().message, "Job was deleted");
    EXPECT_TRUE(subscribed.subscription->finished());

    EXPECT_EQ(service.audio(created.id).error, ErrorCode::NotFound);
    EXPECT_FALSE(service.remove(created.id));
}

TEST_F(ServiceScenarioTest, ShutdownReturnsWhileBackendHangs) {
    backend_.setFragments({"Still ", "talking "});
    backend_.hangAfterFragments(true);

    Service service(backend_, speech_, config_);
    ASSERT_TRUE(service.start());
    CreateResult created = service.submit(Paris());
    ASSERT_TRUE(created);

    const auto waitUntil = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < waitUntil) {
        auto record = service.snapshot(created.id);
        if (record && record->fragments.size() == 2) {
            break;
        }
        std::this_thread::sleep_for(5ms);
    }

    const auto start = std::chrono::steady_clock::now();
    service.shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_FALSE(service.isRunning());

    CreateResult refused = service.submit(Paris());
    ASSERT_TRUE(refused);
    auto record = service.snapshot(refused.id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, Status::Error);
}

TEST_F(ServiceScenarioTest, ShutdownEndsOpenStreams) {
    config_.workers = 1;
    backend_.setFragments({"Still ", "talking "});
    backend_.hangAfterFragments(true);

    Service service(backend_, speech_, config_);
    ASSERT_TRUE(service.start());
    CreateResult running = service.submit(Paris());
    CreateResult queued = service.submit(Paris());
    ASSERT_TRUE(running);
    ASSERT_TRUE(queued);

    SubscribeResult subscribed = service.subscribe(running.id);
    ASSERT_TRUE(subscribed);
    std::size_t chunks = 0;
    const auto waitUntil = std::chrono::steady_clock::now() + 2s;
    while (chunks < 2 && std::chrono::steady_clock::now() < waitUntil) {
        auto event = subscribed.subscription->next(100ms);
        if (event && event->type == EventType::Chunk) {
            ++chunks;
        }
    }
    ASSERT_EQ(chunks, 2u);

    service.shutdown();

    std::vector<StreamEvent> events = Drain(*subscribed.subscription, 2s);
    EXPECT_TRUE(subscribed.subscription->finished());
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, EventType::Error);
    EXPECT_EQ(events.back().message, "Service shutting down");

    for (const JobId& id : {running.id, queued.id}) {
        auto record = service.snapshot(id);
        ASSERT_TRUE(record.has_value());
        EXPECT_EQ(record->status, Status::Error);
        EXPECT_EQ(record->errorCode, ErrorCode::Cancelled);
    }
    EXPECT_EQ(service.audio(running.id).error, ErrorCode::Cancelled);

    SubscribeResult late = service.subscribe(queued.id);
    ASSERT_TRUE(late);
    std::vector<StreamEvent> lateEvents = Drain(*late.subscription, 1s);
    ASSERT_EQ(lateEvents.size(), 1u);
    EXPECT_EQ(lateEvents[0].type, EventType::Error);
}

TEST_F(ServiceScenarioTest, QueuedJobRunsAfterHungJobTimesOut) {
    config_.workers = 1;
    config_.pipeline.generationTimeout = 300ms;
    backend_.setFragments({"Back ", "on air."});
    backend_.improveGate.close();

    Service service(backend_, speech_, config_);
    ASSERT_TRUE(service.start());
    CreateResult hung = service.submit(Paris());
    CreateResult queued = service.submit(Paris());
    ASSERT_TRUE(hung);
    ASSERT_TRUE(queued);

    SubscribeResult first = service.subscribe(hung.id);
    ASSERT_TRUE(first);
    std::vector<StreamEvent> firstEvents = Drain(*first.subscription);
    ASSERT_FALSE(firstEvents.empty());
    EXPECT_EQ(firstEvents.back().type, EventType::Error);
    backend_.improveGate.open();

    SubscribeResult second = service.subscribe(queued.id);
    ASSERT_TRUE(second);
    std::vector<StreamEvent> secondEvents = Drain(*second.subscription);
    ASSERT_FALSE(secondEvents.empty());
    EXPECT_EQ(secondEvents.back().type, EventType::Done);
    EXPECT_EQ(secondEvents.back().full, "Back on air.");
}

TEST_F(ServiceScenarioTest, WatchdogFailsOverdueJob) {
    config_.pipeline.generationTimeout = 100ms;
    backend_.setFragments({"Slow "});
    backend_.hangAfterFragments(true);

    Service service(backend_, speech_, config_);
    ASSERT_TRUE(service.start());
    CreateResult created = service.submit(Paris());
    ASSERT_TRUE(created);

    SubscribeResult subscribed = service.subscribe(created.id);
    ASSERT_TRUE(subscribed);
    std::vector<StreamEvent> events = Drain(*subscribed.subscription);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, EventType::Error);

    auto record = service.snapshot(created.id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, Status::Error);
    EXPECT_NE(record->error.value_or("").find("timed out"), std::string::npos);
}

}  // namespace
}  // namespace castline
