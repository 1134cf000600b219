/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <future>
#include <thread>

#include "castline/pipeline.hpp"
#include "fixtures/scripted_backend.hpp"

namespace castline {
namespace {

using fixtures::ScriptedBackend;

class PipelineTest : public ::testing::Test {
protected:
    JobId Submit(const std::string& text = "Tell me about Paris") {
        JobSpec spec;
        spec.text = text;
        CreateResult created = registry_.create(std::move(spec));
        EXPECT_TRUE(created);
        return created.id;
    }

    Pipeline MakePipeline(PipelineConfig config = PipelineConfig{}) {
        return Pipeline(registry_, backend_, config);
    }

    Registry registry_;
    ScriptedBackend backend_;
};

// -----------------------------------------------------------------------------
// Happy path
// -----------------------------------------------------------------------------
TEST_F(PipelineTest, StreamsToDoneWithTitle) {
    backend_.setFragments({"Bonjour ", "and welcome ", "to Paris."});
    backend_.setTitle("Title: \"Paris at Dawn\"");
    Pipeline pipeline = MakePipeline();

    JobId id = Submit();
    EXPECT_EQ(pipeline.run(id), ProcessResult::Success);

    auto record = registry_.get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, Status::Done);
    EXPECT_EQ(record->fragments.size(), 3u);
    EXPECT_EQ(record->fullText, "Bonjour and welcome to Paris.");
    EXPECT_EQ(record->improvedPrompt.value_or(""), "Improved: a warm solo episode.");
    EXPECT_EQ(record->title.value_or(""), "Paris at Dawn");
    EXPECT_FALSE(record->truncated);
    EXPECT_EQ(record->truncationReason, TruncationReason::None);
    EXPECT_EQ(pipeline.activeCount(), 0u);
}

TEST_F(PipelineTest, StreamUsesImprovedPrompt) {
    backend_.setImproved("Write a lively monologue about bakeries.");
    backend_.setFragments({"Croissants."});
    Pipeline pipeline = MakePipeline();

    JobId id = Submit("bakeries");
    ASSERT_EQ(pipeline.run(id), ProcessResult::Success);
    EXPECT_EQ(backend_.lastStreamPrompt(), "Write a lively monologue about bakeries.");
    EXPECT_NE(backend_.lastImprovePrompt().find("bakeries"), std::string::npos);
    EXPECT_NE(backend_.lastImprovePrompt().find("female host"), std::string::npos);
}

TEST_F(PipelineTest, RunIgnoresJobsAlreadyClaimed) {
    backend_.setFragments({"Hello."});
    Pipeline pipeline = MakePipeline();
    JobId id = Submit();
    ASSERT_EQ(pipeline.run(id), ProcessResult::Success);
    EXPECT_EQ(pipeline.run(id), ProcessResult::NotFound);
    EXPECT_EQ(pipeline.run("missing"), ProcessResult::NotFound);
    EXPECT_EQ(backend_.streamCalls(), 1);
}

// -----------------------------------------------------------------------------
// Content caps
// -----------------------------------------------------------------------------
TEST_F(PipelineTest, WordCapTruncatesWithinOneFragment) {
    backend_.setFragments(ScriptedBackend::wordFragments(40, 10));  // 400 words offered
    Pipeline pipeline = MakePipeline();

    JobId id = Submit();
    ASSERT_EQ(pipeline.run(id), ProcessResult::Success);

    auto record = registry_.get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, Status::Done);
    EXPECT_TRUE(record->truncated);
    EXPECT_EQ(record->truncationReason, TruncationReason::Words);
    const std::size_t words = countWords(record->fullText);
    EXPECT_GE(words, 225u);
    EXPECT_LT(words, 235u);
    EXPECT_EQ(record->fragments.size(), 23u);
    EXPECT_TRUE(record->title.has_value());
}

TEST_F(PipelineTest, DurationCapAppliesIndependently) {
    backend_.setFragments(ScriptedBackend::wordFragments(10, 5));
    PipelineConfig config;
    config.maxWords = 1000;
    config.maxSeconds = 12.0;
    config.wordsPerMinute = 60.0;  // one word per second
    Pipeline pipeline = MakePipeline(config);

    JobId id = Submit();
    ASSERT_EQ(pipeline.run(id), ProcessResult::Success);

    auto record = registry_.get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->truncated);
    EXPECT_EQ(record->truncationReason, TruncationReason::Duration);
    EXPECT_EQ(countWords(record->fullText), 15u);
}

TEST_F(PipelineTest, ShortTranscriptIsNotTruncated) {
    backend_.setFragments(ScriptedBackend::wordFragments(5, 10));
    Pipeline pipeline = MakePipeline();
    JobId id = Submit();
    ASSERT_EQ(pipeline.run(id), ProcessResult::Success);
    EXPECT_FALSE(registry_.get(id)->truncated);
}

// -----------------------------------------------------------------------------
// Failures
// -----------------------------------------------------------------------------
TEST_F(PipelineTest, AugmentationFailureFailsJob) {
    backend_.failImprove("quota exceeded");
    backend_.setFragments({"never sent"});
    Pipeline pipeline = MakePipeline();

    JobId id = Submit();
    EXPECT_EQ(pipeline.run(id), ProcessResult::Failed);

    auto record = registry_.get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, Status::Error);
    EXPECT_EQ(record->error.value_or(""), "Prompt augmentation failed: quota exceeded");
    EXPECT_EQ(record->errorCode, ErrorCode::UpstreamGeneration);
    EXPECT_EQ(backend_.streamCalls(), 0);
}

TEST_F(PipelineTest, UpstreamFailureKeepsMessageAndPartialTranscript) {
    backend_.setFragments({"One ", "two ", "three "});
    backend_.failStreamAt(2, "connection reset by peer");
    Pipeline pipeline = MakePipeline();

    JobId id = Submit();
    EXPECT_EQ(pipeline.run(id), ProcessResult::Failed);

    auto record = registry_.get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, Status::Error);
    EXPECT_EQ(record->error.value_or(""), "connection reset by peer");
    EXPECT_EQ(record->errorCode, ErrorCode::UpstreamGeneration);
    EXPECT_EQ(record->fullText, "One two ");
    EXPECT_EQ(backend_.streamCalls(), 1);
}

TEST_F(PipelineTest, EmptyTranscriptFailsJob) {
    backend_.setFragments({});
    Pipeline pipeline = MakePipeline();
    JobId id = Submit();
    EXPECT_EQ(pipeline.run(id), ProcessResult::Failed);
    EXPECT_EQ(registry_.get(id)->error.value_or(""), "Generation produced no transcript");
}

TEST_F(PipelineTest, TitleFallsBackToTranscript) {
    backend_.setFragments({"Speaker 1: Welcome to the markets of Lagos. ", "Today we shop."});
    backend_.failTitle("rate limited");
    Pipeline pipeline = MakePipeline();

    JobId id = Submit();
    ASSERT_EQ(pipeline.run(id), ProcessResult::Success);
    EXPECT_EQ(registry_.get(id)->title.value_or(""), "Welcome to the markets of Lagos");
}

// -----------------------------------------------------------------------------
// Audio prompts
// -----------------------------------------------------------------------------
TEST_F(PipelineTest, AudioPromptIsTranscribedFirst) {
    backend_.setTranscription(true, "Tell me about lighthouses");
    backend_.setFragments({"Lighthouses guide ships."});
    Pipeline pipeline = MakePipeline();

    JobSpec spec;
    spec.mode = PromptMode::Audio;
    spec.audio = {0x1A, 0x45, 0xDF, 0xA3};
    CreateResult created = registry_.create(std::move(spec));
    ASSERT_TRUE(created);

    ASSERT_EQ(pipeline.run(created.id), ProcessResult::Success);
    EXPECT_EQ(backend_.transcribeCalls(), 1);
    EXPECT_NE(backend_.lastImprovePrompt().find("Tell me about lighthouses"), std::string::npos);
}

TEST_F(PipelineTest, FailedTranscriptionContinuesWithGenericPrompt) {
    backend_.setTranscription(false, "decoder unavailable");
    backend_.setFragments({"Something generic."});
    Pipeline pipeline = MakePipeline();

    JobSpec spec;
    spec.mode = PromptMode::Audio;
    spec.audio = {1, 2, 3};
    CreateResult created = registry_.create(std::move(spec));
    ASSERT_TRUE(created);

    ASSERT_EQ(pipeline.run(created.id), ProcessResult::Success);
    EXPECT_NE(backend_.lastImprovePrompt().find("Audio transcription failed"), std::string::npos);
    EXPECT_EQ(registry_.get(created.id)->status, Status::Done);
}

// -----------------------------------------------------------------------------
// Cancellation and timeouts
// -----------------------------------------------------------------------------
TEST_F(PipelineTest, DeleteDuringStreamStopsPipeline) {
    backend_.setFragments(ScriptedBackend::wordFragments(10, 3));
    backend_.gateBeforeFragment(2);
    backend_.fragmentGate.close();
    Pipeline pipeline = MakePipeline();

    JobId id = Submit();
    auto outcome = std::async(std::launch::async, [&] { return pipeline.run(id); });
    ASSERT_TRUE(backend_.fragmentGate.waitUntilBlocked(std::chrono::seconds(5)));
    EXPECT_EQ(registry_.get(id)->fragments.size(), 2u);

    ASSERT_TRUE(registry_.remove(id));
    backend_.fragmentGate.open();

    EXPECT_EQ(outcome.get(), ProcessResult::Cancelled);
    EXPECT_FALSE(registry_.get(id).has_value());
    EXPECT_EQ(pipeline.activeCount(), 0u);
}

TEST_F(PipelineTest, WatchdogExpiresHungStream) {
    backend_.setFragments({"Partial "});
    backend_.hangAfterFragments(true);
    PipelineConfig config;
    config.generationTimeout = std::chrono::milliseconds(50);
    Pipeline pipeline = MakePipeline(config);

    JobId id = Submit();
    auto outcome = std::async(std::launch::async, [&] { return pipeline.run(id); });

    std::size_t expired = 0;
    const auto giveUp = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (expired == 0 && std::chrono::steady_clock::now() < giveUp) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        expired = pipeline.expireOverdue(std::chrono::steady_clock::now());
    }
    ASSERT_EQ(expired, 1u);
    EXPECT_NE(outcome.get(), ProcessResult::Success);

    auto record = registry_.get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, Status::Error);
    EXPECT_NE(record->error.value_or("").find("timed out"), std::string::npos);
    EXPECT_EQ(record->errorCode, ErrorCode::UpstreamGeneration);
}

TEST_F(PipelineTest, ExpireOverdueIgnoresJobsWithinDeadline) {
    Pipeline pipeline = MakePipeline();
    EXPECT_EQ(pipeline.expireOverdue(std::chrono::steady_clock::now()), 0u);
}

}  // namespace
}  // namespace castline
