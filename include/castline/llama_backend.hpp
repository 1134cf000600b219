/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "castline/backend.hpp"

struct llama_model;
struct llama_context;
struct llama_context_params;
struct llama_sampler;
struct mtmd_context;

namespace castline {

// Local llama.cpp generation. One model shared by every pipeline thread;
// each call gets its own context. Audio transcription needs an mmproj
// with audio support.
class LlamaBackend final : public GenerationBackend {
public:
    explicit LlamaBackend(const std::string& modelPath, const std::string& mmprojPath = "");
    ~LlamaBackend() override;

    LlamaBackend(const LlamaBackend&) = delete;
    LlamaBackend& operator=(const LlamaBackend&) = delete;
    LlamaBackend(LlamaBackend&&) = delete;
    LlamaBackend& operator=(LlamaBackend&&) = delete;

    [[nodiscard]] GenerationResult stream(const GenerationRequest& request,
                                          const FragmentCallback& onFragment,
                                          const CancelToken& cancel) override;

    [[nodiscard]] GenerationResult complete(const GenerationRequest& request,
                                            const CancelToken& cancel) override;

    [[nodiscard]] GenerationResult transcribe(const Bytes& audio, const std::string& mimeType,
                                              const std::string& instruction,
                                              const CancelToken& cancel) override;

    [[nodiscard]] bool canTranscribe() const noexcept { return audioSupported_; }

private:
    struct SamplingConfig {
        int n_predict = 0;
        int max_ctx = 0;
        float temp = 0.8f;
        int top_k = 40;
        float top_p = 0.9f;
        float min_p = 0.05f;
        float repeat_penalty = 1.1f;
        int repeat_last_n = 64;
        uint32_t seed = 0;
    };

    SamplingConfig buildSamplingConfig(int maxTokens) const;
    void buildContextParams(int n_prompt, const SamplingConfig& config, llama_context_params& params) const;
    llama_sampler* buildSampler(const SamplingConfig& config) const;
    std::string formatPrompt(const std::string& content) const;

    // Samples until end of generation, n_predict, cancellation, or the sink
    // declines more text. Returns false on a decode failure.
    bool generate(llama_context* ctx, llama_sampler* smpl, int n_past, int n_predict,
                  const FragmentCallback& onFragment, const CancelToken& cancel,
                  std::string& error) const;

    std::shared_ptr<llama_model> model_;
    std::shared_ptr<mtmd_context> mtmd_;
    bool audioSupported_ = false;

    // mtmd contexts are not thread-safe
    mutable std::mutex mtmdMutex_;
};

}
