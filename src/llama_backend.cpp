/*
 * castline - Podcast Generation Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/llama_backend.hpp"
#include "castline/config.hpp"
#include "castline/logger.hpp"
#include "llama.h"
#include "mtmd.h"
#include "mtmd-helper.h"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <thread>

namespace castline {

namespace {

// Keep llama.cpp chatter out of the daemon log unless asked for.
void filtered_llama_log(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text || text[0] == '.' || text[0] == '\n' || text[0] == '\0') {
        return;
    }

    static int filter_level = -1;
    if (filter_level == -1) {
        const char* env = std::getenv("LLAMA_LOG_LEVEL");
        filter_level = env ?
            (std::string(env) == "info" ? GGML_LOG_LEVEL_INFO :
             std::string(env) == "warn" ? GGML_LOG_LEVEL_WARN :
             std::string(env) == "debug" ? GGML_LOG_LEVEL_DEBUG :
             GGML_LOG_LEVEL_ERROR) : GGML_LOG_LEVEL_ERROR;
    }

    if (level >= filter_level) {
        fprintf(stderr, "%s", text);
    }
}

// Length of the longest prefix of s that does not end inside a UTF-8 sequence.
std::size_t completeUtf8Prefix(const std::string& s) {
    const std::size_t n = s.size();
    std::size_t i = n;
    int back = 0;
    while (i > 0 && back < 4) {
        const auto c = static_cast<unsigned char>(s[i - 1]);
        if ((c & 0xC0) != 0x80) {
            std::size_t need = 1;
            if ((c >> 5) == 0x6) need = 2;
            else if ((c >> 4) == 0xE) need = 3;
            else if ((c >> 3) == 0x1E) need = 4;
            return (n - (i - 1) >= need) ? n : i - 1;
        }
        --i;
        ++back;
    }
    return n;
}

// Turns raw token pieces into publishable text: whole UTF-8 characters
// only, with <think>...</think> reasoning blocks removed.
class FragmentFilter {
public:
    std::string push(const std::string& piece) {
        carry_ += piece;
        const std::size_t complete = completeUtf8Prefix(carry_);
        pending_ += carry_.substr(0, complete);
        carry_.erase(0, complete);
        return drain(false);
    }

    std::string flush() {
        pending_ += carry_;
        carry_.clear();
        return drain(true);
    }

private:
    std::string drain(bool final) {
        static const std::string open = "<think>";
        static const std::string close = "</think>";
        std::string out;
        while (!pending_.empty()) {
            if (inThink_) {
                auto pos = pending_.find(close);
                if (pos == std::string::npos) {
                    pending_ = final ? "" : pending_.substr(pending_.size() - std::min(pending_.size(), close.size() - 1));
                    break;
                }
                pending_.erase(0, pos + close.size());
                inThink_ = false;
                stripLeading_ = true;
                continue;
            }

            auto pos = pending_.find(open);
            if (pos != std::string::npos) {
                out += pending_.substr(0, pos);
                pending_.erase(0, pos + open.size());
                inThink_ = true;
                continue;
            }

            std::size_t keep = 0;
            if (!final) {
                for (std::size_t k = std::min(pending_.size(), open.size() - 1); k > 0; --k) {
                    if (pending_.compare(pending_.size() - k, k, open, 0, k) == 0) {
                        keep = k;
                        break;
                    }
                }
            }
            out += pending_.substr(0, pending_.size() - keep);
            pending_.erase(0, pending_.size() - keep);
            break;
        }

        if (stripLeading_) {
            auto start = out.find_first_not_of(" \t\n\r");
            if (start == std::string::npos) {
                return "";
            }
            out.erase(0, start);
            stripLeading_ = false;
        }
        return out;
    }

    std::string carry_;
    std::string pending_;
    bool inThink_ = false;
    bool stripLeading_ = false;
};

std::string trimmed(const std::string& text) {
    auto start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

}

LlamaBackend::LlamaBackend(const std::string& modelPath, const std::string& mmprojPath) {
    llama_log_set(filtered_llama_log, nullptr);
    ggml_backend_load_all();

    LOG_INFO("Loading model: " + modelPath);
    llama_model_params model_params = llama_model_default_params();
    #if defined(__APPLE__)
        model_params.n_gpu_layers = envInt("CASTLINE_GPU_LAYERS", 99);
    #else
        model_params.n_gpu_layers = envInt("CASTLINE_GPU_LAYERS", 0);
    #endif

    llama_model* model = llama_model_load_from_file(modelPath.c_str(), model_params);
    if (!model) {
        LOG_ERROR("Failed to load model: " + modelPath);
        throw std::runtime_error("Failed to load model: " + modelPath);
    }
    model_ = std::shared_ptr<llama_model>(model, llama_model_free);
    LOG_INFO("Model loaded successfully");

    if (!mmprojPath.empty()) {
        LOG_INFO("Loading mmproj: " + mmprojPath);
        mtmd_context_params mparams = mtmd_context_params_default();
        #if defined(__APPLE__)
            mparams.use_gpu = true;
        #else
            mparams.use_gpu = envInt("CASTLINE_GPU_LAYERS", 0) > 0;
        #endif
        mparams.n_threads = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
        mparams.verbosity = GGML_LOG_LEVEL_ERROR;

        mtmd_context* ctx = mtmd_init_from_file(mmprojPath.c_str(), model_.get(), mparams);
        if (!ctx) {
            LOG_WARN("Failed to load mmproj: " + mmprojPath + " - audio prompts will use the generic fallback");
        } else {
            mtmd_ = std::shared_ptr<mtmd_context>(ctx, mtmd_free);
            audioSupported_ = mtmd_support_audio(ctx);
            LOG_INFO(std::string("Multimodal projector loaded (audio input ") +
                     (audioSupported_ ? "enabled" : "not supported by this projector") + ")");
        }
    }
}

LlamaBackend::~LlamaBackend() = default;

LlamaBackend::SamplingConfig LlamaBackend::buildSamplingConfig(int maxTokens) const {
    SamplingConfig config;
    const int n_ctx_train = llama_model_n_ctx_train(model_.get());

    config.temp = static_cast<float>(envDouble("CASTLINE_TEMP", 0.8));
    config.top_k = envInt("CASTLINE_TOP_K", 40);
    config.top_p = static_cast<float>(envDouble("CASTLINE_TOP_P", 0.9));
    config.min_p = static_cast<float>(envDouble("CASTLINE_MIN_P", 0.05));
    config.repeat_penalty = static_cast<float>(envDouble("CASTLINE_REPEAT_PENALTY", 1.1));
    config.repeat_last_n = envInt("CASTLINE_REPEAT_LAST_N", 64);
    config.seed = static_cast<uint32_t>(envInt("CASTLINE_SEED", 0));

    config.max_ctx = std::min(n_ctx_train, envInt("CASTLINE_MAX_CTX", 8192));
    config.n_predict = maxTokens > 0 ? maxTokens : envInt("CASTLINE_PREDICT", 1024);
    return config;
}

void LlamaBackend::buildContextParams(int n_prompt, const SamplingConfig& config, llama_context_params& params) const {
    params = llama_context_default_params();
    params.n_ctx = std::min(n_prompt + config.n_predict + 64, config.max_ctx);
    params.n_batch = std::min<uint32_t>(params.n_ctx, std::max(n_prompt, envInt("CASTLINE_BATCH", 2048)));
    params.no_perf = true;
}

llama_sampler* LlamaBackend::buildSampler(const SamplingConfig& config) const {
    auto sparams = llama_sampler_chain_default_params();
    sparams.no_perf = true;
    llama_sampler* smpl = llama_sampler_chain_init(sparams);

    llama_sampler_chain_add(smpl, llama_sampler_init_penalties(
        config.repeat_last_n,
        config.repeat_penalty,
        0.0f,
        0.0f
    ));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_k(config.top_k));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_p(config.top_p, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_min_p(config.min_p, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_temp(config.temp));
    llama_sampler_chain_add(smpl, llama_sampler_init_dist(config.seed == 0 ? LLAMA_DEFAULT_SEED : config.seed));

    return smpl;
}

std::string LlamaBackend::formatPrompt(const std::string& content) const {
    // Instruct models get their chat template, base models the raw text
    const char* tmpl = llama_model_chat_template(model_.get(), nullptr);
    if (!tmpl) {
        return content;
    }

    llama_chat_message msg = {"user", content.c_str()};
    int len = llama_chat_apply_template(tmpl, &msg, 1, true, nullptr, 0);
    if (len < 0) {
        return content;
    }

    std::vector<char> buf(len + 1);
    int res = llama_chat_apply_template(tmpl, &msg, 1, true, buf.data(), buf.size());
    return (res > 0) ? std::string(buf.data(), res) : content;
}

bool LlamaBackend::generate(llama_context* ctx, llama_sampler* smpl, int n_past, int n_predict,
                            const FragmentCallback& onFragment, const CancelToken& cancel,
                            std::string& error) const {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    llama_batch batch = llama_batch_init(1, 0, 1);
    FragmentFilter filter;
    bool ok = true;
    bool stopped = false;

    for (int i = 0; i < n_predict; ++i) {
        if (isCancelled(cancel)) {
            stopped = true;
            break;
        }

        llama_token token = llama_sampler_sample(smpl, ctx, -1);
        if (llama_vocab_is_eog(vocab, token)) {
            break;
        }

        char buf[256];
        int n = llama_token_to_piece(vocab, token, buf, sizeof(buf), 0, false);
        if (n < 0) {
            error = "Failed to convert token to piece";
            ok = false;
            break;
        }

        std::string text = filter.push(std::string(buf, n));
        if (!text.empty() && !onFragment(text)) {
            stopped = true;
            break;
        }

        batch.n_tokens = 1;
        batch.token[0] = token;
        batch.pos[0] = n_past++;
        batch.n_seq_id[0] = 1;
        batch.seq_id[0][0] = 0;
        batch.logits[0] = true;

        if (llama_decode(ctx, batch)) {
            error = "Failed to decode";
            ok = false;
            break;
        }
    }

    if (ok && !stopped) {
        std::string rest = filter.flush();
        if (!rest.empty()) {
            (void)onFragment(rest);
        }
    }

    llama_batch_free(batch);
    return ok;
}

GenerationResult LlamaBackend::stream(const GenerationRequest& request,
                                      const FragmentCallback& onFragment,
                                      const CancelToken& cancel) {
    if (!model_) {
        return {false, "", "Model not loaded"};
    }
    if (request.useSearch) {
        LOG_DEBUG("Web search grounding is not available to the local model; generating without it");
    }

    try {
        SamplingConfig config = buildSamplingConfig(request.maxTokens);
        std::string formatted_prompt = formatPrompt(request.prompt);
        const llama_vocab* vocab = llama_model_get_vocab(model_.get());
        const int n_prompt = -llama_tokenize(vocab, formatted_prompt.c_str(), formatted_prompt.size(), NULL, 0, true, true);
        if (n_prompt <= 0) {
            return {false, "", "Failed to tokenize input"};
        }

        int max_predict = config.max_ctx - n_prompt - 64;
        if (max_predict <= 0) {
            return {false, "", "Prompt does not fit the model context"};
        }
        config.n_predict = std::min(config.n_predict, max_predict);

        std::vector<llama_token> prompt_tokens(n_prompt);
        if (llama_tokenize(vocab, formatted_prompt.c_str(), formatted_prompt.size(), prompt_tokens.data(), prompt_tokens.size(), true, true) < 0) {
            return {false, "", "Failed to tokenize the prompt"};
        }

        llama_context_params ctx_params;
        buildContextParams(n_prompt, config, ctx_params);
        std::unique_ptr<llama_context, decltype(&llama_free)> ctx(
            llama_init_from_model(model_.get(), ctx_params), llama_free);
        if (!ctx) {
            return {false, "", "Failed to create context"};
        }
        std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> smpl(buildSampler(config), llama_sampler_free);

        LOG_DEBUG("Context: " + std::to_string(ctx_params.n_ctx) + " tokens, prompt: " + std::to_string(n_prompt));

        llama_batch batch = llama_batch_get_one(prompt_tokens.data(), prompt_tokens.size());
        if (llama_decode(ctx.get(), batch)) {
            return {false, "", "Failed to decode prompt"};
        }

        std::string output;
        std::string error;
        auto sink = [&](const std::string& text) {
            output += text;
            return onFragment ? onFragment(text) : true;
        };
        if (!generate(ctx.get(), smpl.get(), n_prompt, config.n_predict, sink, cancel, error)) {
            return {false, output, error};
        }
        if (isCancelled(cancel)) {
            return {false, output, "Cancelled"};
        }

        LOG_DEBUG("Generated " + std::to_string(output.size()) + " bytes");
        return {true, output, ""};

    } catch (const std::exception& e) {
        LOG_ERROR("Inference error: " + std::string(e.what()));
        return {false, "", "Inference error: " + std::string(e.what())};
    }
}

GenerationResult LlamaBackend::complete(const GenerationRequest& request, const CancelToken& cancel) {
    GenerationResult result = stream(request, nullptr, cancel);
    result.output = trimmed(result.output);
    return result;
}

GenerationResult LlamaBackend::transcribe(const Bytes& audio, const std::string& mimeType,
                                          const std::string& instruction,
                                          const CancelToken& cancel) {
    if (!model_) {
        return {false, "", "Model not loaded"};
    }
    if (!mtmd_ || !audioSupported_) {
        return {false, "", "Audio transcription requires --mmproj with audio support"};
    }

    try {
        std::lock_guard<std::mutex> lock(mtmdMutex_);

        // mtmd sniffs the container itself (wav, mp3, flac)
        mtmd_bitmap* raw = mtmd_helper_bitmap_init_from_buf(mtmd_.get(), audio.data(), audio.size());
        if (!raw) {
            return {false, "", "Unsupported audio format: " + mimeType};
        }
        std::unique_ptr<mtmd_bitmap, decltype(&mtmd_bitmap_free)> bitmap(raw, mtmd_bitmap_free);

        SamplingConfig config = buildSamplingConfig(0);
        config.temp = static_cast<float>(envDouble("CASTLINE_TRANSCRIBE_TEMP", 0.2));

        std::string formatted_prompt = formatPrompt(std::string(mtmd_default_marker()) + instruction);
        mtmd_input_text text;
        text.text = formatted_prompt.c_str();
        text.add_special = true;
        text.parse_special = true;

        std::unique_ptr<mtmd_input_chunks, decltype(&mtmd_input_chunks_free)> chunks(
            mtmd_input_chunks_init(), mtmd_input_chunks_free);
        if (!chunks) {
            return {false, "", "Failed to init audio chunks"};
        }

        const mtmd_bitmap* bitmaps[] = {bitmap.get()};
        if (mtmd_tokenize(mtmd_.get(), chunks.get(), &text, bitmaps, 1) != 0) {
            return {false, "", "Failed to tokenize audio prompt"};
        }

        const int n_prompt = static_cast<int>(mtmd_helper_get_n_tokens(chunks.get()));
        int max_predict = config.max_ctx - n_prompt - 64;
        if (max_predict <= 0) {
            return {false, "", "Audio prompt does not fit the model context"};
        }
        config.n_predict = std::min(config.n_predict, max_predict);

        llama_context_params ctx_params;
        buildContextParams(n_prompt, config, ctx_params);
        std::unique_ptr<llama_context, decltype(&llama_free)> ctx(
            llama_init_from_model(model_.get(), ctx_params), llama_free);
        if (!ctx) {
            return {false, "", "Failed to create context"};
        }
        std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> smpl(buildSampler(config), llama_sampler_free);

        llama_pos n_past = 0;
        if (mtmd_helper_eval_chunks(mtmd_.get(), ctx.get(), chunks.get(), 0, 0, ctx_params.n_batch, true, &n_past) != 0) {
            return {false, "", "Failed to eval audio prompt"};
        }

        std::string output;
        std::string error;
        auto sink = [&](const std::string& piece) {
            output += piece;
            return true;
        };
        if (!generate(ctx.get(), smpl.get(), n_past, config.n_predict, sink, cancel, error)) {
            return {false, "", error};
        }

        LOG_INFO("Transcribed audio prompt: " + std::to_string(output.size()) + " chars");
        return {true, trimmed(output), ""};

    } catch (const std::exception& e) {
        return {false, "", "Audio transcription error: " + std::string(e.what())};
    }
}

}
