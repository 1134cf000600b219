/*
 * castline - Podcast generation daemon (castd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/config.hpp"
#include "castline/http_api.hpp"
#include "castline/http_speech_backend.hpp"
#include "castline/llama_backend.hpp"
#include "castline/logger.hpp"
#include "castline/service.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>

#include <httplib.h>

using namespace castline;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " <model.gguf> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --mmproj <path>     multimodal projector (audio prompts)\n";
    std::cout << "  -w, --workers <n>   pipeline threads (default 4)\n";
    std::cout << "  --host <addr>       bind address (default 0.0.0.0)\n";
    std::cout << "  --port <n>          listen port (default 8000)\n";
    std::cout << "  --tts-url <url>     speech endpoint, e.g. http://127.0.0.1:8080/v1/audio/speech\n";
    std::cout << "  -v, --version       print version\n";
    std::cout << "\n";
    std::cout << "Environment: CASTLINE_LOG_LEVEL, CASTLINE_MAX_WORDS, CASTLINE_MAX_SECONDS,\n";
    std::cout << "  CASTLINE_TIMEOUT_SEC, CASTLINE_TTS_URL, CASTLINE_TEMP, CASTLINE_GPU_LAYERS ...\n";
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    Logger::setLevel(LogLevel::INFO);
    Logger::initFromEnv();

    Config config = Config::fromEnv();
    std::string modelPath = argv[1];
    std::string mmprojPath;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-w" || arg == "--workers") && i + 1 < argc) {
            try {
                config.workers = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid worker count\n";
                return 1;
            }
            if (config.workers <= 0) {
                std::cerr << "Error: Invalid worker count\n";
                return 1;
            }
        } else if (arg == "--mmproj" && i + 1 < argc) {
            mmprojPath = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            config.host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                config.port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid port\n";
                return 1;
            }
        } else if (arg == "--tts-url" && i + 1 < argc) {
            config.ttsUrl = argv[++i];
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(std::filesystem::path(modelPath))) {
        std::cerr << "Error: Model not found: " << modelPath << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        LlamaBackend generator(modelPath, mmprojPath);
        HttpSpeechBackend speech(config.ttsUrl, config.ttsTimeoutSec, config.ttsApiKey, config.ttsModel);
        if (!speech.configured()) {
            LOG_WARN("No speech endpoint configured; audio fetches return placeholder clips");
        }

        Service service(generator, speech, config);
        if (!service.start()) {
            std::cerr << "Failed to start\n";
            return 1;
        }

        HttpApi api(service);
        httplib::Server server;
        server.set_default_headers({{"Server", "castd"}});
        server.new_task_queue = [&config] {
            return new httplib::ThreadPool(static_cast<size_t>(std::max(8, config.workers * 4)));
        };
        server.set_pre_routing_handler([](const httplib::Request& req, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", req.get_header_value("Origin"));
            if (req.method == "OPTIONS") {
                res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE");
                res.set_header("Access-Control-Allow-Headers", "*");
                res.set_content("", "text/plain");
                return httplib::Server::HandlerResponse::Handled;
            }
            return httplib::Server::HandlerResponse::Unhandled;
        });
        api.registerRoutes(server);

        if (!server.bind_to_port(config.host, config.port)) {
            LOG_ERROR("Failed to listen on " + config.host + ":" + std::to_string(config.port));
            service.shutdown();
            return 1;
        }

        std::cout << "\n";
        std::cout << "  \033[1mcastd\033[0m " << VERSION << "\n";
        std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n\n";
        std::cout << "    Model      " << std::filesystem::path(modelPath).filename().string() << "\n";
        std::cout << "    Workers    " << config.workers << "\n";
        std::cout << "    Listening  http://" << config.host << ":" << config.port << "\n";
        if (!mmprojPath.empty()) {
            std::cout << "    MMProj     " << mmprojPath << (generator.canTranscribe() ? "" : " (no audio)") << "\n";
        }
        std::cout << "    Speech     " << (config.ttsUrl.empty() ? "placeholder" : config.ttsUrl) << "\n\n";

        std::thread listener([&server] {
            setThreadName("HTTP");
            if (!server.listen_after_bind()) {
                LOG_ERROR("HTTP server stopped unexpectedly");
            }
        });
        server.wait_until_ready();

        while (!g_shutdown_requested && service.isRunning() && server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, stopping server..." << std::endl;
        }

        api.stopStreams();
        service.shutdown();
        server.stop();
        if (listener.joinable()) {
            listener.join();
        }

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("castd stopped");
    return 0;
}
