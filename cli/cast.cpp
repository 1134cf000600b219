/*
 * castline - One-shot podcast generation (cast)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "castline/config.hpp"
#include "castline/http_speech_backend.hpp"
#include "castline/llama_backend.hpp"
#include "castline/logger.hpp"
#include "castline/service.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <unistd.h>

using namespace castline;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "castline One-shot Podcast Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <model.gguf> <prompt...> [options]\n";
    std::cout << "       " << progName << " <model.gguf> -     (read prompt from stdin)\n";
    std::cout << "       " << progName << " <model.gguf> --audio-in <file> --mmproj <path>\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  --speakers <n>       1 or 2 (default 1)\n";
    std::cout << "  --voices <F,M>       voice per speaker\n";
    std::cout << "  --category <name>    generated | localisation\n";
    std::cout << "  --theme <text>       localisation theme\n";
    std::cout << "  --location <text>    localisation place\n";
    std::cout << "  --language <text>    output language\n";
    std::cout << "  --audio-in <file>    spoken prompt (wav, mp3, flac)\n";
    std::cout << "  --mmproj <path>      projector for audio prompts\n";
    std::cout << "  --audio-out <file>   write the episode audio\n";
    std::cout << "  --tts-url <url>      speech endpoint (else CASTLINE_TTS_URL)\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  CASTLINE_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " model.gguf \"A short history of Paris\" --voices F\n";
    std::cout << "  " << progName << " model.gguf Coffee in Lisbon --speakers 2 --voices F,M --audio-out ep.wav\n";
}

bool readFile(const std::string& path, Bytes& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

std::string mimeFor(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (ext == ".wav") return "audio/wav";
    if (ext == ".mp3") return "audio/mpeg";
    if (ext == ".flac") return "audio/flac";
    if (ext == ".ogg") return "audio/ogg";
    return "audio/webm";
}

int main(int argc, char* argv[]) {
    // Default to WARN so stdout carries only the transcript
    if (!std::getenv("CASTLINE_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);
    else
        Logger::initFromEnv();

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

    Config config = Config::fromEnv();
    config.workers = 1;

    std::string modelPath = argv[1];
    std::string mmprojPath;
    std::string audioIn;
    std::string audioOut;
    std::string voices;
    JobSpec spec;
    std::ostringstream promptStream;
    bool first = true;
    bool readStdin = (argc == 2 && !isatty(fileno(stdin)));

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << flag << " requires a value\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--speakers") {
            const char* v = value("--speakers");
            if (!v) return 1;
            try {
                spec.speakers = std::stoi(v);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid speaker count\n";
                return 1;
            }
        } else if (arg == "--voices") {
            const char* v = value("--voices");
            if (!v) return 1;
            voices = v;
        } else if (arg == "--category") {
            const char* v = value("--category");
            if (!v) return 1;
            auto parsed = parseCategory(v);
            if (!parsed) {
                std::cerr << "Error: Unknown category: " << v << "\n";
                return 1;
            }
            spec.category = *parsed;
        } else if (arg == "--theme") {
            const char* v = value("--theme");
            if (!v) return 1;
            spec.theme = std::string(v);
        } else if (arg == "--location") {
            const char* v = value("--location");
            if (!v) return 1;
            spec.geoLocation = std::string(v);
        } else if (arg == "--language") {
            const char* v = value("--language");
            if (!v) return 1;
            spec.language = std::string(v);
        } else if (arg == "--audio-in") {
            const char* v = value("--audio-in");
            if (!v) return 1;
            audioIn = v;
        } else if (arg == "--mmproj") {
            const char* v = value("--mmproj");
            if (!v) return 1;
            mmprojPath = v;
        } else if (arg == "--audio-out") {
            const char* v = value("--audio-out");
            if (!v) return 1;
            audioOut = v;
        } else if (arg == "--tts-url") {
            const char* v = value("--tts-url");
            if (!v) return 1;
            config.ttsUrl = v;
        } else if (arg == "-") {
            readStdin = true;
        } else {
            if (!first) promptStream << " ";
            promptStream << arg;
            first = false;
        }
    }

    if (!audioIn.empty()) {
        spec.mode = PromptMode::Audio;
        if (!readFile(audioIn, spec.audio)) {
            std::cerr << "Error: Cannot read audio: " << audioIn << "\n";
            return 1;
        }
        spec.audioMime = mimeFor(audioIn);
    } else if (readStdin) {
        spec.text.assign((std::istreambuf_iterator<char>(std::cin)),
                          std::istreambuf_iterator<char>());
    } else {
        spec.text = promptStream.str();
    }

    std::stringstream voiceStream(voices);
    std::string voice;
    while (std::getline(voiceStream, voice, ',')) {
        spec.voices.push_back(voice);
    }

    // Reject bad input before paying for the model load
    JobSpec preview = spec;
    if (auto checked = validate(preview); !checked) {
        std::cerr << "Error: " << checked.message << "\n";
        return 1;
    }

    if (!std::filesystem::exists(std::filesystem::path(modelPath))) {
        std::cerr << "Error: Model not found: " << modelPath << "\n";
        return 1;
    }

    try {
        LlamaBackend generator(modelPath, mmprojPath);
        HttpSpeechBackend speech(config.ttsUrl, config.ttsTimeoutSec, config.ttsApiKey, config.ttsModel);
        Service service(generator, speech, config);
        if (!service.start()) {
            std::cerr << "Error: Failed to start\n";
            return 1;
        }

        CreateResult created = service.submit(std::move(spec));
        if (!created) {
            std::cerr << "Error: " << created.message << "\n";
            return 1;
        }

        SubscribeResult subscribed = service.subscribe(created.id);
        if (!subscribed) {
            std::cerr << "Error: " << subscribed.message << "\n";
            return 1;
        }

        bool failed = false;
        Subscription& sub = *subscribed.subscription;
        while (!sub.finished()) {
            auto event = sub.next(std::chrono::seconds(1));
            if (!event) {
                continue;
            }
            if (event->type == EventType::Chunk) {
                std::cout << event->delta << std::flush;
            } else if (event->type == EventType::Done) {
                std::cout << "\n";
                std::cerr << "Title: " << event->title << (event->truncated ? " (truncated)" : "") << "\n";
            } else if (event->type == EventType::Error) {
                std::cerr << "Error: " << event->message << "\n";
                failed = true;
            }
        }

        if (!failed && !audioOut.empty()) {
            AudioResult audio = service.audio(created.id);
            if (!audio) {
                std::cerr << "Error: " << audio.message << "\n";
                failed = true;
            } else {
                std::ofstream out(audioOut, std::ios::binary);
                out.write(reinterpret_cast<const char*>(audio.audio.bytes->data()),
                          static_cast<std::streamsize>(audio.audio.size()));
                if (!out) {
                    std::cerr << "Error: Cannot write " << audioOut << "\n";
                    failed = true;
                } else {
                    std::cerr << "Audio: " << audioOut << " (" << audio.audio.size() << " bytes"
                              << (audio.audio.placeholder ? ", placeholder" : "") << ")\n";
                }
            }
        }

        service.shutdown();
        return failed ? 1 : 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
