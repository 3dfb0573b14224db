#pragma once

#include "wav.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Engine {
        std::string type = "local";    // "local" (whisper.cpp) or "lan"
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "auto";
        int threads = 4;
    } engine;

    struct Model {
        std::string name = "tiny";
        std::string bundle_dir = "/usr/share/pocket-scribe/models";
        std::string cache_dir;         // empty: <data_dir>/models
        std::string download_url = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main";
    } model;

    struct Audio {
        uint32_t max_seconds = 120;
        std::string recordings_dir;    // empty: <data_dir>/recordings

        // Computed from max_seconds (no independent config key).
        size_t ring_buffer_samples() const {
            return static_cast<size_t>(max_seconds) * wav::SAMPLE_RATE;
        }
    } audio;

    struct Permissions {
        std::string settings_command = "pavucontrol";
    } permissions;

    // Empty directory settings resolved against the platform data dir.
    std::string model_cache_dir() const;
    std::string recordings_dir() const;

    static Config load(const std::string& path);
    static Config load_default();
};
