#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string data_subdir(const char* name) {
    auto dir = platform::data_dir();
    if (dir.empty()) dir = "/tmp/pocket-scribe";
    return (fs::path(dir) / name).string();
}

} // namespace

std::string Config::model_cache_dir() const {
    return model.cache_dir.empty() ? data_subdir("models") : model.cache_dir;
}

std::string Config::recordings_dir() const {
    return audio.recordings_dir.empty() ? data_subdir("recordings") : audio.recordings_dir;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);
        Config parsed;

        if (j.contains("engine")) {
            auto& e = j["engine"];
            if (e.contains("type")) parsed.engine.type = e["type"].get<std::string>();
            if (e.contains("url")) parsed.engine.url = e["url"].get<std::string>();
            if (e.contains("api_format")) parsed.engine.api_format = e["api_format"].get<std::string>();
            if (e.contains("language")) parsed.engine.language = e["language"].get<std::string>();
            if (e.contains("threads")) parsed.engine.threads = e["threads"].get<int>();
        }

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("name")) parsed.model.name = m["name"].get<std::string>();
            if (m.contains("bundle_dir")) parsed.model.bundle_dir = m["bundle_dir"].get<std::string>();
            if (m.contains("cache_dir")) parsed.model.cache_dir = m["cache_dir"].get<std::string>();
            if (m.contains("download_url")) parsed.model.download_url = m["download_url"].get<std::string>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("max_seconds")) parsed.audio.max_seconds = a["max_seconds"].get<uint32_t>();
            if (a.contains("recordings_dir")) parsed.audio.recordings_dir = a["recordings_dir"].get<std::string>();
        }

        if (j.contains("permissions")) {
            auto& p = j["permissions"];
            if (p.contains("settings_command")) {
                parsed.permissions.settings_command = p["settings_command"].get<std::string>();
            }
        }

        if (parsed.audio.max_seconds == 0) {
            std::println(stderr, "config: audio.max_seconds must be positive, using {}",
                         cfg.audio.max_seconds);
            parsed.audio.max_seconds = cfg.audio.max_seconds;
        }

        cfg = std::move(parsed);
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
