#pragma once

#include "engine.hpp"

#include <mutex>
#include <string>

struct whisper_context;

// In-process whisper.cpp. The model file is loaded on first use and
// reloaded only when the requested path changes.
class WhisperCppEngine : public TranscriptionEngine {
public:
    explicit WhisperCppEngine(int threads = 4, bool verbose = false);
    ~WhisperCppEngine() override;

    WhisperCppEngine(const WhisperCppEngine&) = delete;
    WhisperCppEngine& operator=(const WhisperCppEngine&) = delete;

    std::string_view name() const override { return "local"; }
    std::expected<TranscriptResult, Error> transcribe(const TranscribeRequest& request) override;

private:
    bool load(const std::string& model_path);

    int threads_;
    bool verbose_;
    std::mutex mu_;
    whisper_context* ctx_ = nullptr;
    std::string loaded_path_;
};
