#pragma once

#include "engine.hpp"

#include <string>

// Maps a transcription server reply to a result. `{"error": ...}` or an
// HTTP status >= 400 is an Engine error; a missing, null or blank "text"
// is EmptyResult.
std::expected<TranscriptResult, Error> parse_lan_response(long http_status,
                                                          const std::string& body,
                                                          double audio_duration_s);

// Uploads the recording to a whisper.cpp server or an OpenAI-compatible
// transcription endpoint. The model is whatever the server has loaded.
class LanEngine : public TranscriptionEngine {
public:
    // api_format: "whisper.cpp" or "openai"
    LanEngine(std::string url, std::string api_format = "whisper.cpp");
    ~LanEngine() override;

    std::string_view name() const override { return "lan"; }
    std::expected<TranscriptResult, Error> transcribe(const TranscribeRequest& request) override;

private:
    std::string url_;
    std::string api_format_;
};
