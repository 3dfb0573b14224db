#pragma once

#include "errors.hpp"

#include <expected>
#include <string>
#include <string_view>

struct TranscribeRequest {
    std::string model_name;
    std::string model_path;
    std::string audio_path;
    std::string language = "auto";
};

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
};

// Boundary to the speech-to-text engine. transcribe() blocks for the whole
// inference and is called from a worker thread. Empty text is reported as
// ErrorKind::EmptyResult, never as a successful result.
class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;
    virtual std::string_view name() const = 0;
    virtual std::expected<TranscriptResult, Error> transcribe(const TranscribeRequest& request) = 0;
};

inline std::string trim_whitespace(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\n\r");
    if (begin == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(begin, end - begin + 1));
}
