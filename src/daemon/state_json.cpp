#include "state_json.hpp"

using json = nlohmann::json;

json to_json(const SessionState& state) {
    return std::visit(overloaded{
        [](const SessionIdle&) -> json {
            return {{"state", "idle"}};
        },
        [](const SessionRecording& s) -> json {
            return {{"state", "recording"}, {"elapsed", s.elapsed.count() / 1000.0}};
        },
        [](const SessionProcessing& s) -> json {
            return {
                {"state", "processing"},
                {"audio_path", s.artifact.file_path},
                {"size_bytes", s.artifact.size_bytes},
            };
        },
        [](const SessionCompleted& s) -> json {
            return {
                {"state", "completed"},
                {"text", s.text},
                {"audio_path", s.audio_path},
                {"duration", s.audio_duration_s},
                {"processing_time", s.processing.count() / 1000.0},
            };
        },
        [](const SessionFailed& s) -> json {
            return {{"state", "failed"}, {"kind", std::string(to_string(s.kind))}, {"message", s.reason}};
        },
    }, state);
}

json to_json(const ModelState& state) {
    return std::visit(overloaded{
        [](const ModelUninitialized&) -> json {
            return {{"state", "uninitialized"}};
        },
        [](const ModelInitializing& s) -> json {
            return {{"state", "initializing"}, {"name", s.model_name}};
        },
        [](const ModelReady& s) -> json {
            return {{"state", "ready"}, {"name", s.model_name}};
        },
        [](const ModelFailed& s) -> json {
            return {{"state", "failed"}, {"message", s.reason}};
        },
    }, state);
}

json to_json(const Error& error) {
    return {{"status", "error"}, {"kind", std::string(to_string(error.kind))}, {"message", error.message}};
}
