#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    Permission,      // microphone denied or permanently denied
    Device,          // capture hardware unavailable
    Storage,         // recordings directory or file not writable
    CorruptArtifact, // recording missing or unreadable
    NoAudio,         // stop produced no artifact
    ModelInit,       // cache, bundle and download all failed
    Engine,          // inference call failed
    EmptyResult,     // inference returned no usable text
    InvalidState,    // operation not allowed in the current state
};

struct Error {
    ErrorKind kind;
    std::string message;
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Permission: return "permission";
        case ErrorKind::Device: return "device";
        case ErrorKind::Storage: return "storage";
        case ErrorKind::CorruptArtifact: return "corrupt_artifact";
        case ErrorKind::NoAudio: return "no_audio";
        case ErrorKind::ModelInit: return "model_init";
        case ErrorKind::Engine: return "engine";
        case ErrorKind::EmptyResult: return "empty_result";
        case ErrorKind::InvalidState: return "invalid_state";
    }
    return "unknown";
}
