#pragma once

#include "errors.hpp"
#include "platform/audio_capture.hpp"
#include "platform/permission_gate.hpp"
#include "sample_ring.hpp"
#include "wav.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

struct AudioArtifact {
    std::string file_path;
    uint64_t size_bytes = 0;
    uint32_t sample_rate_hz = wav::SAMPLE_RATE;
    uint16_t channels = wav::CHANNELS;
};

// One recording at a time: captured samples are streamed into
// <recordings_dir>/recording_<unix-millis>.wav between start() and stop().
class Recorder {
public:
    // Anything smaller is reported as possibly corrupt but still returned.
    static constexpr uint64_t MIN_VIABLE_BYTES = 1024;

    Recorder(SampleRing& ring, AudioCapture& capture, PermissionGate& permissions,
             std::string recordings_dir);
    ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    // Returns the artifact path. A second start() while recording returns the current path.
    std::expected<std::string, Error> start();
    // Device if the stream failed before delivering any audio (the file is
    // removed), NoAudio if no file was produced.
    std::expected<AudioArtifact, Error> stop();
    // Stops capture and deletes the partial file. No-op when not recording.
    void cancel();
    // Moves buffered samples into the open file.
    void pump();

    bool is_recording() const { return recording_; }
    const std::string& current_path() const { return path_; }
    const std::string& recordings_dir() const { return recordings_dir_; }

    // Newest first.
    std::vector<std::string> list_recordings() const;
    std::expected<void, std::string> delete_recording(const std::string& path) const;

private:
    std::string next_path() const;

    SampleRing& ring_;
    AudioCapture& capture_;
    PermissionGate& permissions_;
    std::string recordings_dir_;

    wav::Writer writer_;
    std::string path_;
    bool recording_ = false;
    bool overflow_reported_ = false;
};
