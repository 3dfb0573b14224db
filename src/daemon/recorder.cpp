#include "recorder.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <functional>
#include <print>
#include <utility>

namespace fs = std::filesystem;

Recorder::Recorder(SampleRing& ring, AudioCapture& capture, PermissionGate& permissions,
                   std::string recordings_dir)
    : ring_(ring), capture_(capture), permissions_(permissions),
      recordings_dir_(std::move(recordings_dir)) {}

Recorder::~Recorder() {
    cancel();
}

std::expected<std::string, Error> Recorder::start() {
    if (recording_) return path_;

    auto status = permissions_.check();
    if (status != PermissionStatus::Granted) {
        return std::unexpected(Error{ErrorKind::Permission,
            std::format("microphone permission {}", to_string(status))});
    }

    std::error_code ec;
    fs::create_directories(recordings_dir_, ec);
    if (ec) {
        return std::unexpected(Error{ErrorKind::Storage,
            std::format("cannot create {}: {}", recordings_dir_, ec.message())});
    }

    auto path = next_path();
    if (!writer_.open(path)) {
        return std::unexpected(Error{ErrorKind::Storage, "cannot write " + path});
    }

    ring_.reset();
    if (!capture_.start()) {
        writer_.close();
        fs::remove(path, ec);
        auto reason = capture_.last_error();
        return std::unexpected(Error{ErrorKind::Device,
            reason.empty() ? "audio capture device unavailable" : reason});
    }

    path_ = std::move(path);
    recording_ = true;
    overflow_reported_ = false;
    return path_;
}

std::expected<AudioArtifact, Error> Recorder::stop() {
    if (!recording_) {
        return std::unexpected(Error{ErrorKind::InvalidState, "not recording"});
    }

    capture_.stop();
    recording_ = false;
    pump();

    // A stream that errors after connecting reports it asynchronously.
    auto device_error = capture_.last_error();
    if (writer_.data_bytes() == 0 && !device_error.empty()) {
        writer_.close();
        std::error_code ec;
        fs::remove(path_, ec);
        path_.clear();
        return std::unexpected(Error{ErrorKind::Device, device_error});
    }

    if (!writer_.finalize()) {
        std::println(stderr, "recorder: failed to finalize {}", path_);
    }

    auto path = std::exchange(path_, {});
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        std::println(stderr, "recorder: recording file not found: {}", path);
        return std::unexpected(Error{ErrorKind::NoAudio, "no audio produced"});
    }

    auto size = fs::file_size(path, ec);
    if (ec) {
        std::println(stderr, "recorder: cannot stat {}: {}", path, ec.message());
        return std::unexpected(Error{ErrorKind::NoAudio, "no audio produced"});
    }

    if (size < MIN_VIABLE_BYTES) {
        std::println(stderr, "recorder: warning: {} is only {} bytes, may be corrupt", path, size);
    }

    return AudioArtifact{
        .file_path = std::move(path),
        .size_bytes = size,
    };
}

void Recorder::cancel() {
    if (!recording_) return;

    capture_.stop();
    recording_ = false;
    writer_.close();
    ring_.reset();

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        std::println(stderr, "recorder: failed to delete {}: {}", path_, ec.message());
    }
    path_.clear();
}

void Recorder::pump() {
    if (!writer_.is_open()) return;

    auto samples = ring_.drain_all();
    if (!writer_.append(samples)) {
        std::println(stderr, "recorder: write to {} failed", path_);
    }

    if (!overflow_reported_ && ring_.dropped() > 0) {
        std::println(stderr, "recorder: ring buffer overflow, {} samples dropped", ring_.dropped());
        overflow_reported_ = true;
    }
}

std::vector<std::string> Recorder::list_recordings() const {
    std::vector<std::string> out;
    std::error_code ec;
    for (auto it = fs::directory_iterator(recordings_dir_, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        auto name = it->path().filename().string();
        if (name.starts_with("recording_") && it->path().extension() == ".wav") {
            out.push_back(it->path().string());
        }
    }
    // Names embed the start time, so lexical order is chronological.
    std::ranges::sort(out, std::greater<>{});
    return out;
}

std::expected<void, std::string> Recorder::delete_recording(const std::string& path) const {
    std::error_code target_ec, dir_ec;
    auto target = fs::weakly_canonical(path, target_ec);
    auto dir = fs::weakly_canonical(recordings_dir_, dir_ec);
    if (target_ec || dir_ec || target.parent_path() != dir || target.extension() != ".wav") {
        return std::unexpected("not a recording: " + path);
    }
    std::error_code ec;
    if (recording_ && fs::weakly_canonical(path_, ec) == target) {
        return std::unexpected("recording in progress: " + path);
    }
    if (!fs::remove(target, ec)) {
        return std::unexpected(ec ? ec.message() : "no such recording: " + path);
    }
    return {};
}

std::string Recorder::next_path() const {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::error_code ec;
    auto candidate = fs::path(recordings_dir_) / std::format("recording_{}.wav", ms);
    while (fs::exists(candidate, ec)) {
        candidate = fs::path(recordings_dir_) / std::format("recording_{}.wav", ++ms);
    }
    return candidate.string();
}
