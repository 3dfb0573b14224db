#pragma once

#include "engine/engine.hpp"
#include "platform/audio_capture.hpp"
#include "platform/model_fetcher.hpp"
#include "platform/permission_gate.hpp"
#include "platform/ticker.hpp"
#include "sample_ring.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace test {

// RAII temp directory, removed with its contents.
struct TmpDir {
    std::filesystem::path path;

    TmpDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "ps_test_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        path = ::mkdtemp(buf.data());
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string operator/(const std::string& name) const { return (path / name).string(); }
};

inline void write_file(const std::string& path, size_t bytes, char fill = 'x') {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    std::string chunk(4096, fill);
    while (bytes > 0) {
        size_t n = std::min(bytes, chunk.size());
        out.write(chunk.data(), static_cast<std::streamsize>(n));
        bytes -= n;
    }
}

inline size_t count_files(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) return 0;
    size_t n = 0;
    for (auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file()) ++n;
    }
    return n;
}

// Capture device fed by the test instead of a microphone.
class MockAudioCapture : public AudioCapture {
public:
    explicit MockAudioCapture(SampleRing& ring) : ring_(ring) {}

    bool start() override {
        ++start_calls;
        if (fail_start) return false;
        capturing_ = true;
        return true;
    }
    void stop() override { capturing_ = false; }
    bool is_capturing() const override { return capturing_; }
    std::string last_error() const override { return fail_start ? fail_reason : stream_error; }

    // Pushes samples as the device thread would.
    size_t feed(std::span<const int16_t> samples) {
        if (!capturing_) return 0;
        return ring_.write(samples);
    }
    size_t feed_silence(size_t count) {
        std::vector<int16_t> samples(count, 0);
        return feed(samples);
    }

    bool fail_start = false;
    std::string fail_reason = "device busy";
    // Set after a successful start() to mimic a stream that errors later.
    std::string stream_error;
    int start_calls = 0;

private:
    SampleRing& ring_;
    bool capturing_ = false;
};

class FakePermissionGate : public PermissionGate {
public:
    PermissionStatus check() const override {
        ++check_calls;
        return status;
    }
    PermissionStatus request() override {
        ++request_calls;
        status = request_result;
        if (status == PermissionStatus::PermanentlyDenied) open_settings();
        return status;
    }
    void open_settings() override { ++settings_calls; }

    PermissionStatus status = PermissionStatus::Granted;
    PermissionStatus request_result = PermissionStatus::Granted;
    mutable int check_calls = 0;
    int request_calls = 0;
    int settings_calls = 0;
};

class FakeTicker : public Ticker {
public:
    bool arm(std::chrono::milliseconds p) override {
        ++arm_calls;
        period = p;
        armed_ = true;
        return true;
    }
    void disarm() override { armed_ = false; }
    bool armed() const override { return armed_; }

    std::chrono::milliseconds period{0};
    int arm_calls = 0;

private:
    bool armed_ = false;
};

// Writes `bytes` bytes to the destination, or fails when `fail` is set.
class FakeFetcher : public ModelFetcher {
public:
    std::expected<void, std::string> fetch(const std::string& url,
                                           const std::string& dest_path) override {
        std::lock_guard<std::mutex> lock(mu);
        ++calls;
        urls.push_back(url);
        if (on_fetch) on_fetch();
        if (fail) return std::unexpected(std::string("network unreachable"));
        write_file(dest_path, bytes);
        return {};
    }

    std::mutex mu;
    int calls = 0;
    std::vector<std::string> urls;
    bool fail = false;
    size_t bytes = 200 * 1024;
    std::function<void()> on_fetch;
};

class FakeEngine : public TranscriptionEngine {
public:
    std::string_view name() const override { return "fake"; }

    std::expected<TranscriptResult, Error> transcribe(const TranscribeRequest& request) override {
        std::lock_guard<std::mutex> lock(mu);
        ++calls;
        last_request = request;
        if (error) return std::unexpected(*error);
        return TranscriptResult{.text = text, .duration_s = duration_s};
    }

    std::mutex mu;
    int calls = 0;
    TranscribeRequest last_request;
    std::string text = "hello world";
    double duration_s = 1.0;
    std::optional<Error> error;
};

} // namespace test
