#pragma once

#include "platform/audio_capture.hpp"
#include "sample_ring.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <string>

// Default PipeWire source as 16 kHz mono S16_LE. Samples are pushed into the
// ring from the PipeWire realtime thread.
class PipeWireCapture : public AudioCapture {
public:
    explicit PipeWireCapture(SampleRing& ring, uint32_t sample_rate = 16000);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    bool start() override;
    void stop() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }
    std::string last_error() const override;

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    bool fail(std::string reason);
    void teardown();

    SampleRing& ring_;
    uint32_t sample_rate_;
    std::atomic<bool> capturing_{false};

    mutable std::mutex error_mu_;
    std::string last_error_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
