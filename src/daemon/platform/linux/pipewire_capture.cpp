#include "platform/linux/pipewire_capture.hpp"

#include <format>
#include <print>
#include <span>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

PipeWireCapture::PipeWireCapture(SampleRing& ring, uint32_t sample_rate)
    : ring_(ring), sample_rate_(sample_rate) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    stop();
    pw_deinit();
}

std::string PipeWireCapture::last_error() const {
    std::lock_guard<std::mutex> lock(error_mu_);
    return last_error_;
}

bool PipeWireCapture::fail(std::string reason) {
    std::println(stderr, "audio: {}", reason);
    teardown();
    std::lock_guard<std::mutex> lock(error_mu_);
    last_error_ = std::move(reason);
    return false;
}

void PipeWireCapture::teardown() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

bool PipeWireCapture::start() {
    if (capturing_.load(std::memory_order_relaxed)) return true;

    {
        std::lock_guard<std::mutex> lock(error_mu_);
        last_error_.clear();
    }

    loop_ = pw_thread_loop_new("pocket-scribe", nullptr);
    if (!loop_) {
        return fail("failed to create thread loop");
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "pocket-scribe",
        PW_KEY_APP_NAME, "pocket-scribe",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "pocket-scribe-capture",
        props,
        &stream_events_,
        this
    );
    if (!stream_) {
        return fail("failed to create capture stream");
    }

    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    // Flag set before the loop runs so the first buffers are not discarded.
    capturing_.store(true, std::memory_order_release);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );
    if (ret < 0) {
        capturing_.store(false, std::memory_order_release);
        return fail(std::format("stream connect failed: {}", spa_strerror(ret)));
    }

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        capturing_.store(false, std::memory_order_release);
        return fail(std::format("thread loop start failed: {}", spa_strerror(ret)));
    }

    return true;
}

void PipeWireCapture::stop() {
    if (!capturing_.load(std::memory_order_relaxed)) return;

    capturing_.store(false, std::memory_order_release);
    teardown();
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = reinterpret_cast<const int16_t*>(
        static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    size_t count = d->chunk->size / sizeof(int16_t);

    if (self->capturing_.load(std::memory_order_relaxed)) {
        self->ring_.write(std::span<const int16_t>(data, count));
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    if (!error) return;

    auto* self = static_cast<PipeWireCapture*>(userdata);
    std::println(stderr, "audio: stream state {} -> {}: {}",
                 pw_stream_state_as_string(old),
                 pw_stream_state_as_string(state),
                 error);

    std::lock_guard<std::mutex> lock(self->error_mu_);
    self->last_error_ = error;
}
