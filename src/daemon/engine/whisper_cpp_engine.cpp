#include "whisper_cpp_engine.hpp"
#include "wav.hpp"

#include <algorithm>
#include <cstdio>
#include <print>
#include <thread>
#include <vector>
#include <whisper.h>

namespace {

bool g_verbose = false;

// Keep warnings and errors; info/debug chatter only when verbose.
void log_cb(ggml_log_level level, const char* text, void* /*user_data*/) {
    if (level == GGML_LOG_LEVEL_ERROR || level == GGML_LOG_LEVEL_WARN || g_verbose) {
        std::fputs(text, stderr);
    }
}

// Segments that are nothing but a bracketed marker, e.g. "[BLANK_AUDIO]".
bool is_non_speech(const std::string& s) {
    return s.size() >= 2 && (s.front() == '[' || s.front() == '(') &&
           (s.back() == ']' || s.back() == ')');
}

} // namespace

WhisperCppEngine::WhisperCppEngine(int threads, bool verbose)
    : threads_(threads > 0 ? threads
                           : static_cast<int>(std::max(1u, std::thread::hardware_concurrency()))),
      verbose_(verbose) {
    g_verbose = verbose_;
    whisper_log_set(log_cb, nullptr);
}

WhisperCppEngine::~WhisperCppEngine() {
    std::lock_guard<std::mutex> lock(mu_);
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

bool WhisperCppEngine::load(const std::string& model_path) {
    if (ctx_ && loaded_path_ == model_path) return true;

    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
        loaded_path_.clear();
    }

    whisper_context_params cparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx_) return false;

    loaded_path_ = model_path;
    if (verbose_) {
        std::println(stderr, "engine: loaded {} ({})", model_path, whisper_print_system_info());
    }
    return true;
}

std::expected<TranscriptResult, Error>
WhisperCppEngine::transcribe(const TranscribeRequest& request) {
    std::lock_guard<std::mutex> lock(mu_);

    auto samples = wav::read_samples(request.audio_path);
    if (!samples) {
        return std::unexpected(Error{ErrorKind::CorruptArtifact, samples.error()});
    }
    if (samples->empty()) {
        return std::unexpected(Error{ErrorKind::EmptyResult,
            "recording contains no samples: " + request.audio_path});
    }

    if (!load(request.model_path)) {
        return std::unexpected(Error{ErrorKind::Engine,
            "failed to load model " + request.model_name + " from " + request.model_path});
    }

    std::vector<float> pcm(samples->size());
    constexpr float scale = 1.0f / 32768.0f;
    std::ranges::transform(*samples, pcm.begin(),
                           [](int16_t s) { return static_cast<float>(s) * scale; });

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.print_realtime   = false;
    params.print_progress   = false;
    params.print_timestamps = false;
    params.print_special    = false;
    params.translate        = false;
    params.language         = request.language.c_str();
    params.detect_language  = false;
    params.n_threads        = threads_;

    int ret = whisper_full(ctx_, params, pcm.data(), static_cast<int>(pcm.size()));
    if (ret != 0) {
        return std::unexpected(Error{ErrorKind::Engine,
            "whisper_full failed with code " + std::to_string(ret)});
    }

    std::string text;
    int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* seg = whisper_full_get_segment_text(ctx_, i);
        if (!seg) continue;

        auto s = trim_whitespace(seg);
        if (s.empty() || is_non_speech(s)) continue;

        if (!text.empty()) text += ' ';
        text += s;
    }

    if (text.empty()) {
        return std::unexpected(Error{ErrorKind::EmptyResult, "no speech recognized"});
    }

    return TranscriptResult{
        .text = std::move(text),
        .duration_s = static_cast<double>(samples->size()) / wav::SAMPLE_RATE,
    };
}
