#include "session_orchestrator.hpp"

#include <format>
#include <print>

SessionOrchestrator::SessionOrchestrator(Recorder& recorder, PermissionGate& permissions,
                                         ModelManager& models, TranscriptionEngine& engine,
                                         Ticker& ticker, NotifyCallback notify,
                                         std::string language)
    : recorder_(recorder), permissions_(permissions), models_(models), engine_(engine),
      ticker_(ticker), notify_(std::move(notify)), language_(std::move(language)) {}

SessionOrchestrator::~SessionOrchestrator() {
    ticker_.disarm();
    if (worker_.joinable()) worker_.join();
}

std::expected<void, Error> SessionOrchestrator::start_recording() {
    if (std::holds_alternative<SessionRecording>(state_)) return {};
    if (!std::holds_alternative<SessionIdle>(state_)) {
        return std::unexpected(Error{ErrorKind::InvalidState,
            "session not idle, reset before recording again"});
    }

    if (!models_.is_ready()) {
        return fail({ErrorKind::InvalidState, "model not ready"});
    }

    // Asked fresh on every attempt; a single refusal ends it.
    auto status = permissions_.check();
    if (status != PermissionStatus::Granted) {
        status = permissions_.request();
    }
    if (status == PermissionStatus::PermanentlyDenied) {
        return fail({ErrorKind::Permission,
            "microphone permission permanently denied, enable it in system settings"});
    }
    if (status != PermissionStatus::Granted) {
        return fail({ErrorKind::Permission, "microphone permission denied"});
    }

    auto started = recorder_.start();
    if (!started) {
        return fail(std::move(started.error()));
    }

    record_start_ = std::chrono::steady_clock::now();
    transition(SessionRecording{});
    if (!ticker_.arm(TICK_INTERVAL)) {
        std::println(stderr, "session: could not arm recording timer");
    }
    return {};
}

std::expected<void, Error> SessionOrchestrator::stop_and_transcribe() {
    if (!std::holds_alternative<SessionRecording>(state_)) {
        return std::unexpected(Error{ErrorKind::InvalidState, "not recording"});
    }

    ticker_.disarm();

    auto artifact = recorder_.stop();
    if (!artifact) {
        return fail(std::move(artifact.error()));
    }

    if (!models_.is_ready()) {
        return fail({ErrorKind::InvalidState, "model not ready"});
    }

    TranscribeRequest request{
        .model_name = models_.current_spec().name,
        .model_path = models_.model_path(),
        .audio_path = artifact->file_path,
        .language = language_,
    };

    transition(SessionProcessing{std::move(*artifact)});

    result_ready_.store(false, std::memory_order_release);
    worker_ = std::jthread([this, request = std::move(request)](std::stop_token) {
        auto start = std::chrono::steady_clock::now();
        auto result = engine_.transcribe(request);
        auto processing = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        worker_result_ = WorkerResult{
            .result = std::move(result),
            .processing = processing,
        };
        result_ready_.store(true, std::memory_order_release);

        if (notify_) notify_();
    });

    return {};
}

std::expected<void, Error> SessionOrchestrator::cancel_recording() {
    if (!std::holds_alternative<SessionRecording>(state_)) {
        return std::unexpected(Error{ErrorKind::InvalidState, "not recording"});
    }

    ticker_.disarm();
    recorder_.cancel();
    transition(SessionIdle{});
    return {};
}

std::expected<void, Error> SessionOrchestrator::reset() {
    if (std::holds_alternative<SessionRecording>(state_)) {
        return std::unexpected(Error{ErrorKind::InvalidState, "recording, cancel it instead"});
    }
    if (std::holds_alternative<SessionProcessing>(state_)) {
        return std::unexpected(Error{ErrorKind::InvalidState,
            "transcription in progress and cannot be cancelled"});
    }

    ticker_.disarm();
    transition(SessionIdle{});
    return {};
}

void SessionOrchestrator::on_tick() {
    // A tick already queued when the timer was disarmed lands here after the transition.
    if (!std::holds_alternative<SessionRecording>(state_)) return;

    recorder_.pump();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - record_start_);
    transition(SessionRecording{elapsed});
}

void SessionOrchestrator::on_transcription_complete() {
    if (worker_.joinable()) {
        worker_.join();
    }
    if (!result_ready_.exchange(false, std::memory_order_acq_rel)) return;

    auto* processing = std::get_if<SessionProcessing>(&state_);
    if (!processing) return;

    auto& wr = worker_result_;
    if (!wr.result) {
        fail(std::move(wr.result.error()));
        return;
    }

    auto text = trim_whitespace(wr.result->text);
    if (text.empty()) {
        fail({ErrorKind::EmptyResult, "transcription returned no text"});
        return;
    }

    transition(SessionCompleted{
        .text = std::move(text),
        .audio_path = processing->artifact.file_path,
        .processing = wr.processing,
        .audio_duration_s = wr.result->duration_s,
    });
}

void SessionOrchestrator::shutdown() {
    if (std::holds_alternative<SessionRecording>(state_)) {
        if (auto r = cancel_recording(); !r) {
            std::println(stderr, "session: cancel on shutdown failed: {}", r.error().message);
        }
    } else if (std::holds_alternative<SessionProcessing>(state_)) {
        on_transcription_complete();
    }
    ticker_.disarm();
}

void SessionOrchestrator::transition(SessionState next) {
    state_ = std::move(next);
    if (listener_) listener_(state_);
}

std::unexpected<Error> SessionOrchestrator::fail(Error error) {
    ticker_.disarm();
    transition(SessionFailed{.kind = error.kind, .reason = error.message});
    return std::unexpected(std::move(error));
}
