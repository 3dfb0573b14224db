#pragma once

#include "engine/engine.hpp"
#include "errors.hpp"
#include "model_manager.hpp"
#include "platform/permission_gate.hpp"
#include "platform/ticker.hpp"
#include "recorder.hpp"

#include <atomic>
#include <chrono>
#include <expected>
#include <functional>
#include <string>
#include <thread>
#include <variant>

struct SessionIdle {};
struct SessionRecording { std::chrono::milliseconds elapsed{0}; };
struct SessionProcessing { AudioArtifact artifact; };
struct SessionCompleted {
    std::string text;
    std::string audio_path;
    std::chrono::milliseconds processing{0};
    double audio_duration_s = 0.0;
};
struct SessionFailed {
    ErrorKind kind;
    std::string reason;
};

using SessionState = std::variant<SessionIdle, SessionRecording, SessionProcessing,
                                  SessionCompleted, SessionFailed>;

// Drives one recording-through-transcription attempt at a time:
//   Idle -> Recording -> Processing -> Completed | Failed
// plus Recording -> Idle (cancel) and Idle/Completed/Failed -> Idle (reset).
// All methods run on the event loop thread. The engine call runs on a worker
// thread; notify() is invoked from it when the result is ready, and the loop
// then calls on_transcription_complete(). A running transcription cannot be
// cancelled.
class SessionOrchestrator {
public:
    using StateListener = std::function<void(const SessionState&)>;
    using NotifyCallback = std::function<void()>;

    static constexpr std::chrono::milliseconds TICK_INTERVAL{100};

    SessionOrchestrator(Recorder& recorder, PermissionGate& permissions, ModelManager& models,
                        TranscriptionEngine& engine, Ticker& ticker, NotifyCallback notify,
                        std::string language = "auto");
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    void set_listener(StateListener listener) { listener_ = std::move(listener); }

    std::expected<void, Error> start_recording();
    std::expected<void, Error> stop_and_transcribe();
    std::expected<void, Error> cancel_recording();
    std::expected<void, Error> reset();

    // Ticker expiry: refresh elapsed time and flush captured audio to disk.
    void on_tick();
    // Joins the worker and applies its result.
    void on_transcription_complete();
    bool result_ready() const { return result_ready_.load(std::memory_order_acquire); }

    // Cancels a recording, or waits out a running transcription.
    void shutdown();

    const SessionState& state() const { return state_; }
    bool is_busy() const {
        return std::holds_alternative<SessionRecording>(state_) ||
               std::holds_alternative<SessionProcessing>(state_);
    }
    const std::string& language() const { return language_; }

private:
    void transition(SessionState next);
    std::unexpected<Error> fail(Error error);

    Recorder& recorder_;
    PermissionGate& permissions_;
    ModelManager& models_;
    TranscriptionEngine& engine_;
    Ticker& ticker_;
    NotifyCallback notify_;
    std::string language_;
    StateListener listener_;

    SessionState state_ = SessionIdle{};
    std::chrono::steady_clock::time_point record_start_;

    struct WorkerResult {
        std::expected<TranscriptResult, Error> result;
        std::chrono::milliseconds processing{0};
    };
    WorkerResult worker_result_;
    std::atomic<bool> result_ready_{false};
    std::jthread worker_;
};
