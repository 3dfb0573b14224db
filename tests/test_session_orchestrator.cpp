#include <catch2/catch_test_macros.hpp>

#include "session_orchestrator.hpp"
#include "test_doubles.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::string state_name(const SessionState& s) {
    if (std::holds_alternative<SessionIdle>(s)) return "idle";
    if (std::holds_alternative<SessionRecording>(s)) return "recording";
    if (std::holds_alternative<SessionProcessing>(s)) return "processing";
    if (std::holds_alternative<SessionCompleted>(s)) return "completed";
    return "failed";
}

// Everything an orchestrator needs, with the model already in the cache.
struct Harness {
    test::TmpDir tmp;
    SampleRing ring{16000 * 4};
    test::MockAudioCapture capture{ring};
    test::FakePermissionGate gate;
    test::FakeFetcher fetcher;
    test::FakeEngine engine;
    test::FakeTicker ticker;
    Recorder recorder{ring, capture, gate, tmp / "recordings"};
    ModelManager models{ModelLocations{.cache_dir = tmp / "models", .bundle_dir = "", .download_url = ""},
                        fetcher};
    std::atomic<int> notified{0};
    SessionOrchestrator orch{recorder, gate, models, engine, ticker, [this] { ++notified; }, "en"};
    std::vector<std::string> transitions;

    explicit Harness(bool model_ready = true) {
        if (model_ready) {
            auto tiny = models::default_spec();
            test::write_file(models.cached_path(tiny), 200 * 1024);
            models.initialize(tiny);
        }
        orch.set_listener([this](const SessionState& s) {
            // Ticks are noise for transition checks
            if (!transitions.empty() && transitions.back() == "recording" &&
                std::holds_alternative<SessionRecording>(s)) return;
            transitions.push_back(state_name(s));
        });
    }

    std::string recordings_dir() const { return tmp / "recordings"; }

    // Stop, wait for the worker, apply its result.
    void finish() {
        REQUIRE(orch.stop_and_transcribe().has_value());
        orch.on_transcription_complete();
    }
};

} // namespace

TEST_CASE("SessionOrchestrator happy path", "[session]") {
    Harness h;

    REQUIRE(std::holds_alternative<SessionIdle>(h.orch.state()));
    REQUIRE(h.orch.start_recording().has_value());
    REQUIRE(std::holds_alternative<SessionRecording>(h.orch.state()));
    REQUIRE(h.ticker.armed());
    REQUIRE(h.ticker.period == SessionOrchestrator::TICK_INTERVAL);
    REQUIRE(h.orch.is_busy());

    h.capture.feed_silence(16000);
    h.orch.on_tick();
    REQUIRE(h.ring.available() == 0);

    REQUIRE(h.orch.stop_and_transcribe().has_value());
    REQUIRE_FALSE(h.ticker.armed());
    REQUIRE(std::holds_alternative<SessionProcessing>(h.orch.state()));
    auto audio_path = std::get<SessionProcessing>(h.orch.state()).artifact.file_path;

    h.orch.on_transcription_complete();
    REQUIRE(h.notified.load() == 1);

    auto* done = std::get_if<SessionCompleted>(&h.orch.state());
    REQUIRE(done != nullptr);
    REQUIRE(done->text == "hello world");
    REQUIRE(done->audio_path == audio_path);
    REQUIRE(fs::exists(audio_path));
    REQUIRE_FALSE(h.orch.is_busy());

    REQUIRE(h.engine.calls == 1);
    REQUIRE(h.engine.last_request.audio_path == audio_path);
    REQUIRE(h.engine.last_request.model_name == "tiny");
    REQUIRE(h.engine.last_request.model_path == h.models.model_path());
    REQUIRE(h.engine.last_request.language == "en");

    REQUIRE(h.transitions ==
            std::vector<std::string>{"recording", "processing", "completed"});
}

TEST_CASE("SessionOrchestrator failures", "[session]") {

    SECTION("StartBeforeModelReadyFails") {
        Harness h(false);
        auto r = h.orch.start_recording();
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::InvalidState);
        REQUIRE(std::holds_alternative<SessionFailed>(h.orch.state()));
        REQUIRE(h.capture.start_calls == 0);
    }

    SECTION("PermissionRequestedOnceThenFails") {
        Harness h;
        h.gate.status = PermissionStatus::Denied;
        h.gate.request_result = PermissionStatus::Denied;

        auto r = h.orch.start_recording();
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Permission);
        REQUIRE(h.gate.request_calls == 1);
        REQUIRE(h.gate.settings_calls == 0);
        REQUIRE(std::get<SessionFailed>(h.orch.state()).kind == ErrorKind::Permission);
        REQUIRE(test::count_files(h.recordings_dir()) == 0);
        REQUIRE_FALSE(h.ticker.armed());
    }

    SECTION("PermanentDenialOpensSettings") {
        Harness h;
        h.gate.status = PermissionStatus::PermanentlyDenied;
        h.gate.request_result = PermissionStatus::PermanentlyDenied;

        REQUIRE_FALSE(h.orch.start_recording().has_value());
        REQUIRE(h.gate.settings_calls == 1);
        REQUIRE(std::get<SessionFailed>(h.orch.state()).kind == ErrorKind::Permission);
    }

    SECTION("GrantedOnRequestRecords") {
        Harness h;
        h.gate.status = PermissionStatus::Denied;
        h.gate.request_result = PermissionStatus::Granted;

        REQUIRE(h.orch.start_recording().has_value());
        REQUIRE(h.gate.request_calls == 1);
        REQUIRE(std::holds_alternative<SessionRecording>(h.orch.state()));
        REQUIRE(h.orch.cancel_recording().has_value());
    }

    SECTION("DeviceFailure") {
        Harness h;
        h.capture.fail_start = true;

        auto r = h.orch.start_recording();
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Device);
        REQUIRE(std::holds_alternative<SessionFailed>(h.orch.state()));
        REQUIRE(test::count_files(h.recordings_dir()) == 0);
    }

    SECTION("StreamDiesAfterStart") {
        Harness h;
        REQUIRE(h.orch.start_recording().has_value());
        h.capture.stream_error = "no source available";

        auto r = h.orch.stop_and_transcribe();
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Device);

        auto* failed = std::get_if<SessionFailed>(&h.orch.state());
        REQUIRE(failed != nullptr);
        REQUIRE(failed->kind == ErrorKind::Device);
        REQUIRE(failed->reason == "no source available");
        REQUIRE(h.engine.calls == 0);
        REQUIRE_FALSE(h.ticker.armed());
        REQUIRE(test::count_files(h.recordings_dir()) == 0);
    }

    SECTION("EmptyEngineOutputFails") {
        Harness h;
        h.engine.text = "  \n\t ";
        REQUIRE(h.orch.start_recording().has_value());
        h.capture.feed_silence(16000);
        h.finish();

        auto* failed = std::get_if<SessionFailed>(&h.orch.state());
        REQUIRE(failed != nullptr);
        REQUIRE(failed->kind == ErrorKind::EmptyResult);
    }

    SECTION("EngineErrorFails") {
        Harness h;
        h.engine.error = Error{ErrorKind::Engine, "server returned HTTP 500"};
        REQUIRE(h.orch.start_recording().has_value());
        h.capture.feed_silence(16000);
        h.finish();

        auto* failed = std::get_if<SessionFailed>(&h.orch.state());
        REQUIRE(failed != nullptr);
        REQUIRE(failed->kind == ErrorKind::Engine);
        REQUIRE(failed->reason == "server returned HTTP 500");
    }

    SECTION("UndersizedArtifactStillTranscribed") {
        Harness h;
        REQUIRE(h.orch.start_recording().has_value());
        h.capture.feed_silence(10);
        h.finish();

        REQUIRE(h.engine.calls == 1);
        REQUIRE(std::holds_alternative<SessionCompleted>(h.orch.state()));
    }

    SECTION("TextIsTrimmed") {
        Harness h;
        h.engine.text = "  padded text \n";
        REQUIRE(h.orch.start_recording().has_value());
        h.finish();
        REQUIRE(std::get<SessionCompleted>(h.orch.state()).text == "padded text");
    }
}

TEST_CASE("SessionOrchestrator transitions", "[session]") {
    Harness h;

    SECTION("CancelDeletesRecordingAndReturnsToIdle") {
        REQUIRE(h.orch.start_recording().has_value());
        auto path = h.recorder.current_path();
        h.capture.feed_silence(8000);

        REQUIRE(h.orch.cancel_recording().has_value());
        REQUIRE(std::holds_alternative<SessionIdle>(h.orch.state()));
        REQUIRE_FALSE(fs::exists(path));
        REQUIRE_FALSE(h.ticker.armed());
        REQUIRE(h.engine.calls == 0);
    }

    SECTION("StartWhileRecordingIsNoOp") {
        REQUIRE(h.orch.start_recording().has_value());
        REQUIRE(h.orch.start_recording().has_value());
        REQUIRE(h.capture.start_calls == 1);
        REQUIRE(h.ticker.arm_calls == 1);
        REQUIRE(h.orch.cancel_recording().has_value());
    }

    SECTION("StopOrCancelWhenIdleRejected") {
        REQUIRE(h.orch.stop_and_transcribe().error().kind == ErrorKind::InvalidState);
        REQUIRE(h.orch.cancel_recording().error().kind == ErrorKind::InvalidState);
        REQUIRE(std::holds_alternative<SessionIdle>(h.orch.state()));
    }

    SECTION("NoReentryAfterCompletedWithoutReset") {
        REQUIRE(h.orch.start_recording().has_value());
        h.finish();
        REQUIRE(std::holds_alternative<SessionCompleted>(h.orch.state()));

        auto r = h.orch.start_recording();
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::InvalidState);
        REQUIRE(std::holds_alternative<SessionCompleted>(h.orch.state()));

        REQUIRE(h.orch.reset().has_value());
        REQUIRE(std::holds_alternative<SessionIdle>(h.orch.state()));
        REQUIRE(h.orch.start_recording().has_value());
        REQUIRE(h.orch.cancel_recording().has_value());
    }

    SECTION("ResetRejectedWhileRecording") {
        REQUIRE(h.orch.start_recording().has_value());
        REQUIRE(h.orch.reset().error().kind == ErrorKind::InvalidState);
        REQUIRE(std::holds_alternative<SessionRecording>(h.orch.state()));
        REQUIRE(h.orch.cancel_recording().has_value());
    }

    SECTION("ResetRejectedWhileProcessing") {
        REQUIRE(h.orch.start_recording().has_value());
        REQUIRE(h.orch.stop_and_transcribe().has_value());

        REQUIRE(h.orch.reset().error().kind == ErrorKind::InvalidState);
        REQUIRE(h.orch.cancel_recording().error().kind == ErrorKind::InvalidState);
        REQUIRE(std::holds_alternative<SessionProcessing>(h.orch.state()));

        h.orch.on_transcription_complete();
        REQUIRE(std::holds_alternative<SessionCompleted>(h.orch.state()));
    }

    SECTION("ResetFromFailed") {
        h.capture.fail_start = true;
        REQUIRE_FALSE(h.orch.start_recording().has_value());
        REQUIRE(h.orch.reset().has_value());
        REQUIRE(std::holds_alternative<SessionIdle>(h.orch.state()));
    }

    SECTION("TickReportsElapsedOnlyWhileRecording") {
        h.orch.on_tick();
        REQUIRE(std::holds_alternative<SessionIdle>(h.orch.state()));

        REQUIRE(h.orch.start_recording().has_value());
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        h.orch.on_tick();
        auto* rec = std::get_if<SessionRecording>(&h.orch.state());
        REQUIRE(rec != nullptr);
        REQUIRE(rec->elapsed >= std::chrono::milliseconds(20));
        REQUIRE(h.orch.cancel_recording().has_value());
    }

    SECTION("ShutdownCancelsRecording") {
        REQUIRE(h.orch.start_recording().has_value());
        auto path = h.recorder.current_path();
        h.orch.shutdown();
        REQUIRE(std::holds_alternative<SessionIdle>(h.orch.state()));
        REQUIRE_FALSE(fs::exists(path));
    }

    SECTION("ShutdownWaitsForTranscription") {
        REQUIRE(h.orch.start_recording().has_value());
        REQUIRE(h.orch.stop_and_transcribe().has_value());
        h.orch.shutdown();
        REQUIRE(std::holds_alternative<SessionCompleted>(h.orch.state()));
    }
}
