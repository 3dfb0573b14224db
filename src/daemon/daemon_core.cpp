#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"
#include "state_json.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

DaemonCore::DaemonCore(Config config, bool verbose,
                       SampleRing& ring, AudioCapture& audio, PermissionGate& permissions,
                       Ticker& ticker, ModelFetcher& fetcher, IpcServer& ipc,
                       EngineFactory engine_factory, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      permissions_(permissions), ticker_(ticker), ipc_(ipc),
      engine_factory_(std::move(engine_factory)),
      notify_(std::move(notify)),
      recorder_(ring, audio, permissions, config_.recordings_dir()),
      models_(ModelLocations{
                  .cache_dir = config_.model_cache_dir(),
                  .bundle_dir = config_.model.bundle_dir,
                  .download_url = config_.model.download_url,
              },
              fetcher) {
    models_.set_listener([this](const ModelState& state) { on_model_state(state); });
}

DaemonCore::~DaemonCore() {
    if (model_worker_.joinable()) model_worker_.join();
}

bool DaemonCore::init() {
    engine_ = engine_factory_(config_);
    if (!engine_) {
        std::println(stderr, "Unknown engine type: {}", config_.engine.type);
        return false;
    }

    orchestrator_ = std::make_unique<SessionOrchestrator>(
        recorder_, permissions_, models_, *engine_, ticker_, notify_, config_.engine.language);
    orchestrator_->set_listener([this](const SessionState& state) { on_session_state(state); });

    if (!history_db_.open(history_db_path())) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    auto spec = models::find(config_.model.name);
    if (!spec) {
        std::println(stderr, "model: unknown model '{}', using {}",
                     config_.model.name, models::default_spec().name);
        spec = models::default_spec();
    }

    log(std::format("Engine {}, recordings in {}", engine_->name(), recorder_.recordings_dir()));
    load_model(*spec);
    return true;
}

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd) {
    if (!orchestrator_) {
        return {{"status", "error"}, {"message", "daemon not initialized"}};
    }

    try {
        if (cmd_str == "start") return handle_start(cmd);
        if (cmd_str == "stop") return handle_stop(cmd);
        if (cmd_str == "cancel") return handle_cancel(cmd);
        if (cmd_str == "reset") return handle_reset(cmd);
        if (cmd_str == "toggle") return handle_toggle(cmd);
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "watch") return handle_watch(cmd);
        if (cmd_str == "model") return handle_model(cmd);
        if (cmd_str == "models") return handle_models(cmd);
        if (cmd_str == "history") return handle_history(cmd);
        if (cmd_str == "recordings") return handle_recordings(cmd);
        if (cmd_str == "delete") return handle_delete(cmd);
    } catch (const json::exception& e) {
        return {{"status", "error"}, {"message", std::string("bad request: ") + e.what()}};
    }
    return {{"status", "error"}, {"message", "unknown command"}};
}

json DaemonCore::handle_start(const json& /*cmd*/) {
    const auto& state = orchestrator_->state();
    // A finished attempt is acknowledged by starting the next one.
    if (std::holds_alternative<SessionCompleted>(state) ||
        std::holds_alternative<SessionFailed>(state)) {
        if (auto r = orchestrator_->reset(); !r) return to_json(r.error());
    }

    if (auto r = orchestrator_->start_recording(); !r) {
        log("Start failed: " + r.error().message);
        return to_json(r.error());
    }

    log("Recording to " + recorder_.current_path());
    return {{"status", "ok"}, {"state", "recording"}, {"audio_path", recorder_.current_path()}};
}

json DaemonCore::handle_stop(const json& /*cmd*/) {
    if (auto r = orchestrator_->stop_and_transcribe(); !r) {
        log("Stop failed: " + r.error().message);
        return to_json(r.error());
    }

    const auto* processing = std::get_if<SessionProcessing>(&orchestrator_->state());
    if (!processing) {
        return {{"status", "error"}, {"message", "transcription did not start"}};
    }

    const auto& artifact = processing->artifact;
    uint64_t data_bytes = artifact.size_bytes > wav::HEADER_SIZE
        ? artifact.size_bytes - wav::HEADER_SIZE : 0;
    double duration = static_cast<double>(data_bytes) /
        (artifact.sample_rate_hz * artifact.channels * (wav::BITS_PER_SAMPLE / 8));
    log(std::format("Recording stopped, {:.1f}s audio, transcribing...", duration));

    return {{"status", "transcribing"}, {"duration", duration}, {"audio_path", artifact.file_path}};
}

json DaemonCore::handle_cancel(const json& /*cmd*/) {
    if (auto r = orchestrator_->cancel_recording(); !r) return to_json(r.error());
    log("Recording cancelled");
    return {{"status", "ok"}, {"state", "idle"}};
}

json DaemonCore::handle_reset(const json& /*cmd*/) {
    if (auto r = orchestrator_->reset(); !r) return to_json(r.error());
    return {{"status", "ok"}, {"state", "idle"}};
}

json DaemonCore::handle_toggle(const json& cmd) {
    if (std::holds_alternative<SessionRecording>(orchestrator_->state())) {
        return handle_stop(cmd);
    }
    return handle_start(cmd);
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    json resp = {{"status", "ok"}};
    resp.update(to_json(orchestrator_->state()));
    resp["model"] = to_json(models_.state());
    resp["language"] = orchestrator_->language();
    resp["engine"] = std::string(engine_->name());
    return resp;
}

json DaemonCore::handle_watch(const json& /*cmd*/) {
    return {
        {"status", "watching"},
        {"session", to_json(orchestrator_->state())},
        {"model", to_json(models_.state())},
    };
}

json DaemonCore::handle_model(const json& cmd) {
    std::string name = cmd.value("name", "");
    if (name.empty()) {
        return {
            {"status", "ok"},
            {"name", models_.current_spec().name},
            {"model", to_json(models_.state())},
        };
    }

    auto spec = models::find(name);
    if (!spec) {
        return {{"status", "error"}, {"message", "unknown model: " + name}};
    }
    if (orchestrator_->is_busy()) {
        return to_json(Error{ErrorKind::InvalidState, "cannot change model while a session is active"});
    }
    if (models_.is_initializing() || model_worker_.joinable()) {
        return to_json(Error{ErrorKind::InvalidState, "a model is already loading"});
    }
    if (models_.is_ready() && models_.current_spec().name == spec->name) {
        return {{"status", "ok"}, {"name", spec->name}, {"model", to_json(models_.state())}};
    }

    load_model(*spec);
    return {{"status", "loading"}, {"name", spec->name}};
}

json DaemonCore::handle_models(const json& /*cmd*/) {
    json list = json::array();
    for (const auto& spec : models::catalog()) {
        list.push_back({
            {"name", spec.name},
            {"size", spec.size_hint},
            {"cached", models_.is_cached(spec)},
            {"current", spec.name == models_.current_spec().name},
        });
    }
    return {{"status", "ok"}, {"models", std::move(list)}};
}

json DaemonCore::handle_history(const json& cmd) {
    int limit = cmd.value("limit", 10);
    auto entries = history_db_.recent(limit);

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"text", e.text},
            {"audio_path", e.audio_path},
            {"audio_duration", e.audio_duration},
            {"processing_time", e.processing_time},
            {"model", e.model},
            {"language", e.language},
            {"engine", e.engine},
        });
    }
    return resp;
}

json DaemonCore::handle_recordings(const json& /*cmd*/) {
    json list = json::array();
    for (const auto& path : recorder_.list_recordings()) {
        std::error_code ec;
        auto size = fs::file_size(path, ec);
        list.push_back({{"path", path}, {"size_bytes", ec ? 0 : size}});
    }
    return {{"status", "ok"}, {"dir", recorder_.recordings_dir()}, {"recordings", std::move(list)}};
}

json DaemonCore::handle_delete(const json& cmd) {
    std::string path = cmd.value("path", "");
    if (path.empty()) {
        return {{"status", "error"}, {"message", "missing path"}};
    }
    if (auto r = recorder_.delete_recording(path); !r) {
        return to_json(Error{ErrorKind::Storage, r.error()});
    }
    log("Deleted " + path);
    return {{"status", "ok"}, {"path", path}};
}

void DaemonCore::load_model(const ModelSpec& spec) {
    if (model_worker_.joinable()) model_worker_.join();

    loading_spec_ = spec;
    models_.begin(spec);
    model_done_.store(false, std::memory_order_release);

    model_worker_ = std::jthread([this, spec](std::stop_token) {
        model_result_ = models_.materialize(spec);
        model_done_.store(true, std::memory_order_release);
        notify_();
    });
}

void DaemonCore::finish_model_load() {
    if (model_worker_.joinable()) model_worker_.join();

    const auto& state = models_.complete(loading_spec_, model_result_);

    json response;
    if (const auto* failed = std::get_if<ModelFailed>(&state)) {
        response = to_json(Error{ErrorKind::ModelInit, failed->reason});
    } else {
        response = {{"status", "ok"}, {"name", loading_spec_.name}, {"model", to_json(state)}};
    }
    reply_all(model_waiting_clients_, response);
}

void DaemonCore::on_worker_event() {
    if (orchestrator_ && orchestrator_->result_ready()) {
        orchestrator_->on_transcription_complete();
    }
    if (model_done_.exchange(false, std::memory_order_acq_rel)) {
        finish_model_load();
    }
}

void DaemonCore::on_tick() {
    if (orchestrator_) orchestrator_->on_tick();
}

void DaemonCore::on_session_state(const SessionState& state) {
    std::visit(overloaded{
        [](const SessionIdle&) {},
        [](const SessionRecording&) {},
        [](const SessionProcessing&) {},
        [this, &state](const SessionCompleted& s) {
            log(std::format("Transcription complete: {:.1f}s processing, {} chars",
                            s.processing.count() / 1000.0, s.text.size()));

            TranscriptContext ctx{
                .audio_path = s.audio_path,
                .model = models_.current_spec().name,
                .language = orchestrator_->language(),
                .engine = std::string(engine_->name()),
            };
            history_db_.insert(s.text, s.audio_duration_s, s.processing.count() / 1000.0, ctx);

            json response = {{"status", "ok"}};
            response.update(to_json(state));
            reply_all(waiting_clients_, response);
        },
        [this](const SessionFailed& s) {
            log("Session failed: " + s.reason);
            reply_all(waiting_clients_, to_json(Error{s.kind, s.reason}));
        },
    }, state);

    broadcast_state();
}

void DaemonCore::on_model_state(const ModelState& state) {
    std::visit(overloaded{
        [](const ModelUninitialized&) {},
        [this](const ModelInitializing& s) { log("Loading model " + s.model_name); },
        [this](const ModelReady& s) { log("Model ready: " + s.model_name); },
        [](const ModelFailed& s) { std::println(stderr, "model: {}", s.reason); },
    }, state);

    broadcast_state();
}

void DaemonCore::broadcast_state() {
    if (watchers_.empty()) return;

    json event = {
        {"event", "state"},
        {"session", to_json(session_state())},
        {"model", to_json(models_.state())},
    };

    // Watchers that cannot be written to are dropped; the loop closes them on hangup.
    std::erase_if(watchers_, [this, &event](int fd) { return !ipc_.send_response(fd, event); });
}

void DaemonCore::reply_all(std::vector<int>& clients, const json& response) {
    for (int fd : clients) {
        ipc_.send_response(fd, response);
    }
    clients.clear();
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::add_model_waiting_client(int fd) {
    model_waiting_clients_.push_back(fd);
}

void DaemonCore::add_watcher(int fd) {
    watchers_.push_back(fd);
}

void DaemonCore::remove_client(int fd) {
    std::erase(waiting_clients_, fd);
    std::erase(model_waiting_clients_, fd);
    std::erase(watchers_, fd);
}

const SessionState& DaemonCore::session_state() const {
    static const SessionState idle = SessionIdle{};
    return orchestrator_ ? orchestrator_->state() : idle;
}

void DaemonCore::shutdown() {
    if (orchestrator_) {
        if (std::holds_alternative<SessionProcessing>(orchestrator_->state())) {
            log("Waiting for pending transcription to complete...");
        }
        orchestrator_->shutdown();
    }

    if (model_worker_.joinable()) {
        log("Waiting for model load to finish...");
        model_worker_.join();
        model_done_.store(false, std::memory_order_release);
        finish_model_load();
    }
}

std::string DaemonCore::history_db_path() const {
    auto data = platform::data_dir();
    if (data.empty()) return "/tmp/pocket-scribe/history.db";
    return data + "/history.db";
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[pocket-scribe] {}", msg);
    }
}
