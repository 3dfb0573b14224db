#pragma once

#include "config.hpp"
#include "engine/engine.hpp"
#include "model_manager.hpp"
#include "platform/audio_capture.hpp"
#include "platform/ipc_server.hpp"
#include "platform/model_fetcher.hpp"
#include "platform/permission_gate.hpp"
#include "platform/ticker.hpp"
#include "recorder.hpp"
#include "sample_ring.hpp"
#include "session_orchestrator.hpp"
#include "storage/history_db.hpp"

#include <atomic>
#include <expected>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

// Platform-independent daemon: owns the recorder, model manager, engine and
// session orchestrator, and maps IPC commands onto them. Runs on the event
// loop thread; worker threads only call the notify callback.
class DaemonCore {
public:
    using EngineFactory = std::function<std::unique_ptr<TranscriptionEngine>(const Config&)>;
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose,
               SampleRing& ring, AudioCapture& audio, PermissionGate& permissions,
               Ticker& ticker, ModelFetcher& fetcher, IpcServer& ipc,
               EngineFactory engine_factory, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Creates the engine and history db, then starts loading the configured model.
    bool init();

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Called on the event loop thread after notify() fired.
    void on_worker_event();
    void on_tick();

    // Clients whose reply is sent later: "transcribing" replies go out when the
    // transcription finishes, "loading" replies when the model is ready or failed.
    void add_waiting_client(int fd);
    void add_model_waiting_client(int fd);
    // Receives a state event line on every session or model change.
    void add_watcher(int fd);
    void remove_client(int fd);

    const SessionState& session_state() const;
    const ModelState& model_state() const { return models_.state(); }
    bool model_loading() const { return model_worker_.joinable(); }

    void shutdown();

private:
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_reset(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_watch(const nlohmann::json& cmd);
    nlohmann::json handle_model(const nlohmann::json& cmd);
    nlohmann::json handle_models(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_recordings(const nlohmann::json& cmd);
    nlohmann::json handle_delete(const nlohmann::json& cmd);

    void load_model(const ModelSpec& spec);
    void finish_model_load();

    void on_session_state(const SessionState& state);
    void on_model_state(const ModelState& state);
    void broadcast_state();
    void reply_all(std::vector<int>& clients, const nlohmann::json& response);

    std::string history_db_path() const;
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    PermissionGate& permissions_;
    Ticker& ticker_;
    IpcServer& ipc_;

    EngineFactory engine_factory_;
    NotifyCallback notify_;

    Recorder recorder_;
    ModelManager models_;
    std::unique_ptr<TranscriptionEngine> engine_;
    std::unique_ptr<SessionOrchestrator> orchestrator_;
    HistoryDb history_db_;

    std::vector<int> waiting_clients_;
    std::vector<int> model_waiting_clients_;
    std::vector<int> watchers_;

    ModelSpec loading_spec_;
    std::expected<std::string, Error> model_result_;
    std::atomic<bool> model_done_{false};
    std::jthread model_worker_;
};
