#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/curl_model_fetcher.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/pipewire_permission_gate.hpp"
#include "platform/linux/timerfd_ticker.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "sample_ring.hpp"

#include <atomic>
#include <string>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void drop_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    SampleRing ring_;
    PipeWireCapture audio_capture_;
    PipeWirePermissionGate permissions_;
    TimerfdTicker ticker_;
    CurlModelFetcher fetcher_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
