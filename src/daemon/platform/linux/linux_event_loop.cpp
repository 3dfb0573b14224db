#include "platform/linux/linux_event_loop.hpp"

#include "engine/lan_engine.hpp"
#include "engine/whisper_cpp_engine.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      ring_(config_.audio.ring_buffer_samples()),
      audio_capture_(ring_, wav::SAMPLE_RATE),
      permissions_(platform::runtime_dir(), config_.permissions.settings_command),
      core_(config_, verbose_, ring_, audio_capture_, permissions_,
            ticker_, fetcher_, ipc_server_,
            // EngineFactory
            [verbose](const Config& cfg) -> std::unique_ptr<TranscriptionEngine> {
                if (cfg.engine.type == "local") {
                    return std::make_unique<WhisperCppEngine>(cfg.engine.threads, verbose);
                }
                if (cfg.engine.type == "lan") {
                    return std::make_unique<LanEngine>(cfg.engine.url, cfg.engine.api_format);
                }
                return nullptr;
            },
            // NotifyCallback, called from worker threads
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    // Must exist before core_.init() starts the model worker.
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    if (ticker_.fd() < 0) return false;

    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            std::println(stderr, "epoll_ctl({}) failed: {}", fd, std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_) || !add_fd(ipc_server_.server_fd()) ||
        !add_fd(worker_event_fd_) || !add_fd(ticker_.fd())) {
        return false;
    }

    // Engine, history db, initial model load
    if (!core_.init()) return false;

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
                    log(std::string("Received ") + strsignal(static_cast<int>(info.ssi_signo)) +
                        ", shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd;
                while ((client_fd = ipc_server_.accept_client()) >= 0) {
                    epoll_event ev{.events = EPOLLIN | EPOLLRDHUP, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) == sizeof(val)) {
                    core_.on_worker_event();
                }
                continue;
            }

            if (fd == ticker_.fd()) {
                if (ticker_.consume() > 0) {
                    core_.on_tick();
                }
                continue;
            }

            handle_client(fd);
        }
    }

    core_.shutdown();
}

void LinuxEventLoop::handle_client(int fd) {
    auto commands = ipc_server_.read_commands(fd);
    if (!commands) {
        drop_client(fd);
        return;
    }

    for (const auto& cmd : *commands) {
        std::string cmd_str;
        if (cmd.is_object() && cmd.contains("cmd") && cmd["cmd"].is_string()) {
            cmd_str = cmd["cmd"].get<std::string>();
        }
        auto response = core_.handle_command(cmd_str, cmd);
        auto status = response.value("status", "");

        if (status == "transcribing") {
            core_.add_waiting_client(fd);
        } else if (status == "loading") {
            core_.add_model_waiting_client(fd);
        } else if (status == "watching") {
            ipc_server_.send_response(fd, response);
            core_.add_watcher(fd);
        } else {
            ipc_server_.send_response(fd, response);
        }
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    core_.remove_client(fd);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[pocket-scribe] {}", msg);
    }
}
