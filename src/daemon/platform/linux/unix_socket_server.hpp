#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <unordered_map>

// Listening AF_UNIX stream socket, non-blocking, mode 0600. Each accepted
// connection keeps the bytes of its unfinished line between reads.
class UnixSocketServer : public IpcServer {
public:
    // A client sending this many bytes without a newline is dropped.
    static constexpr size_t MAX_LINE = 64 * 1024;

    UnixSocketServer() = default;
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return listen_fd_; }
    int accept_client() override;
    // Malformed lines come back as {"cmd": null} so the caller answers them.
    std::optional<std::vector<nlohmann::json>> read_commands(int client_fd) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

    size_t client_count() const { return pending_.size(); }

private:
    int listen_fd_ = -1;
    std::string endpoint_;
    std::unordered_map<int, std::string> pending_;
};
