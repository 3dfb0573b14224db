#include "platform/linux/unix_socket_server.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long: {}", endpoint);
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    // Stale socket from a previous run
    ::unlink(endpoint.c_str());

    listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind({}) failed: {}", endpoint, std::strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }
    endpoint_ = endpoint;

    // Owner only: the socket can start the microphone.
    if (::chmod(endpoint.c_str(), S_IRUSR | S_IWUSR) < 0) {
        std::println(stderr, "ipc: chmod failed: {}", std::strerror(errno));
    }

    if (::listen(listen_fd_, 8) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        stop();
        return false;
    }

    return true;
}

void UnixSocketServer::stop() {
    for (auto& [fd, pending] : pending_) {
        ::close(fd);
    }
    pending_.clear();

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    if (!endpoint_.empty()) {
        ::unlink(endpoint_.c_str());
        endpoint_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            std::println(stderr, "ipc: accept failed: {}", std::strerror(errno));
        }
        return -1;
    }
    pending_.emplace(fd, std::string{});
    return fd;
}

std::optional<std::vector<nlohmann::json>> UnixSocketServer::read_commands(int client_fd) {
    auto it = pending_.find(client_fd);
    if (it == pending_.end()) return std::nullopt;
    auto& pending = it->second;

    bool hung_up = false;
    char buf[4096];
    for (;;) {
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n > 0) {
            pending.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            hung_up = true;
            break;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) break;
        return std::nullopt;
    }

    std::vector<nlohmann::json> commands;
    size_t pos;
    while ((pos = pending.find('\n')) != std::string::npos) {
        std::string line = pending.substr(0, pos);
        pending.erase(0, pos + 1);
        if (line.empty()) continue;

        try {
            commands.push_back(nlohmann::json::parse(line));
        } catch (const nlohmann::json::exception& e) {
            std::println(stderr, "ipc: malformed command: {}", e.what());
            commands.push_back(nlohmann::json{{"cmd", nullptr}});
        }
    }

    if (pending.size() > MAX_LINE) {
        std::println(stderr, "ipc: client {} exceeded line limit", client_fd);
        return std::nullopt;
    }

    // Lines sent before a half-close are still answered; the hangup is
    // reported by the next read, which finds nothing left.
    if (hung_up && commands.empty()) return std::nullopt;
    return commands;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump() + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t sent = ::send(client_fd, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(sent);
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    pending_.erase(client_fd);
}
