#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::~UnixSocketClient() {
    close();
}

bool UnixSocketClient::connect(const std::string& endpoint) {
    close();

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long: {}", endpoint);
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return false;
    }
    fd_ = fd;
    return true;
}

bool UnixSocketClient::send_line(const nlohmann::json& message) {
    if (fd_ < 0) return false;

    std::string wire = message.dump();
    wire.push_back('\n');

    const char* p = wire.data();
    size_t left = wire.size();
    while (left > 0) {
        ssize_t n = ::send(fd_, p, left, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "ipc: send failed: {}", std::strerror(errno));
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

std::optional<std::string> UnixSocketClient::take_line() {
    auto nl = inbox_.find('\n');
    if (nl == std::string::npos) return std::nullopt;
    std::string line = inbox_.substr(0, nl);
    inbox_.erase(0, nl + 1);
    return line;
}

std::optional<nlohmann::json> UnixSocketClient::next_line(std::chrono::milliseconds timeout) {
    if (fd_ < 0) return std::nullopt;

    auto line = take_line();
    while (!line) {
        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) return std::nullopt;

        char chunk[4096];
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return std::nullopt;

        inbox_.append(chunk, static_cast<size_t>(n));
        line = take_line();
    }

    auto parsed = nlohmann::json::parse(*line, nullptr, false);
    if (parsed.is_discarded()) {
        std::println(stderr, "ipc: unparseable reply from daemon");
        return std::nullopt;
    }
    return parsed;
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    inbox_.clear();
}
