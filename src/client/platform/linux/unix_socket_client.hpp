#pragma once

#include "platform/ipc_client.hpp"

#include <string>

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient() = default;
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send_line(const nlohmann::json& message) override;
    std::optional<nlohmann::json> next_line(std::chrono::milliseconds timeout) override;
    bool connected() const override { return fd_ >= 0; }
    void close() override;

private:
    // Pops one complete line off inbox_, if there is one.
    std::optional<std::string> take_line();

    int fd_ = -1;
    // A watch stream can deliver several lines in one read.
    std::string inbox_;
};
