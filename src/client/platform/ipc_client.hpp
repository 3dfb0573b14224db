#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Client end of the daemon's line-delimited JSON channel.
class IpcClient {
public:
    static constexpr std::chrono::milliseconds NO_TIMEOUT{-1};

    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send_line(const nlohmann::json& message) = 0;
    // nullopt on timeout, hangup or an unparseable line.
    virtual std::optional<nlohmann::json> next_line(std::chrono::milliseconds timeout) = 0;
    virtual bool connected() const = 0;
    virtual void close() = 0;
};
