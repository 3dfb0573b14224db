#pragma once

#include "platform/ticker.hpp"

#include <cstdint>

// timerfd-backed Ticker. The event loop polls fd() and calls consume() on
// readiness before dispatching the tick.
class TimerfdTicker : public Ticker {
public:
    TimerfdTicker();
    ~TimerfdTicker() override;

    TimerfdTicker(const TimerfdTicker&) = delete;
    TimerfdTicker& operator=(const TimerfdTicker&) = delete;

    bool arm(std::chrono::milliseconds period) override;
    void disarm() override;
    bool armed() const override { return armed_; }

    int fd() const { return fd_; }
    // Number of expirations since the last call; 0 if none are pending.
    uint64_t consume();

private:
    int fd_ = -1;
    bool armed_ = false;
};
