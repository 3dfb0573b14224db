#pragma once

#include <chrono>

// Repeating presentation timer. Expirations are delivered by the event loop.
class Ticker {
public:
    virtual ~Ticker() = default;
    virtual bool arm(std::chrono::milliseconds period) = 0;
    virtual void disarm() = 0;
    virtual bool armed() const = 0;
};
