#pragma once

#include <string>

// Microphone device. Captured 16 kHz mono S16 samples go into the SampleRing
// the implementation was constructed with.
class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
    // Reason for the last failed start(), empty if none.
    virtual std::string last_error() const = 0;
};
