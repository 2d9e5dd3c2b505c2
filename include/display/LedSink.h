#ifndef LEDSINK_H
#define LEDSINK_H

#include <cstddef>
#include <cstdint>
#include "display/Rgb.h"

// Write-only view of the LED hardware.
class LedSink {
public:
    virtual ~LedSink() {}

    virtual size_t getNumLeds() const = 0;

    // Pushes one full frame. False means the frame was not shown.
    virtual bool write(const LedFrame& frame) = 0;

    // Turns every LED off.
    virtual void blank() = 0;
};

// Time source for the render loop.
class FrameClock {
public:
    virtual ~FrameClock() {}

    virtual uint32_t nowMs() = 0;
    virtual void sleepMs(uint32_t ms) = 0;
};

#endif
