#ifndef DISPLAYLOOP_H
#define DISPLAYLOOP_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>
#include "display/ColorTable.h"
#include "display/LedSink.h"
#include "genome/BasePairCall.h"

// Fixed-rate render of the loaded calls. Every tick recomposes the frame,
// writes it and sleeps out the rest of the interval, so frames never start
// closer together than frameIntervalMs. A failed write drops that frame
// only; the loop keeps going.
class DisplayLoop {
public:
    DisplayLoop(LedSink& sink, FrameClock& clock, const std::vector<BasePairCall>& calls,
                const ColorTable& colors, uint32_t frameIntervalMs);

    // False when there are fewer calls than LEDs or the interval is zero.
    bool isReady() const;

    void tick();

    // Ticks until stop is set, then blanks the strip.
    // Returns false without touching the strip if the loop is not ready.
    bool run(const std::atomic<bool>& stop);

    void setDroppedFrameCallback(std::function<void(uint32_t)> callback) { droppedFrameCallback = callback; }

    uint32_t getFramesWritten() const { return framesWritten; }
    uint32_t getFramesDropped() const { return framesDropped; }
    uint32_t getFrameIntervalMs() const { return frameIntervalMs; }

private:
    LedSink& sink;
    FrameClock& clock;
    const std::vector<BasePairCall> calls;
    const ColorTable colors;
    const uint32_t frameIntervalMs;

    LedFrame frame;
    uint32_t frameNumber;
    uint32_t framesWritten;
    uint32_t framesDropped;
    std::function<void(uint32_t)> droppedFrameCallback;
};

#endif
