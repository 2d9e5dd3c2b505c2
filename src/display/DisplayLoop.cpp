#include "display/DisplayLoop.h"

DisplayLoop::DisplayLoop(LedSink& sink, FrameClock& clock, const std::vector<BasePairCall>& calls,
                         const ColorTable& colors, uint32_t frameIntervalMs)
    : sink(sink), clock(clock), calls(calls), colors(colors), frameIntervalMs(frameIntervalMs),
      frame(sink.getNumLeds(), Rgb{0, 0, 0}),
      frameNumber(0), framesWritten(0), framesDropped(0)
{}

bool DisplayLoop::isReady() const {
    return frameIntervalMs > 0 && !frame.empty() && calls.size() >= frame.size();
}

void DisplayLoop::tick() {
    uint32_t start = clock.nowMs();

    colors.compose(calls, frame);
    if (sink.write(frame)) {
        framesWritten++;
    } else {
        framesDropped++;
        if (droppedFrameCallback) {
            droppedFrameCallback(frameNumber);
        }
    }
    frameNumber++;

    // Unsigned subtraction stays correct across millis() wrap
    uint32_t elapsed = clock.nowMs() - start;
    clock.sleepMs(elapsed < frameIntervalMs ? frameIntervalMs - elapsed : 0);
}

bool DisplayLoop::run(const std::atomic<bool>& stop) {
    if (!isReady()) return false;

    while (!stop.load()) {
        tick();
    }

    sink.blank();
    return true;
}
