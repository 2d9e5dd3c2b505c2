#ifndef LEDCONTROLLER_H
#define LEDCONTROLLER_H

#include <Arduino.h>
#include <FastLED.h>
#include "display/LedSink.h"
#include "system/Config.h"

// Two WS2812B strands of LEDS_PER_STRAND each, one per side of the helix.
// Frame index i maps to leds[i]: the first strand holds 0..8, the second 9..17.
class LedController : public LedSink {
public:
    LedController();
    ~LedController();

    void begin(uint8_t brightness);

    size_t getNumLeds() const override;
    bool write(const LedFrame& frame) override;
    void blank() override;

    void setBrightness(uint8_t value);
    void flashColor(CRGB color, int count = 3, int intervalMs = 250);

private:
    bool show(TickType_t wait);

    CRGB leds[NUM_LEDS];
    SemaphoreHandle_t mutex;
};

#endif
