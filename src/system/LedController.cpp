#include "system/LedController.h"

LedController::LedController() {
    mutex = xSemaphoreCreateMutex();
}

LedController::~LedController() {
    vSemaphoreDelete(mutex);
}

void LedController::begin(uint8_t brightness) {
    Serial.println("  > LedController::begin");
    FastLED.addLeds<WS2812B, STRAND_1_PIN, GRB>(leds, 0, LEDS_PER_STRAND);
    FastLED.addLeds<WS2812B, STRAND_2_PIN, GRB>(leds, LEDS_PER_STRAND, NUM_LEDS - LEDS_PER_STRAND);
    FastLED.setBrightness(brightness);
    blank();
    Serial.println("  > LedController::begin done");
}

size_t LedController::getNumLeds() const {
    return NUM_LEDS;
}

bool LedController::write(const LedFrame& frame) {
    if (frame.size() != NUM_LEDS) {
        Serial.printf("Display: frame has %u values, strip has %d\n", (unsigned)frame.size(), NUM_LEDS);
        return false;
    }

    if (!xSemaphoreTake(mutex, pdMS_TO_TICKS(LED_WRITE_TIMEOUT_MS))) {
        Serial.println("Display: strip busy, frame dropped");
        return false;
    }
    for (size_t i = 0; i < frame.size(); i++) {
        leds[i] = CRGB(frame[i].r, frame[i].g, frame[i].b);
    }
    FastLED.show();
    xSemaphoreGive(mutex);
    return true;
}

void LedController::blank() {
    if (xSemaphoreTake(mutex, portMAX_DELAY)) {
        fill_solid(leds, NUM_LEDS, CRGB::Black);
        FastLED.show();
        xSemaphoreGive(mutex);
    }
}

void LedController::setBrightness(uint8_t value) {
    FastLED.setBrightness(value);
}

bool LedController::show(TickType_t wait) {
    if (!xSemaphoreTake(mutex, wait)) return false;
    FastLED.show();
    xSemaphoreGive(mutex);
    return true;
}

void LedController::flashColor(CRGB color, int count, int intervalMs) {
    for (int i = 0; i < count; i++) {
        // ON
        fill_solid(leds, NUM_LEDS, color);
        show(portMAX_DELAY);
        delay(intervalMs);

        // OFF
        fill_solid(leds, NUM_LEDS, CRGB::Black);
        show(portMAX_DELAY);
        delay(intervalMs);
    }
}
