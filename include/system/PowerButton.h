#pragma once

#include <Arduino.h>
#include <atomic>

// Momentary button to ground. A press asks the display loop to stop; the
// same pin later wakes the board from deep sleep.
class PowerButton {
public:
    explicit PowerButton(uint8_t pin);

    void begin(std::atomic<bool>& stopFlag);
    void sleepUntilPressed();

private:
    static void onPress(void* arg);

    const uint8_t pin;
    std::atomic<bool>* stopFlag;
};
