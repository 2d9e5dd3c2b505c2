#include "system/PowerButton.h"
#include <esp_sleep.h>

PowerButton::PowerButton(uint8_t pin)
    : pin(pin), stopFlag(nullptr) {}

void PowerButton::begin(std::atomic<bool>& flag) {
    stopFlag = &flag;
    pinMode(pin, INPUT_PULLUP);
    attachInterruptArg(digitalPinToInterrupt(pin), onPress, this, FALLING);
    Serial.printf("Power: button armed on GPIO %d\n", pin);
}

void IRAM_ATTR PowerButton::onPress(void* arg) {
    PowerButton* self = static_cast<PowerButton*>(arg);
    if (self->stopFlag) {
        self->stopFlag->store(true);
    }
}

void PowerButton::sleepUntilPressed() {
    detachInterrupt(digitalPinToInterrupt(pin));

    // Still held from the shutdown press; sleeping now would wake at once
    while (digitalRead(pin) == LOW) {
        delay(10);
    }
    delay(50);

    Serial.println("Power: entering deep sleep");
    Serial.flush();
    esp_sleep_enable_ext0_wakeup(static_cast<gpio_num_t>(pin), 0);
    esp_deep_sleep_start();
}
