#pragma once

#include <Arduino.h>
#include <atomic>
#include <vector>
#include "system/Config.h"
#include "system/DisplaySettings.h"
#include "system/LedController.h"
#include "system/PowerButton.h"
#include "genome/BasePairCall.h"

class SystemManager {
public:
    SystemManager();

    void begin();
    void update();

    LedController ledController;

private:
    // Static task entry point
    static void displayTaskTrampoline(void* parameter);
    void displayTask();

    void loadSettings();
    bool loadVariants();
    void halt(const char* reason);

    DisplaySettings settings;
    std::vector<BasePairCall> calls;
    PowerButton powerButton;

    std::atomic<bool> stopRequested;
    std::atomic<bool> displayFinished;

    // FreeRTOS Task Handle
    TaskHandle_t displayTaskHandle;
};
