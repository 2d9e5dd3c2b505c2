#include <Arduino.h>
#include "system/SystemManager.h"

// SystemManager loads the variant calls and starts the display task
SystemManager sysManager;

void setup() {
    sysManager.begin();
}

void loop() {
    sysManager.update();
}
