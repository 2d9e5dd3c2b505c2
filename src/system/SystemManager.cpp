#include "system/SystemManager.h"
#include <LittleFS.h>
#include <string>
#include "display/ColorTable.h"
#include "display/DisplayLoop.h"
#include "genome/VariantReader.h"

namespace {
    class TaskClock : public FrameClock {
    public:
        uint32_t nowMs() override {
            return millis();
        }

        void sleepMs(uint32_t ms) override {
            vTaskDelay(pdMS_TO_TICKS(ms));
        }
    };
}

SystemManager::SystemManager()
    : powerButton(POWER_BUTTON_PIN),
      stopRequested(false),
      displayFinished(false),
      displayTaskHandle(NULL)
{}

void SystemManager::begin() {
    Serial.begin(115200);
    Serial.println("=== Starting helixlight (SystemManager) ===");

    Serial.println("Init: LEDs...");
    ledController.begin(settings.brightness);
    Serial.println("Init: LEDs done.");

    Serial.println("Init: LittleFS...");
    if (!LittleFS.begin(false)) {
        halt("LittleFS mount failed");
    }

    Serial.println("Init: Loading Config...");
    loadSettings();
    ledController.setBrightness(settings.brightness);

    Serial.println("Init: Loading Variants...");
    if (!loadVariants()) {
        halt("no base-pair data, display not started");
    }

    Serial.println("Init: Power button...");
    powerButton.begin(stopRequested);

    Serial.println("Init: Tasks...");
    xTaskCreatePinnedToCore(
        displayTaskTrampoline,
        "DisplayTask",
        DISPLAY_TASK_STACK_SIZE,
        this,
        DISPLAY_TASK_PRIORITY,
        &displayTaskHandle,
        DISPLAY_TASK_CORE
    );
    Serial.println("Init: Tasks done.");
}

void SystemManager::update() {
    if (displayFinished.load()) {
        Serial.println("Power: display stopped, shutting down");
        powerButton.sleepUntilPressed();
    }

    vTaskDelay(100 / portTICK_PERIOD_MS);
}

void SystemManager::displayTaskTrampoline(void* parameter) {
    if (parameter) {
        static_cast<SystemManager*>(parameter)->displayTask();
    }
    vTaskDelete(NULL);
}

void SystemManager::displayTask() {
    TaskClock clock;
    ColorTable colors(settings.homRefBrightness);
    DisplayLoop display(ledController, clock, calls, colors, settings.frameIntervalMs);

    display.setDroppedFrameCallback([](uint32_t frame) {
        Serial.printf("Display: frame %u dropped\n", (unsigned)frame);
    });

    Serial.printf("Display: rendering %u calls every %u ms\n",
                  (unsigned)calls.size(), (unsigned)display.getFrameIntervalMs());

    if (!display.run(stopRequested)) {
        Serial.println("Display: not enough calls for the strip, loop not started");
    }

    Serial.printf("Display: stopped after %u frames (%u dropped)\n",
                  (unsigned)(display.getFramesWritten() + display.getFramesDropped()),
                  (unsigned)display.getFramesDropped());
    displayFinished.store(true);
}

// ==========================================
// DATA FILES
// ==========================================

void SystemManager::loadSettings() {
    if (!LittleFS.exists(SETTINGS_FILE_PATH)) {
        Serial.println("Config: No config file found, using defaults");
        return;
    }

    File file = LittleFS.open(SETTINGS_FILE_PATH, "r");
    if (!file) {
        Serial.println("Config: Failed to open config file");
        return;
    }

    std::string json(file.size(), '\0');
    size_t got = file.readBytes(&json[0], json.size());
    file.close();
    json.resize(got);

    std::vector<std::string> warnings;
    if (!settings.applyJson(json.c_str(), json.size(), warnings)) {
        Serial.println("Config: Failed to parse config file, using defaults");
    }
    for (const auto& warning : warnings) {
        Serial.printf("Config: %s\n", warning.c_str());
    }

    Serial.printf("Config: variants '%s', contig '%s' from %u, %u ms/frame, brightness %u\n",
                  settings.variantFile.c_str(),
                  settings.contig.empty() ? "*" : settings.contig.c_str(),
                  (unsigned)settings.startPosition, (unsigned)settings.frameIntervalMs, settings.brightness);
}

bool SystemManager::loadVariants() {
    File file = LittleFS.open(settings.variantFile.c_str(), "r");
    if (!file) {
        Serial.printf("Variants: cannot open %s\n", settings.variantFile.c_str());
        return false;
    }

    VariantReader reader(NUM_LEDS);
    reader.setContig(settings.contig);
    reader.setStartPosition(settings.startPosition);

    while (file.available() && !reader.isComplete()) {
        String line = file.readStringUntil('\n');
        if (!reader.addLine(line.c_str())) break;
    }
    file.close();

    if (!reader.finish()) {
        Serial.printf("Variants: %s: %s\n", settings.variantFile.c_str(), reader.getError().c_str());
        return false;
    }

    const VariantReader::Stats& stats = reader.getStats();
    Serial.printf("Variants: %u records read, skipped %u filtered, %u other contig, %u before start, "
                  "%u non-SNP, %u no-call, merged %u\n",
                  (unsigned)stats.records, (unsigned)stats.skippedFilter, (unsigned)stats.skippedContig,
                  (unsigned)stats.skippedPosition, (unsigned)stats.skippedNonSnp,
                  (unsigned)stats.skippedNoCall, (unsigned)stats.mergedDuplicates);

    calls = reader.getCalls();

    std::string sequence;
    for (size_t i = 0; i < calls.size(); i++) {
        const BasePairCall& call = calls[i];
        sequence += toChar(call.displayed);
        Serial.printf("Variants:   LED %2u  %s:%u %c>%c  %s\n", (unsigned)i, call.contig.c_str(),
                      (unsigned)call.position, call.ref, toChar(call.displayed), refStatusName(call.status));
    }
    Serial.printf("Variants: %s:%u-%u %s\n", calls.front().contig.c_str(),
                  (unsigned)calls.front().position, (unsigned)calls.back().position, sequence.c_str());
    return true;
}

void SystemManager::halt(const char* reason) {
    Serial.printf("FATAL: %s\n", reason);
    ledController.flashColor(CRGB::Red, 3);
    ledController.blank();

    while (true) {
        vTaskDelay(1000 / portTICK_PERIOD_MS);
    }
}
