#pragma once

// ---------------- LED Settings ----------------
#define NUM_LEDS 18
#define LEDS_PER_STRAND 9
#define STRAND_1_PIN 18
#define STRAND_2_PIN 13
#define LED_BRIGHTNESS 255
#define LED_WRITE_TIMEOUT_MS 20

// ---------------- Display Settings ----------------
#define FRAME_INTERVAL_MS 100
#define MIN_FRAME_INTERVAL_MS 20
#define MAX_FRAME_INTERVAL_MS 2000
#define HOMREF_BRIGHTNESS_FACTOR 0.1f

// ---------------- Files (LittleFS) ----------------
#define VARIANT_FILE_PATH "/variants.vcf"
#define SETTINGS_FILE_PATH "/config.json"

// ---------------- Power Button ----------------
#define POWER_BUTTON_PIN 33

// ---------------- FreeRTOS Settings ----------------
#define DISPLAY_TASK_STACK_SIZE 4096
#define DISPLAY_TASK_PRIORITY 1
#define DISPLAY_TASK_CORE 1
