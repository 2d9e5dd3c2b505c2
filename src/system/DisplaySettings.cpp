#include "system/DisplaySettings.h"
#include "system/Config.h"
#include <ArduinoJson.h>

DisplaySettings::DisplaySettings()
    : variantFile(VARIANT_FILE_PATH),
      startPosition(0),
      frameIntervalMs(FRAME_INTERVAL_MS),
      brightness(LED_BRIGHTNESS),
      homRefBrightness(HOMREF_BRIGHTNESS_FACTOR)
{}

bool DisplaySettings::applyJson(const char* json, size_t length, std::vector<std::string>& warnings) {
    StaticJsonDocument<512> doc;
    DeserializationError error = deserializeJson(doc, json, length);
    if (error) {
        warnings.push_back(std::string("parse error: ") + error.c_str());
        return false;
    }
    if (!doc.is<JsonObject>()) {
        warnings.push_back("settings must be a JSON object");
        return false;
    }

    if (doc.containsKey("variantFile")) {
        const char* path = doc["variantFile"];
        if (path && path[0] == '/') {
            variantFile = path;
        } else {
            warnings.push_back("variantFile must be an absolute path");
        }
    }

    if (doc.containsKey("contig")) {
        const char* name = doc["contig"];
        if (name) {
            contig = name;
        } else {
            warnings.push_back("contig must be a string");
        }
    }

    if (doc.containsKey("startPosition")) {
        if (doc["startPosition"].is<uint32_t>()) {
            startPosition = doc["startPosition"].as<uint32_t>();
        } else {
            warnings.push_back("startPosition must be a non-negative integer");
        }
    }

    if (doc.containsKey("frameIntervalMs")) {
        JsonVariant v = doc["frameIntervalMs"];
        if (v.is<uint32_t>() && v.as<uint32_t>() >= MIN_FRAME_INTERVAL_MS &&
            v.as<uint32_t>() <= MAX_FRAME_INTERVAL_MS) {
            frameIntervalMs = v.as<uint32_t>();
        } else {
            warnings.push_back("frameIntervalMs out of range");
        }
    }

    if (doc.containsKey("brightness")) {
        JsonVariant v = doc["brightness"];
        if (v.is<int>() && v.as<int>() >= 0 && v.as<int>() <= 255) {
            brightness = (uint8_t)v.as<int>();
        } else {
            warnings.push_back("brightness out of range");
        }
    }

    if (doc.containsKey("homRefBrightness")) {
        JsonVariant v = doc["homRefBrightness"];
        if (v.is<float>() && v.as<float>() >= 0.0f && v.as<float>() <= 1.0f) {
            homRefBrightness = v.as<float>();
        } else {
            warnings.push_back("homRefBrightness out of range");
        }
    }

    return true;
}
