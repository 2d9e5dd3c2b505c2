#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Runtime settings. Starts from the Config.h defaults; a JSON settings file
// may override any subset of the keys.
struct DisplaySettings {
    DisplaySettings();

    std::string variantFile;
    std::string contig;
    uint32_t startPosition;
    uint32_t frameIntervalMs;
    uint8_t brightness;
    float homRefBrightness;

    // Applies the keys present in json. Invalid values are listed in
    // warnings and leave the current value in place. Returns false only
    // when the document cannot be parsed at all.
    bool applyJson(const char* json, size_t length, std::vector<std::string>& warnings);
};
