#ifndef RGB_H
#define RGB_H

#include <cstdint>
#include <vector>

// Plain colour triple; the LED controller converts it to CRGB.
struct Rgb {
    uint8_t r;
    uint8_t g;
    uint8_t b;

    bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Rgb& other) const {
        return !(*this == other);
    }

    // Each channel multiplied by factor (0..1), truncated.
    Rgb scaled(float factor) const {
        if (factor <= 0.0f) return {0, 0, 0};
        if (factor >= 1.0f) return *this;
        return {(uint8_t)(r * factor), (uint8_t)(g * factor), (uint8_t)(b * factor)};
    }
};

typedef std::vector<Rgb> LedFrame;

#endif
