#include "display/ColorTable.h"

namespace {
    // Indexed by Nucleotide
    const Rgb kBaseColors[4] = {
        {5, 152, 5},    // A
        {0, 0, 255},    // C
        {209, 103, 6},  // G
        {255, 0, 0}     // T
    };
}

ColorTable::ColorTable(float homRefBrightness)
    : homRefBrightness(homRefBrightness) {}

Rgb ColorTable::colorFor(Nucleotide base) {
    return kBaseColors[static_cast<uint8_t>(base)];
}

Rgb ColorTable::colorFor(const BasePairCall& call) const {
    Rgb color = colorFor(call.displayed);
    if (call.status == RefStatus::HomRef) {
        return color.scaled(homRefBrightness);
    }
    return color;
}

void ColorTable::compose(const std::vector<BasePairCall>& calls, LedFrame& frame) const {
    size_t count = frame.size() < calls.size() ? frame.size() : calls.size();
    for (size_t i = 0; i < count; i++) {
        frame[i] = colorFor(calls[i]);
    }
}
