#ifndef COLORTABLE_H
#define COLORTABLE_H

#include <vector>
#include "display/Rgb.h"
#include "genome/BasePairCall.h"
#include "genome/Nucleotide.h"

// Fixed nucleotide colours. Complementary bases never share a colour.
class ColorTable {
public:
    explicit ColorTable(float homRefBrightness = 0.1f);

    static Rgb colorFor(Nucleotide base);

    // Table colour of the displayed base, dimmed for hom-ref calls.
    Rgb colorFor(const BasePairCall& call) const;

    // Fills frame with one colour per call, in call order.
    void compose(const std::vector<BasePairCall>& calls, LedFrame& frame) const;

private:
    float homRefBrightness;
};

#endif
