#ifndef BASEPAIRCALL_H
#define BASEPAIRCALL_H

#include <cstdint>
#include <string>
#include <vector>
#include "genome/Nucleotide.h"

enum class RefStatus : uint8_t {
    HomRef,  // 0/0
    HetMix,  // 0/x
    HomAlt,  // x/x
    HetAlt   // x/y
};

const char* refStatusName(RefStatus status);

// One displayed position, taken from a single VCF record.
// Immutable once the reader has produced it.
struct BasePairCall {
    std::string contig;
    uint32_t position;
    char ref;
    std::string alts;       // one letter per ALT allele
    uint8_t genotype[2];
    float quality;

    Nucleotide displayed;   // allele picked by genotype[1]
    RefStatus status;
};

#endif
