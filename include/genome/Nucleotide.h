#ifndef NUCLEOTIDE_H
#define NUCLEOTIDE_H

#include <cstdint>

// Displayable bases. Ambiguity codes are parsed but never displayed.
enum class Nucleotide : uint8_t {
    A,
    C,
    G,
    T
};

Nucleotide complement(Nucleotide base);
char toChar(Nucleotide base);

// Accepts upper or lower case A/C/G/T.
bool parseNucleotide(char c, Nucleotide& out);

// True for A/C/G/T plus the IUPAC ambiguity letters (N R Y K M S W B D H V).
bool isIupacBase(char c);

#endif
