#include "genome/Nucleotide.h"

Nucleotide complement(Nucleotide base) {
    switch (base) {
        case Nucleotide::A: return Nucleotide::T;
        case Nucleotide::T: return Nucleotide::A;
        case Nucleotide::C: return Nucleotide::G;
        case Nucleotide::G: return Nucleotide::C;
    }
    return base;
}

char toChar(Nucleotide base) {
    switch (base) {
        case Nucleotide::A: return 'A';
        case Nucleotide::C: return 'C';
        case Nucleotide::G: return 'G';
        case Nucleotide::T: return 'T';
    }
    return 'N';
}

bool parseNucleotide(char c, Nucleotide& out) {
    switch (c) {
        case 'A': case 'a': out = Nucleotide::A; return true;
        case 'C': case 'c': out = Nucleotide::C; return true;
        case 'G': case 'g': out = Nucleotide::G; return true;
        case 'T': case 't': out = Nucleotide::T; return true;
        default: return false;
    }
}

bool isIupacBase(char c) {
    switch (c) {
        case 'A': case 'C': case 'G': case 'T':
        case 'N': case 'R': case 'Y': case 'K': case 'M':
        case 'S': case 'W': case 'B': case 'D': case 'H': case 'V':
        case 'a': case 'c': case 'g': case 't':
        case 'n': case 'r': case 'y': case 'k': case 'm':
        case 's': case 'w': case 'b': case 'd': case 'h': case 'v':
            return true;
        default:
            return false;
    }
}
