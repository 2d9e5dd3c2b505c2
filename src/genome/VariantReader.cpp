#include "genome/VariantReader.h"
#include <cmath>
#include <cstdlib>

namespace {
    const size_t kVcfColumns = 10;

    enum Column {
        COL_CHROM = 0,
        COL_POS = 1,
        COL_REF = 3,
        COL_ALT = 4,
        COL_QUAL = 5,
        COL_FILTER = 6,
        COL_FORMAT = 8,
        COL_SAMPLE = 9
    };

    std::vector<std::string> split(const std::string& text, char separator) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            size_t end = text.find(separator, start);
            if (end == std::string::npos) {
                parts.push_back(text.substr(start));
                return parts;
            }
            parts.push_back(text.substr(start, end - start));
            start = end + 1;
        }
    }

    bool isIupacString(const std::string& text) {
        if (text.empty()) return false;
        for (char c : text) {
            if (!isIupacBase(c)) return false;
        }
        return true;
    }

    bool parsePosition(const std::string& text, uint32_t& out) {
        if (text.empty() || text.size() > 10) return false;
        for (char c : text) {
            if (c < '0' || c > '9') return false;
        }
        unsigned long value = strtoul(text.c_str(), nullptr, 10);
        if (value == 0 || value > 0xFFFFFFFFUL) return false;
        out = (uint32_t)value;
        return true;
    }

    bool parseQuality(const std::string& text, float& out) {
        if (text == ".") {
            out = 0.0f;
            return true;
        }
        if (text.empty()) return false;
        // strtof also takes nan, inf, hex and leading blanks; VCF does not
        for (char c : text) {
            if ((c < '0' || c > '9') && c != '.' && c != '-' && c != '+' && c != 'e' && c != 'E') {
                return false;
            }
        }
        char* end = nullptr;
        out = strtof(text.c_str(), &end);
        return end != nullptr && *end == '\0' && std::isfinite(out);
    }

    bool parseAlleleIndex(const std::string& text, uint8_t& out) {
        if (text.empty() || text.size() > 2) return false;
        int value = 0;
        for (char c : text) {
            if (c < '0' || c > '9') return false;
            value = value * 10 + (c - '0');
        }
        out = (uint8_t)value;
        return true;
    }

    char upper(char c) {
        return (c >= 'a' && c <= 'z') ? (char)(c - 'a' + 'A') : c;
    }

    RefStatus statusFor(uint8_t first, uint8_t second) {
        if (first == 0 && second == 0) return RefStatus::HomRef;
        if (first == 0 || second == 0) return RefStatus::HetMix;
        if (first == second) return RefStatus::HomAlt;
        return RefStatus::HetAlt;
    }
}

VariantReader::VariantReader(size_t requiredCalls)
    : requiredCalls(requiredCalls), startPosition(0), lastPosition(0),
      complete(false), failed(false)
{
    calls.reserve(requiredCalls + 1);
}

void VariantReader::setContig(const std::string& name) {
    contigFilter = name;
}

void VariantReader::setStartPosition(uint32_t position) {
    startPosition = position;
}

bool VariantReader::addLine(const std::string& rawLine) {
    if (failed) return false;
    if (complete) return true;

    stats.lines++;

    std::string line = rawLine;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    if (line.find_first_not_of(" \t") == std::string::npos || line[0] == '#') return true;

    stats.records++;

    BasePairCall call;
    switch (parseRecord(line, call)) {
        case LineResult::Accepted:
            accept(call);
            return true;
        case LineResult::Skipped:
            return true;
        case LineResult::Malformed:
            return false;
    }
    return false;
}

VariantReader::LineResult VariantReader::parseRecord(const std::string& line, BasePairCall& call) {
    const std::string where = "line " + std::to_string(stats.lines) + ": ";

    std::vector<std::string> cols = split(line, '\t');
    if (cols.size() < kVcfColumns) {
        fail(where + "expected " + std::to_string(kVcfColumns) + " tab separated columns, got " +
             std::to_string(cols.size()));
        return LineResult::Malformed;
    }

    call.contig = cols[COL_CHROM];
    if (call.contig.empty()) {
        fail(where + "empty contig name");
        return LineResult::Malformed;
    }

    if (!parsePosition(cols[COL_POS], call.position)) {
        fail(where + "invalid position '" + cols[COL_POS] + "'");
        return LineResult::Malformed;
    }

    // Sorted input is assumed, so an out of order record means a broken file
    if (call.contig != lastContig) {
        if (closedContigs.count(call.contig)) {
            fail(where + "contig " + call.contig + " appears again after " + lastContig);
            return LineResult::Malformed;
        }
        if (!lastContig.empty()) closedContigs.insert(lastContig);
    } else if (call.position < lastPosition) {
        fail(where + "position " + std::to_string(call.position) + " on " + call.contig +
             " comes after " + std::to_string(lastPosition));
        return LineResult::Malformed;
    }
    lastContig = call.contig;
    lastPosition = call.position;

    const std::string& ref = cols[COL_REF];
    if (!isIupacString(ref)) {
        fail(where + "invalid REF '" + ref + "'");
        return LineResult::Malformed;
    }

    bool snp = ref.size() == 1;
    std::vector<std::string> alts;
    if (cols[COL_ALT] != ".") {
        alts = split(cols[COL_ALT], ',');
    }
    for (const auto& alt : alts) {
        if (alt == "*" || (!alt.empty() && alt[0] == '<')) {
            snp = false;
            continue;
        }
        if (!isIupacString(alt)) {
            fail(where + "invalid ALT '" + cols[COL_ALT] + "'");
            return LineResult::Malformed;
        }
        if (alt.size() != 1) snp = false;
    }

    if (!parseQuality(cols[COL_QUAL], call.quality)) {
        fail(where + "invalid QUAL '" + cols[COL_QUAL] + "'");
        return LineResult::Malformed;
    }

    if (cols[COL_FILTER] != "PASS") {
        stats.skippedFilter++;
        return LineResult::Skipped;
    }
    if (!contigFilter.empty() && call.contig != contigFilter) {
        stats.skippedContig++;
        return LineResult::Skipped;
    }
    if (call.position < startPosition) {
        stats.skippedPosition++;
        return LineResult::Skipped;
    }
    if (!snp) {
        stats.skippedNonSnp++;
        return LineResult::Skipped;
    }

    // GT is usually first in FORMAT, but look it up rather than assume
    std::vector<std::string> formatKeys = split(cols[COL_FORMAT], ':');
    std::vector<std::string> sampleValues = split(cols[COL_SAMPLE], ':');
    size_t gtIndex = 0;
    for (size_t i = 0; i < formatKeys.size(); i++) {
        if (formatKeys[i] == "GT") {
            gtIndex = i;
            break;
        }
    }
    std::string gt = gtIndex < sampleValues.size() ? sampleValues[gtIndex] : "";
    if (gt.empty() || gt.find('.') != std::string::npos) {
        stats.skippedNoCall++;
        return LineResult::Skipped;
    }

    std::vector<std::string> alleles = split(gt, gt.find('|') != std::string::npos ? '|' : '/');
    if (alleles.size() > 2 ||
        !parseAlleleIndex(alleles[0], call.genotype[0]) ||
        !parseAlleleIndex(alleles.back(), call.genotype[1])) {
        fail(where + "invalid genotype '" + gt + "'");
        return LineResult::Malformed;
    }
    if (call.genotype[0] > alts.size() || call.genotype[1] > alts.size()) {
        fail(where + "genotype '" + gt + "' refers to a missing allele");
        return LineResult::Malformed;
    }

    call.ref = upper(ref[0]);
    call.alts.clear();
    for (const auto& alt : alts) {
        call.alts.push_back(upper(alt[0]));
    }

    char shown = call.genotype[1] == 0 ? call.ref : call.alts[call.genotype[1] - 1];
    if (!parseNucleotide(shown, call.displayed)) {
        fail(where + "called base '" + std::string(1, shown) + "' is not A, C, G or T");
        return LineResult::Malformed;
    }
    call.status = statusFor(call.genotype[0], call.genotype[1]);

    return LineResult::Accepted;
}

void VariantReader::accept(const BasePairCall& call) {
    if (!calls.empty() && calls.back().contig == call.contig && calls.back().position == call.position) {
        stats.mergedDuplicates++;
        if (call.quality > calls.back().quality) {
            calls.back() = call;
        }
        return;
    }

    // A new position after the last needed one closes the set
    if (calls.size() == requiredCalls) {
        complete = true;
        return;
    }
    calls.push_back(call);
}

bool VariantReader::finish() {
    if (failed) return false;

    if (calls.size() < requiredCalls) {
        return fail("only " + std::to_string(calls.size()) + " usable calls in " +
                    std::to_string(stats.records) + " records, need " + std::to_string(requiredCalls));
    }
    complete = true;
    return true;
}

bool VariantReader::read(std::istream& in) {
    std::string line;
    while (!complete && std::getline(in, line)) {
        if (!addLine(line)) return false;
    }
    return finish();
}

bool VariantReader::fail(const std::string& message) {
    failed = true;
    error = message;
    return false;
}
