#ifndef VARIANTREADER_H
#define VARIANTREADER_H

#include <cstddef>
#include <cstdint>
#include <istream>
#include <set>
#include <string>
#include <vector>
#include "genome/BasePairCall.h"

// Reads the pipeline's filtered VCF into a fixed number of base-pair calls,
// in file order. Lines are fed one at a time so the firmware can stream them
// straight from flash; read() wraps that for std::istream.
//
// Usage:
//   VariantReader reader(NUM_LEDS);
//   while (!reader.isComplete() && haveLine) reader.addLine(line);
//   if (!reader.finish()) log(reader.getError());
class VariantReader {
public:
    struct Stats {
        uint32_t lines = 0;
        uint32_t records = 0;
        uint32_t skippedFilter = 0;
        uint32_t skippedContig = 0;
        uint32_t skippedPosition = 0;
        uint32_t skippedNonSnp = 0;
        uint32_t skippedNoCall = 0;
        uint32_t mergedDuplicates = 0;
    };

    explicit VariantReader(size_t requiredCalls);

    // Only records on this contig are used. Empty accepts every contig.
    void setContig(const std::string& name);
    // Records before this 1-based position are skipped.
    void setStartPosition(uint32_t position);

    // Returns false once the reader has failed; further lines are ignored.
    bool addLine(const std::string& line);

    // True when enough distinct positions were seen; no more input is needed.
    bool isComplete() const { return complete; }

    // Checks the collected calls. Must be called after the last line.
    bool finish();

    bool read(std::istream& in);

    const std::vector<BasePairCall>& getCalls() const { return calls; }
    const std::string& getError() const { return error; }
    const Stats& getStats() const { return stats; }

private:
    enum class LineResult {
        Accepted,
        Skipped,
        Malformed
    };

    LineResult parseRecord(const std::string& line, BasePairCall& call);
    void accept(const BasePairCall& call);
    bool fail(const std::string& message);

    const size_t requiredCalls;
    std::string contigFilter;
    uint32_t startPosition;

    std::vector<BasePairCall> calls;
    std::string lastContig;
    std::set<std::string> closedContigs;
    uint32_t lastPosition;

    bool complete;
    bool failed;
    std::string error;
    Stats stats;
};

#endif
