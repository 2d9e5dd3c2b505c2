#include <gtest/gtest.h>
#include <atomic>
#include <set>
#include <vector>
#include "display/DisplayLoop.h"

namespace {
    const size_t kLeds = 18;
    const uint32_t kIntervalMs = 100;

    class FakeClock : public FrameClock {
    public:
        uint32_t nowMs() override { return now; }
        void sleepMs(uint32_t ms) override {
            sleeps.push_back(ms);
            now += ms;
        }

        uint32_t now = 0;
        std::vector<uint32_t> sleeps;
    };

    class FakeSink : public LedSink {
    public:
        explicit FakeSink(FakeClock& clock) : clock(clock) {}

        size_t getNumLeds() const override { return kLeds; }

        bool write(const LedFrame& frame) override {
            writeStarts.push_back(clock.now);
            clock.now += writeCostMs;
            frames.push_back(frame);
            bool ok = failOn.count(frames.size() - 1) == 0;
            if (stop && frames.size() >= stopAfter) stop->store(true);
            return ok;
        }

        void blank() override {
            blanks++;
            framesAtBlank = frames.size();
        }

        FakeClock& clock;
        uint32_t writeCostMs = 0;
        std::set<size_t> failOn;
        std::atomic<bool>* stop = nullptr;
        size_t stopAfter = 0;

        std::vector<LedFrame> frames;
        std::vector<uint32_t> writeStarts;
        int blanks = 0;
        size_t framesAtBlank = 0;
    };

    std::vector<BasePairCall> makeCalls(size_t count) {
        const Nucleotide order[] = {Nucleotide::A, Nucleotide::T, Nucleotide::G, Nucleotide::C};
        std::vector<BasePairCall> calls;
        for (size_t i = 0; i < count; i++) {
            BasePairCall call;
            call.contig = "chr3";
            call.position = 100 + (uint32_t)i;
            call.ref = 'A';
            call.genotype[0] = 1;
            call.genotype[1] = 1;
            call.quality = 50.0f;
            call.displayed = order[i % 4];
            call.status = RefStatus::HomAlt;
            calls.push_back(call);
        }
        return calls;
    }
}

TEST(DisplayLoop, NotReadyWithFewerCallsThanLeds) {
    FakeClock clock;
    FakeSink sink(clock);
    std::atomic<bool> stop(false);

    DisplayLoop loop(sink, clock, makeCalls(kLeds - 1), ColorTable(), kIntervalMs);
    EXPECT_FALSE(loop.isReady());
    EXPECT_FALSE(loop.run(stop));
    EXPECT_TRUE(sink.frames.empty());
    EXPECT_EQ(0, sink.blanks);
}

TEST(DisplayLoop, NotReadyWithZeroInterval) {
    FakeClock clock;
    FakeSink sink(clock);
    DisplayLoop loop(sink, clock, makeCalls(kLeds), ColorTable(), 0);
    EXPECT_FALSE(loop.isReady());
}

TEST(DisplayLoop, FrameMapsEachCallToItsColor) {
    FakeClock clock;
    FakeSink sink(clock);
    DisplayLoop loop(sink, clock, makeCalls(kLeds), ColorTable(), kIntervalMs);
    ASSERT_TRUE(loop.isReady());

    loop.tick();

    ASSERT_EQ(1u, sink.frames.size());
    const LedFrame& frame = sink.frames[0];
    ASSERT_EQ(kLeds, frame.size());
    EXPECT_EQ((Rgb{5, 152, 5}), frame[0]);
    EXPECT_EQ((Rgb{255, 0, 0}), frame[1]);
    EXPECT_EQ((Rgb{209, 103, 6}), frame[2]);
    EXPECT_EQ((Rgb{0, 0, 255}), frame[3]);
    EXPECT_EQ(frame[0], frame[4]);
    EXPECT_EQ(frame[1], frame[17]);
}

TEST(DisplayLoop, UsesOnlyTheFirstCallsWhenGivenMore) {
    FakeClock clock;
    FakeSink sink(clock);
    DisplayLoop loop(sink, clock, makeCalls(kLeds + 3), ColorTable(), kIntervalMs);
    loop.tick();
    EXPECT_EQ(kLeds, sink.frames[0].size());
}

TEST(DisplayLoop, RunStopsOnFlagAndBlanks) {
    FakeClock clock;
    FakeSink sink(clock);
    std::atomic<bool> stop(false);
    sink.stop = &stop;
    sink.stopAfter = 5;

    DisplayLoop loop(sink, clock, makeCalls(kLeds), ColorTable(), kIntervalMs);
    ASSERT_TRUE(loop.run(stop));

    EXPECT_EQ(5u, sink.frames.size());
    EXPECT_EQ(5u, loop.getFramesWritten());
    EXPECT_EQ(1, sink.blanks);
    EXPECT_EQ(5u, sink.framesAtBlank);
}

TEST(DisplayLoop, StopAlreadySetOnlyBlanks) {
    FakeClock clock;
    FakeSink sink(clock);
    std::atomic<bool> stop(true);

    DisplayLoop loop(sink, clock, makeCalls(kLeds), ColorTable(), kIntervalMs);
    ASSERT_TRUE(loop.run(stop));
    EXPECT_TRUE(sink.frames.empty());
    EXPECT_EQ(1, sink.blanks);
}

TEST(DisplayLoop, SleepsTheWholeIntervalWhenWritesAreInstant) {
    FakeClock clock;
    FakeSink sink(clock);
    DisplayLoop loop(sink, clock, makeCalls(kLeds), ColorTable(), kIntervalMs);

    for (int i = 0; i < 10; i++) loop.tick();

    EXPECT_EQ(10u * kIntervalMs, clock.now);
    for (uint32_t ms : clock.sleeps) EXPECT_EQ(kIntervalMs, ms);
}

TEST(DisplayLoop, SleepSubtractsTimeSpentWriting) {
    FakeClock clock;
    FakeSink sink(clock);
    sink.writeCostMs = 30;
    DisplayLoop loop(sink, clock, makeCalls(kLeds), ColorTable(), kIntervalMs);

    for (int i = 0; i < 10; i++) loop.tick();

    EXPECT_EQ(10u * kIntervalMs, clock.now);
    for (uint32_t ms : clock.sleeps) EXPECT_EQ(70u, ms);
}

TEST(DisplayLoop, FrameStartsNeverCloserThanInterval) {
    FakeClock clock;
    FakeSink sink(clock);
    sink.writeCostMs = 150; // slower than the interval
    DisplayLoop loop(sink, clock, makeCalls(kLeds), ColorTable(), kIntervalMs);

    for (int i = 0; i < 6; i++) loop.tick();

    for (size_t i = 1; i < sink.writeStarts.size(); i++) {
        EXPECT_GE(sink.writeStarts[i] - sink.writeStarts[i - 1], kIntervalMs);
    }
    for (uint32_t ms : clock.sleeps) EXPECT_EQ(0u, ms);
}

TEST(DisplayLoop, FailedWriteIsReportedAndLoopContinues) {
    FakeClock clock;
    FakeSink sink(clock);
    std::atomic<bool> stop(false);
    sink.failOn = {2, 4};
    sink.stop = &stop;
    sink.stopAfter = 6;

    std::vector<uint32_t> dropped;
    DisplayLoop loop(sink, clock, makeCalls(kLeds), ColorTable(), kIntervalMs);
    loop.setDroppedFrameCallback([&dropped](uint32_t frame) { dropped.push_back(frame); });

    ASSERT_TRUE(loop.run(stop));

    EXPECT_EQ(6u, sink.frames.size());
    EXPECT_EQ(4u, loop.getFramesWritten());
    EXPECT_EQ(2u, loop.getFramesDropped());
    ASSERT_EQ(2u, dropped.size());
    EXPECT_EQ(2u, dropped[0]);
    EXPECT_EQ(4u, dropped[1]);
    EXPECT_EQ(6u * kIntervalMs, clock.now);
    EXPECT_EQ(1, sink.blanks);
}
