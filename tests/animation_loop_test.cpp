#include "core/animation_loop.h"
#include "text/color_schemes.h"
#include "test_fonts.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace {

// Collects everything written; optionally fails once `failAfter` writes succeeded
class RecordingSink : public FrameSink {
public:
    explicit RecordingSink(int failAfter = -1) : failAfter_(failAfter) {}

    void setWriteDeadline(std::chrono::steady_clock::time_point deadline) override {
        writeDeadline = deadline;
    }

    bool begin() override {
        began = true;
        return true;
    }

    bool write(const std::string& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failAfter_ >= 0 && writes_ >= failAfter_) {
            failedWrites++;
            return false;
        }
        writes_++;
        output += data;
        return true;
    }

    bool flush() override { return true; }

    size_t count(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (size_t pos = output.find(needle); pos != std::string::npos; pos = output.find(needle, pos + 1)) {
            n++;
        }
        return n;
    }

    bool began = false;
    std::chrono::steady_clock::time_point writeDeadline;
    int failedWrites = 0;
    std::string output;

private:
    mutable std::mutex mutex_;
    int failAfter_;
    int writes_ = 0;
};

// Occurrences of the per-frame cursor-home that are not part of the initial clear screen
size_t framesIn(const RecordingSink& sink) {
    return sink.count(kAnsiCursorHome) - sink.count(kAnsiClearScreen);
}

} // namespace

class AnimationLoopTest : public FontDirTest {
protected:
    void SetUp() override {
        FontDirTest::SetUp();
        writeDefaultFonts();
        fonts_.populate(dir(), {"standard", "doom"});

        config_.streaming.baseFrameInterval = std::chrono::milliseconds(20);
        config_.streaming.defaultTimeout = std::chrono::milliseconds(150);
        config_.streaming.maxTimeout = std::chrono::milliseconds(400);

        opts_.font = "standard";
        opts_.speed = 1;
    }

    StreamContext context(StreamAdmission& admission, const CancellationSignal* cancellation = nullptr) {
        StreamContext ctx;
        ctx.fonts = &fonts_;
        ctx.admission = &admission;
        ctx.config = &config_;
        ctx.cancellation = cancellation;
        return ctx;
    }

    FontCache fonts_;
    ShoutConfig config_;
    RenderOptions opts_;
};

TEST_F(AnimationLoopTest, StreamsUntilDeadline) {
    StreamAdmission admission(1);
    RecordingSink sink;
    auto start = std::chrono::steady_clock::now();
    StreamResult result = runAnimatedStream("HI", opts_, context(admission), sink);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.outcome, StreamOutcome::DeadlineReached);
    EXPECT_TRUE(result.admitted());
    EXPECT_GE(elapsed, std::chrono::milliseconds(150));
    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_GE(result.framesSent, 2u);
    EXPECT_EQ(framesIn(sink), result.framesSent);
    EXPECT_TRUE(sink.began);
    EXPECT_EQ(sink.output.rfind(kAnsiClearScreen, 0), 0u);
    EXPECT_NE(sink.output.find(kAnsiShowCursor), std::string::npos);
    EXPECT_EQ(admission.activeCount(), 0);
}

TEST_F(AnimationLoopTest, RequestedTimeoutIsCappedByServerMaximum) {
    config_.streaming.maxTimeout = std::chrono::milliseconds(150);
    opts_.timeout = 30;
    StreamAdmission admission(1);
    RecordingSink sink;
    auto start = std::chrono::steady_clock::now();
    StreamResult result = runAnimatedStream("HI", opts_, context(admission), sink);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.outcome, StreamOutcome::DeadlineReached);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST_F(AnimationLoopTest, SinkWritesAreBoundedByEffectiveDeadline) {
    config_.streaming.maxTimeout = std::chrono::milliseconds(150);
    opts_.timeout = 30;
    StreamAdmission admission(1);
    RecordingSink sink;
    auto before = std::chrono::steady_clock::now();
    runAnimatedStream("HI", opts_, context(admission), sink);

    EXPECT_GE(sink.writeDeadline, before + std::chrono::milliseconds(150));
    EXPECT_LT(sink.writeDeadline, before + std::chrono::seconds(2));
}

TEST_F(AnimationLoopTest, FramesChangeColorOverTime) {
    StreamAdmission admission(1);
    RecordingSink sink;
    opts_.color = "neon";
    runAnimatedStream("H", opts_, context(admission), sink);

    const ColorScheme& neon = findColorScheme("neon");
    std::string first = std::string(kAnsiCursorHome) + colorizeFrame({"HH", "HH", "HH"}, neon, 0);
    std::string second = std::string(kAnsiCursorHome) + colorizeFrame({"HH", "HH", "HH"}, neon, 1);
    size_t firstAt = sink.output.find(first);
    ASSERT_NE(firstAt, std::string::npos);
    EXPECT_NE(sink.output.find(second, firstAt + first.size()), std::string::npos);
}

TEST_F(AnimationLoopTest, RejectedWhenCapacityIsFull) {
    StreamAdmission admission(1);
    ASSERT_TRUE(admission.tryAcquire());
    RecordingSink sink;
    StreamResult result = runAnimatedStream("HI", opts_, context(admission), sink);

    EXPECT_EQ(result.outcome, StreamOutcome::Rejected);
    EXPECT_FALSE(result.admitted());
    EXPECT_FALSE(sink.began);
    EXPECT_TRUE(sink.output.empty());
    EXPECT_EQ(admission.activeCount(), 1);
    EXPECT_TRUE(admission.release());
}

TEST_F(AnimationLoopTest, InvalidOptionsNeverTakeASlot) {
    StreamAdmission admission(1);
    RecordingSink sink;

    StreamResult empty = runAnimatedStream("  \t ", opts_, context(admission), sink);
    EXPECT_EQ(empty.outcome, StreamOutcome::InvalidOptions);

    opts_.align = "sideways";
    StreamResult badAlign = runAnimatedStream("HI", opts_, context(admission), sink);
    EXPECT_EQ(badAlign.outcome, StreamOutcome::InvalidOptions);
    EXPECT_FALSE(badAlign.errorMsg.empty());

    EXPECT_TRUE(sink.output.empty());
    EXPECT_EQ(admission.activeCount(), 0);
}

TEST_F(AnimationLoopTest, RenderFailureWritesNothingAndReleasesSlot) {
    FontCache empty;
    StreamAdmission admission(1);
    StreamContext ctx = context(admission);
    ctx.fonts = &empty;
    RecordingSink sink;

    StreamResult result = runAnimatedStream("HI", opts_, ctx, sink);
    EXPECT_EQ(result.outcome, StreamOutcome::RenderFailed);
    EXPECT_EQ(result.errorMsg, "no fonts loaded");
    EXPECT_FALSE(sink.began);
    EXPECT_TRUE(sink.output.empty());
    EXPECT_EQ(admission.activeCount(), 0);
}

TEST_F(AnimationLoopTest, UnsupportedGlyphIsRenderFailure) {
    StreamAdmission admission(1);
    RecordingSink sink;
    StreamResult result = runAnimatedStream("\xe2\x98\x83", opts_, context(admission), sink);
    EXPECT_EQ(result.outcome, StreamOutcome::RenderFailed);
    EXPECT_NE(result.errorMsg.find("U+2603"), std::string::npos);
    EXPECT_EQ(admission.activeCount(), 0);
}

TEST_F(AnimationLoopTest, FailedWriteEndsStreamAsDisconnect) {
    config_.streaming.defaultTimeout = std::chrono::seconds(30);
    config_.streaming.maxTimeout = std::chrono::seconds(30);
    StreamAdmission admission(1);
    // clear screen + two frames succeed, the third frame fails
    RecordingSink sink(3);
    auto start = std::chrono::steady_clock::now();
    StreamResult result = runAnimatedStream("HI", opts_, context(admission), sink);

    EXPECT_EQ(result.outcome, StreamOutcome::Disconnected);
    EXPECT_EQ(result.framesSent, 2u);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_EQ(admission.activeCount(), 0);
}

TEST_F(AnimationLoopTest, CancellationStopsPromptly) {
    config_.streaming.defaultTimeout = std::chrono::seconds(30);
    config_.streaming.maxTimeout = std::chrono::seconds(30);
    config_.streaming.baseFrameInterval = std::chrono::seconds(5);
    StreamAdmission admission(2);
    CancellationSignal cancellation;
    RecordingSink sinkA;
    RecordingSink sinkB;

    StreamResult resultA;
    StreamResult resultB;
    std::thread a([&] { resultA = runAnimatedStream("HI", opts_, context(admission, &cancellation), sinkA); });
    std::thread b([&] { resultB = runAnimatedStream("HO", opts_, context(admission, &cancellation), sinkB); });

    // Both streams are parked between frames
    ASSERT_TRUE([&] {
        for (int i = 0; i < 200; i++) {
            if (framesIn(sinkA) >= 1 && framesIn(sinkB) >= 1) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }());

    auto start = std::chrono::steady_clock::now();
    cancellation.cancel();
    a.join();
    b.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    EXPECT_EQ(resultA.outcome, StreamOutcome::Cancelled);
    EXPECT_EQ(resultB.outcome, StreamOutcome::Cancelled);
    EXPECT_EQ(admission.activeCount(), 0);
    EXPECT_TRUE(admission.waitIdle(std::chrono::milliseconds(0)));
}

TEST_F(AnimationLoopTest, AlreadyCancelledStreamSendsOneFrame) {
    StreamAdmission admission(1);
    CancellationSignal cancellation;
    cancellation.cancel();
    RecordingSink sink;
    StreamResult result = runAnimatedStream("HI", opts_, context(admission, &cancellation), sink);
    EXPECT_EQ(result.outcome, StreamOutcome::Cancelled);
    EXPECT_EQ(result.framesSent, 1u);
    EXPECT_EQ(admission.activeCount(), 0);
}

TEST_F(AnimationLoopTest, ParallelStreamsRespectCapacity) {
    config_.streaming.defaultTimeout = std::chrono::milliseconds(200);
    StreamAdmission admission(2);
    std::atomic<int> rejected{0};
    std::atomic<int> completed{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; i++) {
        threads.emplace_back([&] {
            RecordingSink sink;
            StreamResult result = runAnimatedStream("HI", opts_, context(admission), sink);
            if (result.outcome == StreamOutcome::Rejected) {
                rejected++;
            } else if (result.outcome == StreamOutcome::DeadlineReached) {
                completed++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(rejected.load() + completed.load(), 6);
    EXPECT_GE(completed.load(), 2);
    EXPECT_LE(completed.load(), 6);
    EXPECT_EQ(admission.activeCount(), 0);
}
