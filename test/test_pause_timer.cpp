#include <gtest/gtest.h>
#include <vector>
#include "PauseTimer.hpp"
#include "TestHelpers.hpp"

TEST(PauseTimerTest, EmitsImmediatelyOnStart) {
    PauseTimer timer;
    int64_t elapsed = -1;
    timer.start(BASE_EPOCH_MS);
    ASSERT_TRUE(timer.poll(BASE_EPOCH_MS, elapsed));
    EXPECT_EQ(elapsed, 0);
}

TEST(PauseTimerTest, EmitsOncePerInterval) {
    PauseTimer timer;
    int64_t elapsed = 0;
    timer.start(BASE_EPOCH_MS);
    timer.poll(BASE_EPOCH_MS, elapsed);

    EXPECT_FALSE(timer.poll(BASE_EPOCH_MS + 500, elapsed));
    ASSERT_TRUE(timer.poll(BASE_EPOCH_MS + 1000, elapsed));
    EXPECT_EQ(elapsed, 1000);
    EXPECT_FALSE(timer.poll(BASE_EPOCH_MS + 1700, elapsed));
    ASSERT_TRUE(timer.poll(BASE_EPOCH_MS + 2000, elapsed));
    EXPECT_EQ(elapsed, 2000);
}

TEST(PauseTimerTest, SlightlyEarlyTicksKeepOneSecondCadence) {
    PauseTimer timer;
    int64_t elapsed = 0;
    timer.start(BASE_EPOCH_MS);

    std::vector<int64_t> emitted;
    for (int64_t t = BASE_EPOCH_MS; t <= BASE_EPOCH_MS + 10000; t += 995) {
        if (timer.poll(t, elapsed)) {
            emitted.push_back(elapsed);
        }
    }
    // 0, 995, 1990, ... 9950
    ASSERT_EQ(emitted.size(), 11u);
    for (size_t i = 1; i < emitted.size(); i++) {
        EXPECT_EQ(emitted[i] - emitted[i - 1], 995);
    }
}

TEST(PauseTimerTest, LateTicksDoNotDoubleEmit) {
    PauseTimer timer;
    int64_t elapsed = 0;
    timer.start(BASE_EPOCH_MS);
    timer.poll(BASE_EPOCH_MS, elapsed);

    ASSERT_TRUE(timer.poll(BASE_EPOCH_MS + 1150, elapsed));
    EXPECT_EQ(elapsed, 1150);
    EXPECT_FALSE(timer.poll(BASE_EPOCH_MS + 1700, elapsed));
    ASSERT_TRUE(timer.poll(BASE_EPOCH_MS + 2050, elapsed));
    EXPECT_EQ(elapsed, 2050);
}

TEST(PauseTimerTest, ElapsedIsComputedFromStartNotTicks) {
    PauseTimer timer;
    int64_t elapsed = 0;
    timer.start(BASE_EPOCH_MS);
    timer.poll(BASE_EPOCH_MS, elapsed);
    // ポーリングが遅れても経過時間はずれない
    ASSERT_TRUE(timer.poll(BASE_EPOCH_MS + 12345, elapsed));
    EXPECT_EQ(elapsed, 12345);
}

TEST(PauseTimerTest, ResubscribeEmitsCurrentValueImmediately) {
    PauseTimer timer;
    int64_t elapsed = 0;
    timer.start(BASE_EPOCH_MS);
    timer.poll(BASE_EPOCH_MS + 3000, elapsed);
    EXPECT_FALSE(timer.poll(BASE_EPOCH_MS + 3200, elapsed));

    timer.resubscribe();
    ASSERT_TRUE(timer.poll(BASE_EPOCH_MS + 3200, elapsed));
    EXPECT_EQ(elapsed, 3200);
}

TEST(PauseTimerTest, StopEndsEmissions) {
    PauseTimer timer;
    int64_t elapsed = 0;
    timer.start(BASE_EPOCH_MS);
    timer.stop();
    EXPECT_FALSE(timer.isRunning());
    EXPECT_FALSE(timer.poll(BASE_EPOCH_MS + 5000, elapsed));
    EXPECT_EQ(timer.elapsed(BASE_EPOCH_MS + 5000), 0);

    timer.resubscribe();
    EXPECT_FALSE(timer.poll(BASE_EPOCH_MS + 6000, elapsed));
}
