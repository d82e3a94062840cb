#include <gtest/gtest.h>
#include <utility>
#include <vector>
#include "core/Debouncer.hpp"

TEST(DebouncerTest, StartsUnknown) {
    core::Debouncer d(3);
    EXPECT_EQ(d.stableValue(), core::GESTURE_UNKNOWN);
    EXPECT_FALSE(d.isKnown());
    EXPECT_EQ(d.consecutiveCount(), 0);
}

TEST(DebouncerTest, PromotesAfterKConsecutiveFrames) {
    core::Debouncer d(3);
    EXPECT_EQ(d.update(2), core::GESTURE_UNKNOWN);
    EXPECT_EQ(d.update(2), core::GESTURE_UNKNOWN);
    EXPECT_EQ(d.update(2), 2);
    EXPECT_TRUE(d.isKnown());
}

TEST(DebouncerTest, SingleDisagreementRestartsClockWithoutChangingStable) {
    core::Debouncer d(3);
    for (int i = 0; i < 3; ++i) d.update(4);
    ASSERT_EQ(d.stableValue(), 4);

    EXPECT_EQ(d.update(1), 4);
    EXPECT_EQ(d.candidateValue(), 1);
    EXPECT_EQ(d.consecutiveCount(), 1);

    // Back to the old value: it has to be re-observed, stable never moved
    EXPECT_EQ(d.update(4), 4);
    EXPECT_EQ(d.consecutiveCount(), 1);

    // Flicker never promotes
    for (int i = 0; i < 10; ++i) {
        d.update(i % 2 == 0 ? 1 : 2);
        EXPECT_EQ(d.stableValue(), 4);
    }
}

TEST(DebouncerTest, CallbackFiresOnlyOnChange) {
    core::Debouncer d(2);
    std::vector<std::pair<int, int>> changes;
    d.setChangeCallback([&](int from, int to) { changes.emplace_back(from, to); });

    d.update(1);
    d.update(1);
    d.update(1);
    d.update(1);
    d.update(3);
    d.update(3);

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0], std::make_pair(core::GESTURE_UNKNOWN, 1));
    EXPECT_EQ(changes[1], std::make_pair(1, 3));
}

TEST(DebouncerTest, ResetReturnsToSentinel) {
    core::Debouncer d(3);
    for (int i = 0; i < 5; ++i) d.update(5);
    d.reset();
    EXPECT_EQ(d.stableValue(), core::GESTURE_UNKNOWN);
    EXPECT_EQ(d.candidateValue(), core::GESTURE_UNKNOWN);
    EXPECT_EQ(d.consecutiveCount(), 0);

    // Needs the full K frames again
    d.update(5);
    d.update(5);
    EXPECT_FALSE(d.isKnown());
    d.update(5);
    EXPECT_EQ(d.stableValue(), 5);
}

TEST(DebouncerTest, RequiredFramesClampedToOne) {
    core::Debouncer d(0);
    EXPECT_EQ(d.requiredFrames(), 1);
    EXPECT_EQ(d.update(2), 2);
}
