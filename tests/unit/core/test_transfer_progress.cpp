/**
 * @file test_transfer_progress.cpp
 * @brief Unit tests for transfer_progress and transfer_state
 */

#include <gtest/gtest.h>

#include <kcenon/tree_transfer/core/transfer_progress.h>

#include <thread>

namespace kcenon::tree_transfer::test {

class TransferProgressTest : public ::testing::Test {
protected:
    transfer_progress progress_;
};

TEST_F(TransferProgressTest, InitResetsCounters) {
    progress_.init(100);
    progress_.update_progress(30);
    progress_.init(200);

    EXPECT_EQ(progress_.total(), 200u);
    EXPECT_EQ(progress_.transferred(), 0u);
    EXPECT_DOUBLE_EQ(progress_.calc_progress(), 0.0);
}

TEST_F(TransferProgressTest, ProgressRatio) {
    progress_.init(200);
    progress_.update_progress(50);

    EXPECT_DOUBLE_EQ(progress_.calc_progress(), 0.25);
    EXPECT_EQ(progress_.calc_percentage(), 25u);
}

TEST_F(TransferProgressTest, PercentageIsRounded) {
    progress_.init(3);
    progress_.update_progress(2);

    EXPECT_EQ(progress_.calc_percentage(), 67u);
}

TEST_F(TransferProgressTest, ZeroTotalIsComplete) {
    progress_.init(0);

    EXPECT_DOUBLE_EQ(progress_.calc_progress(), 1.0);
    EXPECT_EQ(progress_.calc_percentage(), 100u);
}

TEST_F(TransferProgressTest, OverflowIsClampedInRatio) {
    progress_.init(10);
    progress_.update_progress(15);

    EXPECT_EQ(progress_.transferred(), 15u);
    EXPECT_DOUBLE_EQ(progress_.calc_progress(), 1.0);
}

TEST_F(TransferProgressTest, BytesPerSecondUsesElapsedTime) {
    progress_.init(1000);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    progress_.update_progress(1000);

    auto rate = progress_.calc_bytes_per_second();
    EXPECT_GT(rate, 0u);
    // At least 50ms elapsed, so at most 20000 B/s
    EXPECT_LE(rate, 20000u);
    EXPECT_GE(progress_.elapsed().count(), 50);
}

TEST_F(TransferProgressTest, BytesPerSecondFloorsElapsedTime) {
    progress_.init(10);
    progress_.update_progress(10);

    // Elapsed time is floored at one millisecond
    EXPECT_LE(progress_.calc_bytes_per_second(), 10000u);
}

// =============================================================================
// transfer_state Tests
// =============================================================================

class TransferStateTest : public ::testing::Test {
protected:
    transfer_state state_;
};

TEST_F(TransferStateTest, AbortFlagIsSticky) {
    EXPECT_FALSE(state_.aborted());

    state_.abort();
    EXPECT_TRUE(state_.aborted());
    state_.abort();
    EXPECT_TRUE(state_.aborted());
}

TEST_F(TransferStateTest, ResetClearsEverything) {
    state_.full.init(100);
    state_.full.update_progress(40);
    state_.partial.init(10);
    state_.partial.update_progress(10);
    state_.abort();

    state_.reset();

    EXPECT_FALSE(state_.aborted());
    EXPECT_EQ(state_.full.total(), 0u);
    EXPECT_EQ(state_.full.transferred(), 0u);
    EXPECT_EQ(state_.partial.transferred(), 0u);
}

TEST_F(TransferStateTest, AbortFromAnotherThread) {
    std::thread worker([this] { state_.abort(); });
    worker.join();

    EXPECT_TRUE(state_.aborted());
}

}  // namespace kcenon::tree_transfer::test
