#include "blobfetch/range_planner.hpp"
#include "blobfetch/transfer_state.hpp"

#include <gtest/gtest.h>

using blobfetch::planChunks;
using blobfetch::TransferState;

TEST(TransferStateTest, ResumedBytesCountOnlyCompleteChunks) {
    TransferState state{3000, 1000, planChunks(3000, 1500, 1000), 1500};

    EXPECT_EQ(state.bytesAlreadyPresent(), 1500);
    EXPECT_EQ(state.resumedBytes(), 1000);
    EXPECT_EQ(state.downloadedBytes(), 1000);
    EXPECT_EQ(state.pendingChunkCount(), 2u);
    EXPECT_FALSE(state.isComplete());
}

TEST(TransferStateTest, PublishedCountersAddUp) {
    TransferState state{3000, 1000, planChunks(3000, 1000, 1000), 1000};

    state.publish(1, 400);
    state.publish(2, 250);
    EXPECT_EQ(state.bytesWritten(1), 400);
    EXPECT_EQ(state.transferredBytes(), 650);
    EXPECT_EQ(state.downloadedBytes(), 1650);

    state.publish(1, 1000);
    state.publish(2, 1000);
    EXPECT_TRUE(state.isChunkDone(1));
    EXPECT_TRUE(state.isComplete());
    EXPECT_EQ(state.downloadedBytes(), 3000);
}

TEST(TransferStateTest, OutOfRangeIndexIsIgnored) {
    TransferState state{100, 100, planChunks(100, 0, 100), 0};

    state.publish(7, 50);
    EXPECT_EQ(state.bytesWritten(7), 0);
    EXPECT_FALSE(state.isChunkDone(7));
    EXPECT_EQ(state.transferredBytes(), 0);
}

TEST(TransferStateTest, SafeResumeLengthStopsAtFirstGap) {
    TransferState state{4000, 1000, planChunks(4000, 0, 1000), 0};

    state.publish(0, 1000);
    state.publish(1, 300);
    state.publish(2, 1000);
    EXPECT_EQ(state.safeResumeLength(), 1300);

    state.publish(1, 1000);
    EXPECT_EQ(state.safeResumeLength(), 3000);
}

TEST(TransferStateTest, SafeResumeLengthKeepsExistingPrefix) {
    TransferState state{4000, 1000, planChunks(4000, 1700, 1000), 1700};

    state.publish(2, 1000);
    EXPECT_EQ(state.safeResumeLength(), 1700);

    state.publish(1, 900);
    EXPECT_EQ(state.safeResumeLength(), 1900);
}
