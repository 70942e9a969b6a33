#include "blobfetch/progress_reporter.hpp"
#include "blobfetch/range_planner.hpp"

#include <chrono>
#include <sstream>
#include <string>
#include <thread>

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using blobfetch::planChunks;
using blobfetch::ProgressReporter;
using blobfetch::TransferState;

TEST(ProgressReporterTest, FinishRendersCompletion) {
    TransferState state{4096, 1024, planChunks(4096, 1024, 1024), 1024};
    std::ostringstream out;

    ProgressReporter reporter{state, out, 10ms};
    reporter.start();
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (reporter.renderCount() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_GE(reporter.renderCount(), 1u);
    state.publish(1, 1024);
    std::this_thread::sleep_for(30ms);
    state.publish(2, 1024);
    state.publish(3, 1024);
    reporter.finish();

    const auto text = out.str();
    EXPECT_GE(reporter.renderCount(), 1u);
    EXPECT_NE(text.find("Downloaded: 4.00 KB/4.00 KB | 100.00%"), std::string::npos);
    EXPECT_EQ(text.front(), '\r');
    EXPECT_EQ(text.back(), '\n');
}

TEST(ProgressReporterTest, StopsOnItsOwnWhenComplete) {
    TransferState state{100, 100, planChunks(100, 0, 100), 0};
    state.publish(0, 100);
    std::ostringstream out;

    ProgressReporter reporter{state, out, 1h};
    reporter.start();
    reporter.finish();

    EXPECT_EQ(reporter.renderCount(), 1u);
    EXPECT_NE(out.str().find("100.00%"), std::string::npos);
}

TEST(ProgressReporterTest, StopDoesNotWaitForTick) {
    TransferState state{100, 100, planChunks(100, 0, 100), 0};
    std::ostringstream out;

    ProgressReporter reporter{state, out, 1h};
    reporter.start();
    const auto before = std::chrono::steady_clock::now();
    reporter.stop();

    EXPECT_LT(std::chrono::steady_clock::now() - before, 5s);
    EXPECT_EQ(out.str().find("100.00%"), std::string::npos);
    EXPECT_EQ(out.str().back(), '\n');
}

TEST(ProgressReporterTest, SampleReadsSharedState) {
    TransferState state{1000, 500, planChunks(1000, 500, 500), 500};
    std::ostringstream out;
    ProgressReporter reporter{state, out};

    state.publish(1, 250);
    const auto sample = reporter.sample();
    EXPECT_EQ(sample.total_bytes, 1000);
    EXPECT_EQ(sample.downloaded_bytes, 750);
    EXPECT_DOUBLE_EQ(sample.percent, 75.0);
}
