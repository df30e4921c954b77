// test/unit/test_signal_cancellation.cpp
#include <gtest/gtest.h>
#include "rmq_cli/signal_cancellation.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <thread>

using namespace rmq_cli;
using message_retrieval::CancellationSource;

namespace {

bool waitForCancel(const CancellationSource& cancellation) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!cancellation.isCancelled()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

} // namespace

TEST(SignalCancellationTest, FirstSignalRequestsCancellation) {
    CancellationSource cancellation;
    SignalCancellation signals(cancellation);

    std::raise(SIGTERM);

    EXPECT_TRUE(waitForCancel(cancellation));
}

TEST(SignalCancellationTest, NoSignalLeavesSourceUntouched) {
    CancellationSource cancellation;
    {
        SignalCancellation signals(cancellation);
    }
    EXPECT_FALSE(cancellation.isCancelled());
}

TEST(SignalCancellationDeathTest, SecondSignalForcesExit) {
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";

    EXPECT_EXIT({
        CancellationSource cancellation;
        SignalCancellation signals(cancellation);
        std::raise(SIGINT);
        if (!waitForCancel(cancellation)) {
            std::exit(2);
        }
        std::raise(SIGINT);
        std::this_thread::sleep_for(std::chrono::seconds(5));
        std::exit(0);
    }, ::testing::ExitedWithCode(128 + SIGINT), "");
}
