#include <gtest/gtest.h>
#include "utils/log.h"
#include "utils/shutdown_signal.h"
#include <csignal>
#include <mutex>

using namespace meshcore::utils;

class ShutdownSignalTest : public ::testing::Test {
protected:
    void SetUp() override {
        ShutdownSignal::reset();
        ShutdownSignal::install({SIGUSR1});
    }

    void TearDown() override {
        std::signal(SIGUSR1, SIG_DFL);
        ShutdownSignal::reset();
    }
};

TEST_F(ShutdownSignalTest, SignalRequestsShutdown) {
    EXPECT_FALSE(ShutdownSignal::requested());

    ASSERT_EQ(0, std::raise(SIGUSR1));

    EXPECT_TRUE(ShutdownSignal::requested());
    EXPECT_EQ(SIGUSR1, ShutdownSignal::signalNumber());
}

TEST_F(ShutdownSignalTest, HandlerDoesNotTakeLogMutex) {
    // The handler runs on this thread while it holds the log mutex
    std::lock_guard<std::mutex> lock(logMutex());
    ASSERT_EQ(0, std::raise(SIGUSR1));

    EXPECT_TRUE(ShutdownSignal::requested());
}

TEST_F(ShutdownSignalTest, ExplicitRequestHasNoSignal) {
    ShutdownSignal::request();

    EXPECT_TRUE(ShutdownSignal::requested());
    EXPECT_EQ(0, ShutdownSignal::signalNumber());
}
