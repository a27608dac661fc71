#include "chunkup/core/cancellation.hpp"
#include "chunkup/core/logging.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace chunkup;

TEST(CancellationTokenTest, StartsClear) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_EQ(token.reason(), CancellationToken::Reason::None);
    EXPECT_TRUE(token.wait_for(std::chrono::milliseconds(1)));
}

TEST(CancellationTokenTest, CancelWakesWaiter) {
    CancellationToken token;

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    bool slept = token.wait_for(std::chrono::seconds(10));
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_FALSE(slept);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(stop_error(token).code, ErrorCode::Cancelled);
}

TEST(CancellationTokenTest, InterruptReportsInterrupted) {
    CancellationToken token;
    token.interrupt();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_EQ(stop_error(token).code, ErrorCode::Interrupted);
}

TEST(CancellationTokenTest, CancelOverridesInterrupt) {
    CancellationToken token;
    token.interrupt();
    token.cancel();
    EXPECT_EQ(token.reason(), CancellationToken::Reason::Cancelled);

    CancellationToken other;
    other.cancel();
    other.interrupt();
    EXPECT_EQ(other.reason(), CancellationToken::Reason::Cancelled);
}

TEST(LoggingTest, RejectsUnknownLevel) {
    EXPECT_TRUE(configure_logging("warn").is_ok());
    auto bad = configure_logging("chatty");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidState);
    EXPECT_TRUE(configure_logging("info").is_ok());
}
