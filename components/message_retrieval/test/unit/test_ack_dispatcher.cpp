// test/unit/test_ack_dispatcher.cpp
#include <gtest/gtest.h>
#include "message_retrieval/ack_dispatcher.hpp"
#include "utils/test_utils.hpp"
#include <chrono>
#include <future>
#include <thread>

using namespace message_retrieval;
using namespace message_retrieval::test;
using broker_client::ErrorType;
using broker_client::Result;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::StrictMock;

class AckDispatcherTest : public ::testing::Test {
protected:
    StrictMock<MockBrokerChannel> channel_;
    ClosableQueue<AckDecision> acks_;
};

TEST_F(AckDispatcherTest, MapsOutcomesToBrokerCalls) {
    {
        InSequence sequence;
        EXPECT_CALL(channel_, basicAck(1)).WillOnce(Return(Result<void>()));
        EXPECT_CALL(channel_, basicNack(2, false)).WillOnce(Return(Result<void>()));
        EXPECT_CALL(channel_, basicNack(3, true)).WillOnce(Return(Result<void>()));
    }

    acks_.push(AckDecision{1, AckMode::Ack});
    acks_.push(AckDecision{2, AckMode::Reject});
    acks_.push(AckDecision{3, AckMode::Requeue});
    acks_.close();

    AckDispatcher dispatcher(channel_);
    auto stats = dispatcher.run(acks_);

    EXPECT_EQ(3u, stats.dispatched);
    EXPECT_EQ(0u, stats.failed);
}

TEST_F(AckDispatcherTest, ContinuesAfterFailure) {
    {
        InSequence sequence;
        EXPECT_CALL(channel_, basicAck(1)).WillOnce(Return(Result<void>()));
        EXPECT_CALL(channel_, basicAck(2)).WillOnce(Return(Result<void>(ErrorType::NetworkError, "Socket error")));
        EXPECT_CALL(channel_, basicAck(3)).WillOnce(Return(Result<void>()));
    }

    for (uint64_t tag = 1; tag <= 3; ++tag) {
        acks_.push(AckDecision{tag, AckMode::Ack});
    }
    acks_.close();

    AckDispatcher dispatcher(channel_);
    auto stats = dispatcher.run(acks_);

    EXPECT_EQ(2u, stats.dispatched);
    EXPECT_EQ(1u, stats.failed);
}

TEST_F(AckDispatcherTest, WaitsForDecisionsUntilClosed) {
    EXPECT_CALL(channel_, basicAck(7)).WillOnce(Return(Result<void>()));

    AckDispatcher dispatcher(channel_);
    auto task = std::async(std::launch::async, [&dispatcher, this] { return dispatcher.run(acks_); });

    acks_.push(AckDecision{7, AckMode::Ack});
    acks_.close();

    auto stats = task.get();
    EXPECT_EQ(1u, stats.dispatched);
}

TEST_F(AckDispatcherTest, HoldsRequeuesUntilQueueCloses) {
    {
        InSequence sequence;
        EXPECT_CALL(channel_, basicAck(1)).WillOnce(Return(Result<void>()));
        EXPECT_CALL(channel_, basicNack(2, true)).WillOnce([this](uint64_t, bool) {
            EXPECT_TRUE(acks_.isClosed());
            return Result<void>();
        });
        // Decisions behind a held requeue keep their order
        EXPECT_CALL(channel_, basicAck(3)).WillOnce([this](uint64_t) {
            EXPECT_TRUE(acks_.isClosed());
            return Result<void>();
        });
    }

    AckDispatcher dispatcher(channel_);
    auto task = std::async(std::launch::async, [&dispatcher, this] { return dispatcher.run(acks_); });

    acks_.push(AckDecision{1, AckMode::Ack});
    acks_.push(AckDecision{2, AckMode::Requeue});
    acks_.push(AckDecision{3, AckMode::Ack});
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    acks_.close();

    auto stats = task.get();
    EXPECT_EQ(3u, stats.dispatched);
    EXPECT_EQ(0u, stats.failed);
}
