// test/unit/test_queue_validator.cpp
#include <gtest/gtest.h>
#include "message_retrieval/queue_validator.hpp"
#include "utils/test_utils.hpp"

using namespace message_retrieval;
using namespace message_retrieval::test;
using broker_client::ErrorType;
using broker_client::QueueInfo;
using broker_client::Result;
using ::testing::_;
using ::testing::Return;
using ::testing::StrictMock;

class QueueValidatorTest : public ::testing::Test {
protected:
    StrictMock<MockBrokerChannel> channel_;
};

TEST_F(QueueValidatorTest, ExistingQueue) {
    QueueInfo info;
    info.name = "orders";
    info.messageCount = 12;
    info.consumerCount = 2;
    EXPECT_CALL(channel_, queueDeclarePassive("orders")).WillOnce(Return(Result<QueueInfo>(info)));

    QueueValidator validator(channel_);
    auto snapshot = validator.validate("orders");

    ASSERT_TRUE(snapshot);
    EXPECT_TRUE(snapshot->exists);
    EXPECT_EQ("orders", snapshot->queue);
    EXPECT_EQ(12u, snapshot->messageCount);
    EXPECT_EQ(2u, snapshot->consumerCount);
}

TEST_F(QueueValidatorTest, MissingQueue) {
    EXPECT_CALL(channel_, queueDeclarePassive("missing"))
        .WillOnce(Return(Result<QueueInfo>(ErrorType::NotFoundError, "NOT_FOUND - no queue 'missing'")));

    QueueValidator validator(channel_);
    auto snapshot = validator.validate("missing");

    EXPECT_FALSE(snapshot);
    EXPECT_EQ(ErrorType::NotFoundError, snapshot.error);
}

TEST_F(QueueValidatorTest, BrokerFailureIsPassedThrough) {
    EXPECT_CALL(channel_, queueDeclarePassive("orders"))
        .WillOnce(Return(Result<QueueInfo>(ErrorType::NetworkError, "Socket error")));

    QueueValidator validator(channel_);
    auto snapshot = validator.validate("orders");

    EXPECT_FALSE(snapshot);
    EXPECT_EQ(ErrorType::NetworkError, snapshot.error);
    EXPECT_EQ("Socket error", snapshot.message);
}

TEST_F(QueueValidatorTest, EmptyNameNeverReachesBroker) {
    EXPECT_CALL(channel_, queueDeclarePassive(_)).Times(0);

    QueueValidator validator(channel_);
    auto snapshot = validator.validate("");

    EXPECT_FALSE(snapshot);
    EXPECT_EQ(ErrorType::NotFoundError, snapshot.error);
}
