// test/unit/test_retrieval_strategy.cpp
#include <gtest/gtest.h>
#include "message_retrieval/error.hpp"
#include "message_retrieval/retrieval_strategy.hpp"

using namespace message_retrieval;

namespace {

RetrievalOptions makeOptions(AckMode ackMode, int64_t limit = -1,
                             std::optional<uint16_t> prefetch = std::nullopt) {
    RetrievalOptions options;
    options.queue = "orders";
    options.ackMode = ackMode;
    options.messageCountLimit = limit;
    options.prefetchCount = prefetch;
    return options;
}

} // namespace

TEST(RetrievalStrategyTest, ConsumeDefaultsPrefetch) {
    auto strategy = RetrievalStrategy::resolve(RetrievalMode::Consume, makeOptions(AckMode::Ack));

    EXPECT_EQ(RetrievalMode::Consume, strategy.mode());
    EXPECT_EQ(kDefaultPrefetchCount, strategy.prefetchCount());
    EXPECT_EQ(AckMode::Ack, strategy.ackOutcome());
    EXPECT_TRUE(strategy.warnings().empty());
}

TEST(RetrievalStrategyTest, ConsumeKeepsExplicitPrefetch) {
    auto strategy = RetrievalStrategy::resolve(RetrievalMode::Consume, makeOptions(AckMode::Reject, 10, 25));

    EXPECT_EQ(25, strategy.prefetchCount());
    EXPECT_EQ(AckMode::Reject, strategy.ackOutcome());
}

TEST(RetrievalStrategyTest, ConsumeAllowsUnlimitedPrefetch) {
    auto strategy = RetrievalStrategy::resolve(RetrievalMode::Consume, makeOptions(AckMode::Ack, 10, 0));
    EXPECT_EQ(0, strategy.prefetchCount());
}

TEST(RetrievalStrategyTest, RequeueForcesUnlimitedPrefetch) {
    auto strategy = RetrievalStrategy::resolve(RetrievalMode::Consume, makeOptions(AckMode::Requeue, 5));

    EXPECT_EQ(0, strategy.prefetchCount());
    EXPECT_EQ(AckMode::Requeue, strategy.ackOutcome());
    EXPECT_TRUE(strategy.warnings().empty());
}

TEST(RetrievalStrategyTest, RequeueAcceptsExplicitZeroPrefetch) {
    auto strategy = RetrievalStrategy::resolve(RetrievalMode::Consume, makeOptions(AckMode::Requeue, 5, 0));
    EXPECT_EQ(0, strategy.prefetchCount());
}

TEST(RetrievalStrategyTest, RequeueRejectsExplicitPrefetch) {
    EXPECT_THROW(RetrievalStrategy::resolve(RetrievalMode::Consume, makeOptions(AckMode::Requeue, 5, 10)),
                 ConfigurationError);

    try {
        RetrievalStrategy::resolve(RetrievalMode::Consume, makeOptions(AckMode::Requeue, 5, 10));
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("prefetch count 10"));
    }
}

TEST(RetrievalStrategyTest, UnboundedRequeueWarns) {
    auto strategy = RetrievalStrategy::resolve(RetrievalMode::Consume, makeOptions(AckMode::Requeue));

    ASSERT_EQ(1u, strategy.warnings().size());
    EXPECT_NE(std::string::npos, strategy.warnings()[0].find("unbound buffer growth"));
}

TEST(RetrievalStrategyTest, PeekAlwaysRequeues) {
    auto strategy = RetrievalStrategy::resolve(RetrievalMode::Peek, makeOptions(AckMode::Ack, 3, 50));

    EXPECT_EQ(RetrievalMode::Peek, strategy.mode());
    EXPECT_EQ(0, strategy.prefetchCount());
    EXPECT_EQ(AckMode::Requeue, strategy.ackOutcome());
    EXPECT_TRUE(strategy.warnings().empty());
}

TEST(RetrievalStrategyTest, UnboundedPeekWarns) {
    auto strategy = RetrievalStrategy::resolve(RetrievalMode::Peek, makeOptions(AckMode::Requeue));
    EXPECT_EQ(1u, strategy.warnings().size());
}

TEST(RetrievalStrategyTest, DecideAppliesOutcome) {
    auto strategy = RetrievalStrategy::resolve(RetrievalMode::Consume, makeOptions(AckMode::Reject));
    auto decision = strategy.decide(42);

    EXPECT_EQ(42u, decision.deliveryTag);
    EXPECT_EQ(AckMode::Reject, decision.outcome);
}

TEST(RetrievalTypesTest, AckModeStrings) {
    EXPECT_EQ("Ack", ackModeToString(AckMode::Ack));
    EXPECT_EQ("Reject", ackModeToString(AckMode::Reject));
    EXPECT_EQ("Requeue", ackModeToString(AckMode::Requeue));

    EXPECT_EQ(AckMode::Ack, ackModeFromString("ack"));
    EXPECT_EQ(AckMode::Reject, ackModeFromString("REJECT"));
    EXPECT_EQ(AckMode::Requeue, ackModeFromString("Requeue"));
    EXPECT_FALSE(ackModeFromString("drop").has_value());
}

TEST(RetrievalTypesTest, ModeAndReasonStrings) {
    EXPECT_EQ("consume", retrievalModeToString(RetrievalMode::Consume));
    EXPECT_EQ("peek", retrievalModeToString(RetrievalMode::Peek));
    EXPECT_EQ("User cancellation (Ctrl+C)", shutdownReasonToString(ShutdownReason::UserCancelled));
    EXPECT_EQ("Message count limit reached", shutdownReasonToString(ShutdownReason::MessageLimitReached));
    EXPECT_EQ("Subscription ended by the broker", shutdownReasonToString(ShutdownReason::ConsumerLost));
}

TEST(RetrievalTypesTest, MessageLimit) {
    RetrievalOptions options;
    EXPECT_FALSE(options.hasMessageLimit());

    options.messageCountLimit = 0;
    EXPECT_FALSE(options.hasMessageLimit());

    options.messageCountLimit = 1;
    EXPECT_TRUE(options.hasMessageLimit());
}
