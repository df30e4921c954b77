#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace message_retrieval {

// Outcome sent back to the broker for one processed message
enum class AckMode {
    Ack,        // remove from the queue
    Reject,     // discard (nack without requeue)
    Requeue     // return to the queue (nack with requeue)
};

// Destructive (consume) or non-destructive (peek) retrieval
enum class RetrievalMode {
    Consume,
    Peek
};

// Why the pipeline stopped accepting deliveries
enum class ShutdownReason {
    None,
    UserCancelled,
    MessageLimitReached,
    OutputFailure,
    ConsumerLost
};

struct AckDecision {
    uint64_t deliveryTag{0};
    AckMode outcome{AckMode::Ack};
};

struct RetrievalOptions {
    std::string queue;
    AckMode ackMode{AckMode::Ack};
    int64_t messageCountLimit{-1};          // <= 0 means unbounded
    std::optional<uint16_t> prefetchCount;  // 0 means unlimited

    bool hasMessageLimit() const { return messageCountLimit > 0; }
};

// Point-in-time view of a queue taken before retrieval starts
struct QueueSnapshot {
    bool exists{false};
    std::string queue;
    uint64_t messageCount{0};
    uint64_t consumerCount{0};
};

struct OutputResult {
    uint64_t processedCount{0};
    uint64_t totalBytes{0};
};

struct AckStats {
    uint64_t dispatched{0};
    uint64_t failed{0};
};

struct RetrievalResult {
    std::string queue;
    RetrievalMode mode{RetrievalMode::Consume};
    AckMode ackMode{AckMode::Ack};
    uint16_t prefetchCount{0};

    uint64_t messagesReceived{0};
    uint64_t messagesProcessed{0};
    uint64_t messagesSkipped{0};    // delivered after shutdown began; the broker redelivers them
    uint64_t totalBytes{0};
    uint64_t acksFailed{0};

    bool cancelledByUser{false};
    ShutdownReason shutdownReason{ShutdownReason::None};
    std::chrono::milliseconds elapsed{0};
};

// String conversions
std::string ackModeToString(AckMode mode);
std::optional<AckMode> ackModeFromString(const std::string& value);
std::string retrievalModeToString(RetrievalMode mode);
std::string shutdownReasonToString(ShutdownReason reason);

} // namespace message_retrieval
