#include "message_retrieval/retrieval_strategy.hpp"
#include "message_retrieval/error.hpp"
#include <spdlog/spdlog.h>

namespace message_retrieval {

RetrievalStrategy::RetrievalStrategy(RetrievalMode mode, uint16_t prefetchCount, AckMode ackOutcome)
    : mode_(mode), prefetchCount_(prefetchCount), ackOutcome_(ackOutcome) {
}

RetrievalStrategy RetrievalStrategy::resolve(RetrievalMode mode, const RetrievalOptions& options) {
    switch (mode) {
        case RetrievalMode::Peek:
            return resolvePeek(options);
        case RetrievalMode::Consume:
        default:
            return resolveConsume(options);
    }
}

RetrievalStrategy RetrievalStrategy::resolveConsume(const RetrievalOptions& options) {
    if (options.ackMode != AckMode::Requeue) {
        RetrievalStrategy strategy(RetrievalMode::Consume,
                                   options.prefetchCount.value_or(kDefaultPrefetchCount),
                                   options.ackMode);
        spdlog::debug("Consume strategy: prefetch {}, ack mode {}", strategy.prefetchCount_,
                      ackModeToString(strategy.ackOutcome_));
        return strategy;
    }

    // Requeue always runs with unlimited prefetch
    if (options.prefetchCount && *options.prefetchCount != 0) {
        throw ConfigurationError("prefetch count " + std::to_string(*options.prefetchCount) +
                                 " cannot be combined with the requeue ack mode");
    }

    RetrievalStrategy strategy(RetrievalMode::Consume, 0, AckMode::Requeue);
    if (!options.hasMessageLimit()) {
        strategy.warnings_.push_back(
            "Using requeue mode without a message count may lead to memory issues due to "
            "unacknowledged messages accumulating (unbound buffer growth).");
    }

    spdlog::debug("Consume strategy: prefetch 0 (requeue), ack mode Requeue");
    return strategy;
}

RetrievalStrategy RetrievalStrategy::resolvePeek(const RetrievalOptions& options) {
    if (options.prefetchCount && *options.prefetchCount != 0) {
        spdlog::debug("Ignoring prefetch count {} in peek mode", *options.prefetchCount);
    }

    RetrievalStrategy strategy(RetrievalMode::Peek, 0, AckMode::Requeue);
    if (!options.hasMessageLimit()) {
        strategy.warnings_.push_back(
            "Peeking without a message count; stopping after the messages present in the queue at start.");
    }

    spdlog::debug("Peek strategy: prefetch 0, every message requeued");
    return strategy;
}

} // namespace message_retrieval
