#pragma once

#include "message_retrieval/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace message_retrieval {

// Prefetch used by consume when none is given
constexpr uint16_t kDefaultPrefetchCount = 100;

/**
 * @brief Retrieval policy resolved once from the mode and options
 *
 * Holds the effective prefetch and the acknowledgment outcome applied to
 * every processed message.
 */
class RetrievalStrategy {
public:
    /**
     * @brief Resolve the policy for a run
     * @throws ConfigurationError for an explicit nonzero prefetch combined with requeue
     */
    static RetrievalStrategy resolve(RetrievalMode mode, const RetrievalOptions& options);

    RetrievalMode mode() const { return mode_; }
    uint16_t prefetchCount() const { return prefetchCount_; }
    AckMode ackOutcome() const { return ackOutcome_; }

    // Non-fatal notices to show before retrieval starts
    const std::vector<std::string>& warnings() const { return warnings_; }

    AckDecision decide(uint64_t deliveryTag) const { return AckDecision{deliveryTag, ackOutcome_}; }

private:
    RetrievalStrategy(RetrievalMode mode, uint16_t prefetchCount, AckMode ackOutcome);

    static RetrievalStrategy resolveConsume(const RetrievalOptions& options);
    static RetrievalStrategy resolvePeek(const RetrievalOptions& options);

    RetrievalMode mode_;
    uint16_t prefetchCount_;
    AckMode ackOutcome_;
    std::vector<std::string> warnings_;
};

} // namespace message_retrieval
