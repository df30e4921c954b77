#include "message_retrieval/ack_dispatcher.hpp"
#include <spdlog/spdlog.h>

namespace message_retrieval {

AckDispatcher::AckDispatcher(broker_client::IBrokerChannel& channel)
    : channel_(channel) {
}

AckStats AckDispatcher::run(ClosableQueue<AckDecision>& acks) {
    AckStats stats;
    std::deque<AckDecision> held;

    while (auto decision = acks.pop()) {
        if (decision->outcome == AckMode::Requeue || !held.empty()) {
            held.push_back(*decision);
            continue;
        }
        send(*decision, stats);
    }

    if (!held.empty()) {
        spdlog::debug("Releasing {} held decision(s) after unsubscribe", held.size());
    }
    for (const auto& decision : held) {
        send(decision, stats);
    }

    spdlog::debug("Ack dispatcher finished: {} sent, {} failed", stats.dispatched, stats.failed);
    return stats;
}

void AckDispatcher::send(const AckDecision& decision, AckStats& stats) {
    auto result = dispatch(decision);
    if (!result) {
        ++stats.failed;
        spdlog::warn("Failed to {} message {}: {}", ackModeToString(decision.outcome),
                     decision.deliveryTag, result.message);
        return;
    }

    ++stats.dispatched;
    spdlog::trace("{} delivery {}", ackModeToString(decision.outcome), decision.deliveryTag);
}

broker_client::Result<void> AckDispatcher::dispatch(const AckDecision& decision) {
    switch (decision.outcome) {
        case AckMode::Ack:
            return channel_.basicAck(decision.deliveryTag);
        case AckMode::Reject:
            return channel_.basicNack(decision.deliveryTag, false);
        case AckMode::Requeue:
            return channel_.basicNack(decision.deliveryTag, true);
        default:
            return broker_client::Result<void>(broker_client::ErrorType::ProtocolError, "Unknown ack mode");
    }
}

} // namespace message_retrieval
