#include "message_retrieval/queue_validator.hpp"
#include <spdlog/spdlog.h>

namespace message_retrieval {

QueueValidator::QueueValidator(broker_client::IBrokerChannel& channel)
    : channel_(channel) {
}

broker_client::Result<QueueSnapshot> QueueValidator::validate(const std::string& queue) {
    using broker_client::ErrorType;
    using broker_client::Result;

    if (queue.empty()) {
        return Result<QueueSnapshot>(ErrorType::NotFoundError, "Queue name is empty");
    }

    auto info = channel_.queueDeclarePassive(queue);
    if (!info) {
        if (info.error == ErrorType::NotFoundError) {
            spdlog::debug("Queue {} does not exist", queue);
        } else {
            spdlog::error("Failed to inspect queue {}: {}", queue, info.message);
        }
        return Result<QueueSnapshot>(info.error, info.message);
    }

    QueueSnapshot snapshot;
    snapshot.exists = true;
    snapshot.queue = info->name.empty() ? queue : info->name;
    snapshot.messageCount = info->messageCount;
    snapshot.consumerCount = info->consumerCount;

    spdlog::debug("Queue {} has {} message(s) and {} consumer(s)", snapshot.queue,
                  snapshot.messageCount, snapshot.consumerCount);
    return Result<QueueSnapshot>(snapshot);
}

} // namespace message_retrieval
