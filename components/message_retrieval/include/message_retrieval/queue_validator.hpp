#pragma once

#include "message_retrieval/types.hpp"
#include "broker_client/channel.hpp"
#include <string>

namespace message_retrieval {

// Passive existence check run before any subscription is registered
class QueueValidator {
public:
    explicit QueueValidator(broker_client::IBrokerChannel& channel);

    // NotFoundError when the queue is missing; no retries
    broker_client::Result<QueueSnapshot> validate(const std::string& queue);

private:
    broker_client::IBrokerChannel& channel_;
};

} // namespace message_retrieval
