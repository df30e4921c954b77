#pragma once

#include "broker_client/delivered_message.hpp"

namespace message_retrieval {

/**
 * @brief Destination for retrieved messages
 *
 * Called from a single thread. Any exception thrown is fatal to the run.
 */
class IMessageSink {
public:
    virtual ~IMessageSink() = default;

    virtual void write(const broker_client::DeliveredMessage& message) = 0;

    // Called once after the last message
    virtual void flush() {}
};

} // namespace message_retrieval
