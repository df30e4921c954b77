#pragma once

#include "message_retrieval/closable_queue.hpp"
#include "message_retrieval/message_sink.hpp"
#include "message_retrieval/retrieval_strategy.hpp"
#include "message_retrieval/types.hpp"
#include "broker_client/delivered_message.hpp"

namespace message_retrieval {

/**
 * @brief Consumer of the message queue
 *
 * Writes each message to the sink, then queues its acknowledgment decision.
 * Runs until the message queue is closed and drained, and always closes the
 * ack queue on the way out.
 */
class OutputStage {
public:
    OutputStage(IMessageSink& sink, const RetrievalStrategy& strategy);

    /**
     * @brief Drain messages into the sink
     * @throws OutputError if the sink fails
     */
    OutputResult run(ClosableQueue<broker_client::DeliveredMessage>& messages,
                     ClosableQueue<AckDecision>& acks);

private:
    IMessageSink& sink_;
    const RetrievalStrategy& strategy_;
};

} // namespace message_retrieval
