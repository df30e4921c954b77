#pragma once

#include "message_retrieval/ack_dispatcher.hpp"
#include "message_retrieval/output_stage.hpp"
#include <future>

namespace message_retrieval {

// Runs the output stage and the ack dispatcher as two background tasks
class MessagePipeline {
public:
    MessagePipeline(IMessageSink& sink, broker_client::IBrokerChannel& channel,
                    const RetrievalStrategy& strategy);

    MessagePipeline(const MessagePipeline&) = delete;
    MessagePipeline& operator=(const MessagePipeline&) = delete;

    void start(ClosableQueue<broker_client::DeliveredMessage>& messages,
               ClosableQueue<AckDecision>& acks);

    // Blocks until both tasks finish; rethrows an output failure
    OutputResult wait();

    AckStats ackStats() const { return ackStats_; }

private:
    OutputStage outputStage_;
    AckDispatcher ackDispatcher_;

    std::future<OutputResult> outputTask_;
    std::future<AckStats> ackTask_;
    AckStats ackStats_;
};

} // namespace message_retrieval
