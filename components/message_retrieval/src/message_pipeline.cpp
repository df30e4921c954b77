#include "message_retrieval/message_pipeline.hpp"
#include <spdlog/spdlog.h>

namespace message_retrieval {

MessagePipeline::MessagePipeline(IMessageSink& sink, broker_client::IBrokerChannel& channel,
                                 const RetrievalStrategy& strategy)
    : outputStage_(sink, strategy), ackDispatcher_(channel) {
}

void MessagePipeline::start(ClosableQueue<broker_client::DeliveredMessage>& messages,
                            ClosableQueue<AckDecision>& acks) {
    spdlog::debug("Starting message pipeline");

    ackTask_ = std::async(std::launch::async, [this, &acks] {
        return ackDispatcher_.run(acks);
    });

    outputTask_ = std::async(std::launch::async, [this, &messages, &acks] {
        return outputStage_.run(messages, acks);
    });
}

OutputResult MessagePipeline::wait() {
    // The output stage closes the ack queue even when it fails, so the
    // dispatcher always finishes first or alongside it
    if (ackTask_.valid()) {
        ackStats_ = ackTask_.get();
    }

    if (!outputTask_.valid()) {
        return OutputResult{};
    }
    return outputTask_.get();
}

} // namespace message_retrieval
