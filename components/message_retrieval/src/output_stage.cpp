#include "message_retrieval/output_stage.hpp"
#include "message_retrieval/error.hpp"
#include <spdlog/spdlog.h>

namespace message_retrieval {

OutputStage::OutputStage(IMessageSink& sink, const RetrievalStrategy& strategy)
    : sink_(sink), strategy_(strategy) {
}

OutputResult OutputStage::run(ClosableQueue<broker_client::DeliveredMessage>& messages,
                              ClosableQueue<AckDecision>& acks) {
    OutputResult result;

    try {
        while (auto message = messages.pop()) {
            sink_.write(*message);

            const uint64_t deliveryTag = message->getDeliveryTag();
            if (!acks.push(strategy_.decide(deliveryTag))) {
                spdlog::warn("Ack queue closed, decision for delivery {} not sent", deliveryTag);
            }

            ++result.processedCount;
            result.totalBytes += message->getBodySize();
        }

        sink_.flush();
    } catch (const std::exception& e) {
        acks.close();
        spdlog::error("Output failed after {} message(s): {}", result.processedCount, e.what());
        throw OutputError(e.what());
    } catch (...) {
        acks.close();
        throw;
    }

    acks.close();
    spdlog::debug("Output stage finished: {} message(s), {} byte(s)", result.processedCount, result.totalBytes);
    return result;
}

} // namespace message_retrieval
