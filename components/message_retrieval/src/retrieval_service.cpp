#include "message_retrieval/retrieval_service.hpp"
#include "message_retrieval/delivery_bridge.hpp"
#include "message_retrieval/error.hpp"
#include "message_retrieval/message_pipeline.hpp"
#include "message_retrieval/queue_validator.hpp"
#include "message_retrieval/retrieval_strategy.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace message_retrieval {

namespace {

std::string describeTarget(int64_t limit) {
    if (limit <= 0) {
        return "messages continuously";
    }
    return "up to " + std::to_string(limit) + (limit == 1 ? " message" : " messages");
}

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

RetrievalService::RetrievalService(RetrievalMode mode,
                                   std::shared_ptr<broker_client::IBrokerChannel> channel,
                                   std::shared_ptr<IMessageSink> sink,
                                   std::shared_ptr<IStatusOutput> status)
    : mode_(mode), channel_(std::move(channel)), sink_(std::move(sink)), status_(std::move(status)) {
}

RetrievalResult RetrievalService::run(const RetrievalOptions& options, CancellationSource& cancellation) {
    const auto started = std::chrono::steady_clock::now();

    const RetrievalStrategy strategy = RetrievalStrategy::resolve(mode_, options);

    QueueValidator validator(*channel_);
    auto snapshot = validator.validate(options.queue);
    if (!snapshot) {
        if (snapshot.error == broker_client::ErrorType::NotFoundError) {
            throw QueueNotFoundError(options.queue);
        }
        throw BrokerOperationError(snapshot.message, snapshot.error);
    }

    for (const auto& warning : strategy.warnings()) {
        status_->showWarning(warning);
    }

    RetrievalResult result;
    result.queue = options.queue;
    result.mode = strategy.mode();
    result.ackMode = strategy.ackOutcome();
    result.prefetchCount = strategy.prefetchCount();

    int64_t limit = options.messageCountLimit;

    // Peek stops at the queue depth seen at start
    if (strategy.mode() == RetrievalMode::Peek) {
        const auto available = static_cast<int64_t>(snapshot->messageCount);
        if (available == 0) {
            status_->showWarning("Queue '" + options.queue + "' is empty");
            closeChannel();
            result.elapsed = elapsedSince(started);
            return result;
        }
        if (options.hasMessageLimit() && limit > available) {
            status_->showWarning("Only " + std::to_string(available) + " message(s) available in queue '" +
                                 options.queue + "'");
        }
        if (!options.hasMessageLimit() || limit > available) {
            limit = available;
        }
    }

    auto qos = channel_->basicQos(strategy.prefetchCount());
    if (!qos) {
        throw BrokerOperationError("Failed to set prefetch count: " + qos.message, qos.error);
    }

    status_->showStatus("Retrieving " + describeTarget(limit) + " from queue '" + options.queue + "' in " +
                        retrievalModeToString(strategy.mode()) + " mode (Ctrl+C to stop)");

    ClosableQueue<broker_client::DeliveredMessage> messages;
    ClosableQueue<AckDecision> acks;
    ReceivedMessageCounter counter;
    CancellationCoordinator coordinator;
    MessagePipeline pipeline(*sink_, *channel_, strategy);
    DeliveryBridge bridge(*channel_, messages, counter, coordinator, limit);

    coordinator.setShutdownAction([&bridge, &messages](ShutdownReason reason) {
        spdlog::info("Stopping message retrieval: {}", shutdownReasonToString(reason));
        bridge.unsubscribe();
        messages.close();
    });

    pipeline.start(messages, acks);

    auto subscription = bridge.subscribe(options.queue);
    if (!subscription) {
        messages.close();
        pipeline.wait();
        closeChannel();
        throw BrokerOperationError("Failed to subscribe to queue '" + options.queue + "': " +
                                   subscription.message, subscription.error);
    }

    OutputResult output;
    {
        auto registration = cancellation.onCancel([&coordinator] {
            coordinator.trigger(ShutdownReason::UserCancelled);
        });

        try {
            output = pipeline.wait();
        } catch (...) {
            coordinator.trigger(ShutdownReason::OutputFailure);
            closeChannel();
            throw;
        }
    }

    // Unacknowledged deliveries return to the queue here
    closeChannel();

    if (coordinator.reason() == ShutdownReason::ConsumerLost) {
        status_->showWarning("Subscription to queue '" + options.queue + "' ended by the broker: " +
                             bridge.lostReason());
    }

    result.messagesReceived = counter.value();
    result.messagesProcessed = output.processedCount;
    result.messagesSkipped = bridge.droppedCount();
    result.totalBytes = output.totalBytes;
    result.acksFailed = pipeline.ackStats().failed;
    result.shutdownReason = coordinator.reason();
    result.cancelledByUser = coordinator.cancelledByUser();
    result.elapsed = elapsedSince(started);

    spdlog::debug("Retrieval from {} finished: received {}, processed {}, skipped {}, reason {}",
                  result.queue, result.messagesReceived, result.messagesProcessed,
                  result.messagesSkipped, shutdownReasonToString(result.shutdownReason));

    const auto messageStats = messages.getStats();
    const auto ackStats = acks.getStats();
    spdlog::debug("Pipeline queues: messages peak {}, rejected after close {}; decisions peak {}",
                  messageStats.peakSize, messageStats.rejectedAfterClose, ackStats.peakSize);
    return result;
}

void RetrievalService::closeChannel() {
    auto closed = channel_->close();
    if (!closed) {
        spdlog::warn("Failed to close channel: {}", closed.message);
    }
}

} // namespace message_retrieval
