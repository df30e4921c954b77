#pragma once

#include "message_retrieval/cancellation.hpp"
#include "message_retrieval/message_sink.hpp"
#include "message_retrieval/status_output.hpp"
#include "message_retrieval/types.hpp"
#include "broker_client/channel.hpp"
#include <memory>

namespace message_retrieval {

/**
 * @brief Entry point for one retrieval run
 *
 * Validates the queue, applies the strategy's prefetch, subscribes, and runs
 * the pipeline until the count limit is reached or the caller cancels. The
 * channel is closed when the run ends.
 */
class RetrievalService {
public:
    RetrievalService(RetrievalMode mode,
                     std::shared_ptr<broker_client::IBrokerChannel> channel,
                     std::shared_ptr<IMessageSink> sink,
                     std::shared_ptr<IStatusOutput> status);

    /**
     * @brief Retrieve messages
     * @throws ConfigurationError, QueueNotFoundError, BrokerOperationError before
     *         the first delivery; OutputError if the sink fails mid-stream
     */
    RetrievalResult run(const RetrievalOptions& options, CancellationSource& cancellation);

    RetrievalMode mode() const { return mode_; }

private:
    RetrievalMode mode_;
    std::shared_ptr<broker_client::IBrokerChannel> channel_;
    std::shared_ptr<IMessageSink> sink_;
    std::shared_ptr<IStatusOutput> status_;

    void closeChannel();
};

} // namespace message_retrieval
