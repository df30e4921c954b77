#pragma once

#include "message_retrieval/closable_queue.hpp"
#include "message_retrieval/cancellation.hpp"
#include "message_retrieval/received_message_counter.hpp"
#include "broker_client/channel.hpp"
#include "broker_client/delivered_message.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace message_retrieval {

/**
 * @brief Producer side of the pipeline
 *
 * Receives broker deliveries on the client's dispatch thread and hands them
 * to the message queue without blocking. Fires the count-reached trigger when
 * the message limit is hit.
 */
class DeliveryBridge {
public:
    DeliveryBridge(broker_client::IBrokerChannel& channel,
                   ClosableQueue<broker_client::DeliveredMessage>& messages,
                   ReceivedMessageCounter& counter,
                   CancellationCoordinator& coordinator,
                   int64_t messageCountLimit);
    ~DeliveryBridge();

    DeliveryBridge(const DeliveryBridge&) = delete;
    DeliveryBridge& operator=(const DeliveryBridge&) = delete;

    /**
     * @brief Register the push subscription
     * @return The consumer tag
     */
    broker_client::Result<std::string> subscribe(const std::string& queue);

    // Delivery callback body
    void onDelivery(broker_client::DeliveredMessage message);

    // Consumer-lost callback body; fires the consumer-lost trigger for our subscription
    void onConsumerLost(const std::string& consumerTag, const std::string& reason);

    // Best effort; failures are logged. Safe to call more than once.
    void unsubscribe();

    uint64_t droppedCount() const noexcept { return dropped_.load(); }
    std::string consumerTag() const;
    std::string lostReason() const;

private:
    broker_client::IBrokerChannel& channel_;
    ClosableQueue<broker_client::DeliveredMessage>& messages_;
    ReceivedMessageCounter& counter_;
    CancellationCoordinator& coordinator_;
    uint64_t limit_;

    std::atomic<uint64_t> dropped_{0};

    mutable std::mutex tagMutex_;
    std::string consumerTag_;
    bool unsubscribeRequested_ = false;
    bool cancelled_ = false;
    std::string lostReason_;

    void cancelConsumer(const std::string& tag);
};

} // namespace message_retrieval
