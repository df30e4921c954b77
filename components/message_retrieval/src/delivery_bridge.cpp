#include "message_retrieval/delivery_bridge.hpp"
#include <spdlog/spdlog.h>

namespace message_retrieval {

DeliveryBridge::DeliveryBridge(broker_client::IBrokerChannel& channel,
                               ClosableQueue<broker_client::DeliveredMessage>& messages,
                               ReceivedMessageCounter& counter,
                               CancellationCoordinator& coordinator,
                               int64_t messageCountLimit)
    : channel_(channel),
      messages_(messages),
      counter_(counter),
      coordinator_(coordinator),
      limit_(messageCountLimit > 0 ? static_cast<uint64_t>(messageCountLimit) : 0) {
}

DeliveryBridge::~DeliveryBridge() {
    unsubscribe();
    channel_.setConsumerLostCallback(nullptr);
}

broker_client::Result<std::string> DeliveryBridge::subscribe(const std::string& queue) {
    channel_.setConsumerLostCallback([this](const std::string& consumerTag, const std::string& reason) {
        onConsumerLost(consumerTag, reason);
    });

    auto result = channel_.basicConsume(queue, [this](broker_client::DeliveredMessage message) {
        onDelivery(std::move(message));
    });

    if (!result) {
        spdlog::error("Failed to subscribe to queue {}: {}", queue, result.message);
        return result;
    }

    bool cancelNow = false;
    {
        std::lock_guard<std::mutex> lock(tagMutex_);
        consumerTag_ = result.value;
        // Shutdown may have been requested by a delivery that raced this call
        cancelNow = unsubscribeRequested_ && !cancelled_;
        if (cancelNow) {
            cancelled_ = true;
        }
    }

    spdlog::debug("Subscribed to queue {} as {}", queue, result.value);

    if (cancelNow) {
        cancelConsumer(result.value);
    }
    return result;
}

void DeliveryBridge::onDelivery(broker_client::DeliveredMessage message) {
    const uint64_t deliveryTag = message.getDeliveryTag();

    if (coordinator_.isSignaled()) {
        dropped_.fetch_add(1);
        spdlog::trace("Dropping delivery {} after shutdown", deliveryTag);
        return;
    }

    // The counter is bumped inside the queue's critical section so a message is
    // counted exactly when it is enqueued
    uint64_t position = 0;
    bool accepted = messages_.pushIf(std::move(message), [this, &position] {
        position = counter_.incrementIfBelow(limit_);
        return position != 0;
    });

    if (!accepted) {
        dropped_.fetch_add(1);
        spdlog::trace("Dropping delivery {}; pipeline no longer accepting", deliveryTag);
        return;
    }

    spdlog::trace("Accepted delivery {} ({} received)", deliveryTag, position);

    if (limit_ > 0 && position == limit_) {
        coordinator_.trigger(ShutdownReason::MessageLimitReached);
    }
}

void DeliveryBridge::onConsumerLost(const std::string& consumerTag, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(tagMutex_);
        // An empty tag means basicConsume has not returned yet
        if (!consumerTag_.empty() && consumerTag != consumerTag_) {
            return;
        }
        if (cancelled_ && lostReason_.empty()) {
            // We cancelled it ourselves
            return;
        }
        cancelled_ = true;
        lostReason_ = reason;
    }

    spdlog::warn("Consumer {} lost: {}", consumerTag, reason);
    coordinator_.trigger(ShutdownReason::ConsumerLost);
}

void DeliveryBridge::unsubscribe() {
    std::string tag;
    {
        std::lock_guard<std::mutex> lock(tagMutex_);
        if (cancelled_) {
            return;
        }
        if (consumerTag_.empty()) {
            unsubscribeRequested_ = true;
            return;
        }
        cancelled_ = true;
        tag = consumerTag_;
    }

    cancelConsumer(tag);
}

std::string DeliveryBridge::consumerTag() const {
    std::lock_guard<std::mutex> lock(tagMutex_);
    return consumerTag_;
}

std::string DeliveryBridge::lostReason() const {
    std::lock_guard<std::mutex> lock(tagMutex_);
    return lostReason_;
}

void DeliveryBridge::cancelConsumer(const std::string& tag) {
    auto result = channel_.basicCancel(tag);
    if (!result) {
        spdlog::warn("Failed to cancel consumer {}: {}", tag, result.message);
        return;
    }
    spdlog::debug("Cancelled consumer {}", tag);
}

} // namespace message_retrieval
