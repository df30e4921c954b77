#pragma once

#include "broker_client/types.hpp"
#include "broker_client/delivered_message.hpp"
#include <string>
#include <memory>
#include <map>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <vector>
#include <amqp.h>

namespace broker_client {

/**
 * @brief Broker operations used by message retrieval
 *
 * Implementations never throw; failures are reported through Result.
 */
class IBrokerChannel {
public:
    virtual ~IBrokerChannel() = default;

    /**
     * @brief Check that a queue exists without creating or modifying it
     * @return Queue metadata, or ErrorType::NotFoundError
     */
    virtual Result<QueueInfo> queueDeclarePassive(const std::string& queue) = 0;

    /**
     * @brief Limit unacknowledged deliveries on this channel (0 = unlimited)
     */
    virtual Result<void> basicQos(uint16_t prefetchCount) = 0;

    /**
     * @brief Register a push subscription with manual acknowledgment
     * @return The consumer tag assigned by the broker
     */
    virtual Result<std::string> basicConsume(const std::string& queue, DeliveryCallback callback) = 0;

    virtual Result<void> basicCancel(const std::string& consumerTag) = 0;

    /**
     * @brief Register the handler for subscriptions that end on the broker side
     *
     * Called from the consumer thread with no connection lock held, so the
     * handler may call basicCancel. Pass an empty function to clear it.
     */
    virtual void setConsumerLostCallback(ConsumerLostCallback callback) = 0;

    virtual Result<void> basicAck(uint64_t deliveryTag) = 0;
    virtual Result<void> basicNack(uint64_t deliveryTag, bool requeue) = 0;

    /**
     * @brief Close the channel; unacknowledged deliveries return to the broker
     */
    virtual Result<void> close() = 0;

    virtual bool isOpen() const = 0;
};

// Channel class declaration
class Channel : public IBrokerChannel {
public:
    Channel(std::shared_ptr<Connection> connection, amqp_channel_t channelId);
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    ~Channel() override;

    Result<void> open();

    // IBrokerChannel
    Result<QueueInfo> queueDeclarePassive(const std::string& queue) override;
    Result<void> basicQos(uint16_t prefetchCount) override;
    Result<std::string> basicConsume(const std::string& queue, DeliveryCallback callback) override;
    Result<void> basicCancel(const std::string& consumerTag) override;
    void setConsumerLostCallback(ConsumerLostCallback callback) override;
    Result<void> basicAck(uint64_t deliveryTag) override;
    Result<void> basicNack(uint64_t deliveryTag, bool requeue) override;
    Result<void> close() override;
    bool isOpen() const override;

    int getChannelId() const;
    ChannelState getState() const;

private:
    struct ConsumerEntry {
        std::string queue;
        DeliveryCallback callback;
    };

    std::shared_ptr<Connection> connection_;
    amqp_channel_t channelId_;
    std::atomic<ChannelState> state_{ChannelState::Closed};

    // Consumers by tag; recursive because a callback may cancel its own subscription
    std::recursive_mutex consumersMutex_;
    std::map<std::string, ConsumerEntry> consumers_;
    ConsumerLostCallback consumerLost_;

    // Consumer thread
    std::thread consumerThread_;
    std::atomic<bool> stopConsuming_{false};
    std::atomic<int> pendingOperations_{0};
    std::condition_variable ioCondition_;

    // Runs operation with exclusive use of the connection
    template<typename Operation>
    auto withConnection(Operation&& operation);

    void startConsumerThread();
    void stopConsumerThread();
    void consumeLoop();
    void handleUnexpectedFrame(amqp_connection_state_t conn, std::vector<std::string>& cancelledConsumers,
                               std::string& failure);
    void dispatch(const std::string& consumerTag, DeliveredMessage message);
    std::vector<std::string> takeConsumers();
    void notifyConsumersLost(const std::vector<std::string>& consumerTags, const std::string& reason);
    std::string queueForConsumer(const std::string& consumerTag);
    Result<void> replyToError(amqp_connection_state_t conn, const amqp_rpc_reply_t& reply);
};

} // namespace broker_client
