#include "broker_client/channel.hpp"
#include "broker_client/connection.hpp"
#include <spdlog/spdlog.h>
#include <amqp_framing.h>
#include <sys/time.h>

namespace broker_client {

template<typename Operation>
auto Channel::withConnection(Operation&& operation) {
    // Announce the operation so the consumer thread yields the connection
    pendingOperations_.fetch_add(1);
    std::unique_lock<std::mutex> lock(connection_->getMutex());
    pendingOperations_.fetch_sub(1);

    auto result = operation(connection_->getNativeHandle());

    lock.unlock();
    ioCondition_.notify_all();
    return result;
}

Channel::Channel(std::shared_ptr<Connection> connection, amqp_channel_t channelId)
    : connection_(std::move(connection)), channelId_(channelId) {
}

Channel::~Channel() {
    if (state_ == ChannelState::Open) {
        auto result = close();
        if (!result) {
            spdlog::warn("Channel {} did not close cleanly: {}", channelId_, result.message);
        }
    } else {
        stopConsumerThread();
    }
}

Result<void> Channel::open() {
    if (!connection_ || !connection_->isConnected()) {
        return Result<void>(ErrorType::ConnectionError, "Cannot open channel - not connected");
    }

    state_ = ChannelState::Opening;

    return withConnection([this](amqp_connection_state_t conn) {
        amqp_channel_open(conn, channelId_);
        amqp_rpc_reply_t reply = amqp_get_rpc_reply(conn);
        if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
            state_ = ChannelState::Failed;
            return Result<void>(ErrorType::ChannelError,
                                "Failed to open channel " + std::to_string(channelId_) + ": " +
                                rpcReplyToString(reply));
        }

        state_ = ChannelState::Open;
        spdlog::debug("Opened channel {}", channelId_);
        return Result<void>();
    });
}

Result<QueueInfo> Channel::queueDeclarePassive(const std::string& queue) {
    if (!isOpen()) {
        return Result<QueueInfo>(ErrorType::ChannelError, "Channel is not open");
    }

    return withConnection([this, &queue](amqp_connection_state_t conn) {
        amqp_queue_declare_ok_t* ok = amqp_queue_declare(conn, channelId_,
                                                         amqp_cstring_bytes(queue.c_str()),
                                                         1,  // passive
                                                         0, 0, 0, amqp_empty_table);
        amqp_rpc_reply_t reply = amqp_get_rpc_reply(conn);
        if (ok == nullptr || reply.reply_type != AMQP_RESPONSE_NORMAL) {
            auto error = replyToError(conn, reply);
            if (error.error == ErrorType::NotFoundError) {
                return Result<QueueInfo>(ErrorType::NotFoundError, "Queue '" + queue + "' not found");
            }
            return Result<QueueInfo>(error.error, "Queue declare failed for '" + queue + "': " + error.message);
        }

        QueueInfo info;
        info.name = amqpBytesToString(ok->queue);
        info.messageCount = ok->message_count;
        info.consumerCount = ok->consumer_count;
        return Result<QueueInfo>(info);
    });
}

Result<void> Channel::basicQos(uint16_t prefetchCount) {
    if (!isOpen()) {
        return Result<void>(ErrorType::ChannelError, "Channel is not open");
    }

    return withConnection([this, prefetchCount](amqp_connection_state_t conn) {
        amqp_basic_qos(conn, channelId_, 0, prefetchCount, 0);
        amqp_rpc_reply_t reply = amqp_get_rpc_reply(conn);
        if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
            auto error = replyToError(conn, reply);
            return Result<void>(error.error, "basic.qos failed: " + error.message);
        }

        spdlog::debug("Set prefetch count to {} on channel {}", prefetchCount, channelId_);
        return Result<void>();
    });
}

Result<std::string> Channel::basicConsume(const std::string& queue, DeliveryCallback callback) {
    if (!isOpen()) {
        return Result<std::string>(ErrorType::ChannelError, "Channel is not open");
    }

    auto result = withConnection([this, &queue](amqp_connection_state_t conn) {
        amqp_basic_consume_ok_t* ok = amqp_basic_consume(conn, channelId_,
                                                         amqp_cstring_bytes(queue.c_str()),
                                                         amqp_empty_bytes,
                                                         0,  // no local
                                                         0,  // no ack
                                                         0,  // exclusive
                                                         amqp_empty_table);
        amqp_rpc_reply_t reply = amqp_get_rpc_reply(conn);
        if (ok == nullptr || reply.reply_type != AMQP_RESPONSE_NORMAL) {
            auto error = replyToError(conn, reply);
            return Result<std::string>(error.error, "basic.consume failed for '" + queue + "': " + error.message);
        }
        return Result<std::string>(amqpBytesToString(ok->consumer_tag));
    });

    if (!result) {
        return result;
    }

    {
        std::lock_guard<std::recursive_mutex> lock(consumersMutex_);
        consumers_[result.value] = ConsumerEntry{queue, std::move(callback)};
    }
    spdlog::info("Started consuming from queue: {} with tag: {}", queue, result.value);

    startConsumerThread();
    return result;
}

Result<void> Channel::basicCancel(const std::string& consumerTag) {
    if (!isOpen()) {
        return Result<void>(ErrorType::ChannelError, "Channel is not open");
    }

    auto result = withConnection([this, &consumerTag](amqp_connection_state_t conn) {
        amqp_basic_cancel(conn, channelId_, amqp_cstring_bytes(consumerTag.c_str()));
        amqp_rpc_reply_t reply = amqp_get_rpc_reply(conn);
        if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
            auto error = replyToError(conn, reply);
            return Result<void>(error.error, "basic.cancel failed for '" + consumerTag + "': " + error.message);
        }
        return Result<void>();
    });

    {
        std::lock_guard<std::recursive_mutex> lock(consumersMutex_);
        consumers_.erase(consumerTag);
    }

    if (result) {
        spdlog::debug("Cancelled consumer {}", consumerTag);
    }
    return result;
}

void Channel::setConsumerLostCallback(ConsumerLostCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(consumersMutex_);
    consumerLost_ = std::move(callback);
}

Result<void> Channel::basicAck(uint64_t deliveryTag) {
    if (!isOpen()) {
        return Result<void>(ErrorType::ChannelError, "Channel is not open");
    }

    return withConnection([this, deliveryTag](amqp_connection_state_t conn) {
        int status = amqp_basic_ack(conn, channelId_, deliveryTag, 0);
        if (status != AMQP_STATUS_OK) {
            return Result<void>(amqpErrorToErrorType(status),
                                "basic.ack failed for delivery tag " + std::to_string(deliveryTag) + ": " +
                                amqpErrorToString(status));
        }
        return Result<void>();
    });
}

Result<void> Channel::basicNack(uint64_t deliveryTag, bool requeue) {
    if (!isOpen()) {
        return Result<void>(ErrorType::ChannelError, "Channel is not open");
    }

    return withConnection([this, deliveryTag, requeue](amqp_connection_state_t conn) {
        int status = amqp_basic_nack(conn, channelId_, deliveryTag, 0, requeue ? 1 : 0);
        if (status != AMQP_STATUS_OK) {
            return Result<void>(amqpErrorToErrorType(status),
                                "basic.nack failed for delivery tag " + std::to_string(deliveryTag) + ": " +
                                amqpErrorToString(status));
        }
        return Result<void>();
    });
}

Result<void> Channel::close() {
    stopConsumerThread();

    ChannelState expected = ChannelState::Open;
    if (!state_.compare_exchange_strong(expected, ChannelState::Closing)) {
        // Already closed by us or by the broker
        return Result<void>();
    }

    auto result = withConnection([this](amqp_connection_state_t conn) {
        amqp_rpc_reply_t reply = amqp_channel_close(conn, channelId_, AMQP_REPLY_SUCCESS);
        if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
            return Result<void>(ErrorType::ChannelError,
                                "Failed to close channel " + std::to_string(channelId_) + ": " +
                                rpcReplyToString(reply));
        }
        return Result<void>();
    });

    state_ = result ? ChannelState::Closed : ChannelState::Failed;

    {
        std::lock_guard<std::recursive_mutex> lock(consumersMutex_);
        consumers_.clear();
    }

    spdlog::debug("Closed channel {}", channelId_);
    return result;
}

bool Channel::isOpen() const {
    return state_ == ChannelState::Open;
}

int Channel::getChannelId() const {
    return channelId_;
}

ChannelState Channel::getState() const {
    return state_;
}

// Private methods
void Channel::startConsumerThread() {
    if (consumerThread_.joinable()) {
        return;
    }

    stopConsuming_ = false;
    consumerThread_ = std::thread(&Channel::consumeLoop, this);
}

void Channel::stopConsumerThread() {
    stopConsuming_ = true;
    ioCondition_.notify_all();

    if (!consumerThread_.joinable()) {
        return;
    }

    if (consumerThread_.get_id() == std::this_thread::get_id()) {
        // Closing from inside a delivery callback; the loop exits on its own
        consumerThread_.detach();
        return;
    }

    consumerThread_.join();
}

void Channel::consumeLoop() {
    spdlog::debug("Consumer thread started on channel {}", channelId_);

    const auto interval = connection_->getConfig().consumePollInterval;

    while (!stopConsuming_) {
        std::string consumerTag;
        DeliveredMessage message;
        std::vector<std::string> cancelled;
        std::string failure;

        {
            std::unique_lock<std::mutex> lock(connection_->getMutex());
            ioCondition_.wait(lock, [this] {
                return pendingOperations_.load() == 0 || stopConsuming_.load();
            });

            if (stopConsuming_) {
                break;
            }

            amqp_connection_state_t conn = connection_->getNativeHandle();
            amqp_maybe_release_buffers(conn);

            struct timeval timeout;
            timeout.tv_sec = static_cast<time_t>(interval.count() / 1000);
            timeout.tv_usec = static_cast<suseconds_t>((interval.count() % 1000) * 1000);

            amqp_envelope_t envelope;
            amqp_rpc_reply_t reply = amqp_consume_message(conn, &envelope, &timeout, 0);

            if (reply.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION &&
                reply.library_error == AMQP_STATUS_TIMEOUT) {
                continue;
            }

            if (reply.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION &&
                reply.library_error == AMQP_STATUS_UNEXPECTED_STATE) {
                handleUnexpectedFrame(conn, cancelled, failure);
            } else if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
                failure = rpcReplyToString(reply);
                spdlog::error("Consumer on channel {} stopped: {}", channelId_, failure);
                state_ = ChannelState::Failed;
            } else {
                consumerTag = amqpBytesToString(envelope.consumer_tag);
                message = DeliveredMessage::fromEnvelope(envelope, queueForConsumer(consumerTag));
                amqp_destroy_envelope(&envelope);
            }
        }

        // Handlers run without the connection lock; they may cancel or close
        if (!failure.empty()) {
            notifyConsumersLost(takeConsumers(), failure);
            break;
        }
        if (!cancelled.empty()) {
            notifyConsumersLost(cancelled, "cancelled by the broker");
            continue;
        }
        if (!consumerTag.empty()) {
            dispatch(consumerTag, std::move(message));
        }
    }

    spdlog::debug("Consumer thread ended on channel {}", channelId_);
}

void Channel::handleUnexpectedFrame(amqp_connection_state_t conn, std::vector<std::string>& cancelledConsumers,
                                    std::string& failure) {
    amqp_frame_t frame;
    int status = amqp_simple_wait_frame(conn, &frame);
    if (status != AMQP_STATUS_OK) {
        failure = "failed to read frame: " + amqpErrorToString(status);
        spdlog::error("Consumer on channel {} stopped: {}", channelId_, failure);
        state_ = ChannelState::Failed;
        return;
    }

    if (frame.frame_type != AMQP_FRAME_METHOD) {
        return;
    }

    switch (frame.payload.method.id) {
        case AMQP_BASIC_ACK_METHOD:
            // Publisher confirm; nothing is published on this channel
            return;

        case AMQP_BASIC_RETURN_METHOD: {
            amqp_message_t returned;
            amqp_rpc_reply_t reply = amqp_read_message(conn, frame.channel, &returned, 0);
            if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
                failure = "failed to read returned message: " + rpcReplyToString(reply);
                state_ = ChannelState::Failed;
                return;
            }
            amqp_destroy_message(&returned);
            return;
        }

        case AMQP_BASIC_CANCEL_METHOD: {
            const auto* method = static_cast<const amqp_basic_cancel_t*>(frame.payload.method.decoded);
            std::string tag = amqpBytesToString(method->consumer_tag);
            spdlog::warn("Broker cancelled consumer {} (queue deleted or failed over)", tag);

            std::lock_guard<std::recursive_mutex> lock(consumersMutex_);
            if (consumers_.erase(tag) > 0) {
                cancelledConsumers.push_back(tag);
            }
            return;
        }

        case AMQP_CHANNEL_CLOSE_METHOD: {
            const auto* method = static_cast<const amqp_channel_close_t*>(frame.payload.method.decoded);
            failure = "channel closed by the broker: " + std::to_string(method->reply_code) + " " +
                      amqpBytesToString(method->reply_text);
            spdlog::error("Broker closed channel {}: {} {}", channelId_, method->reply_code,
                          amqpBytesToString(method->reply_text));

            amqp_channel_close_ok_t closeOk{};
            if (amqp_send_method(conn, frame.channel, AMQP_CHANNEL_CLOSE_OK_METHOD, &closeOk) != AMQP_STATUS_OK) {
                spdlog::warn("Failed to confirm channel close on channel {}", channelId_);
            }
            state_ = ChannelState::Failed;
            return;
        }

        case AMQP_CONNECTION_CLOSE_METHOD: {
            const auto* method = static_cast<const amqp_connection_close_t*>(frame.payload.method.decoded);
            failure = "connection closed by the broker: " + std::to_string(method->reply_code) + " " +
                      amqpBytesToString(method->reply_text);
            spdlog::error("Broker closed the connection: {} {}", method->reply_code,
                          amqpBytesToString(method->reply_text));
            state_ = ChannelState::Failed;
            return;
        }

        default:
            spdlog::warn("Unexpected method 0x{:08x} on channel {}", frame.payload.method.id, channelId_);
            return;
    }
}

void Channel::dispatch(const std::string& consumerTag, DeliveredMessage message) {
    std::lock_guard<std::recursive_mutex> lock(consumersMutex_);

    auto it = consumers_.find(consumerTag);
    if (it == consumers_.end()) {
        // Consumer already cancelled; the broker redelivers once the channel closes
        spdlog::debug("Dropping delivery {} for cancelled consumer {}", message.getDeliveryTag(), consumerTag);
        return;
    }

    // Copy so the callback can cancel its own subscription
    auto callback = it->second.callback;

    try {
        callback(std::move(message));
    } catch (const std::exception& e) {
        spdlog::error("Delivery callback for consumer {} failed: {}", consumerTag, e.what());
    }
}

std::vector<std::string> Channel::takeConsumers() {
    std::lock_guard<std::recursive_mutex> lock(consumersMutex_);
    std::vector<std::string> tags;
    for (const auto& entry : consumers_) {
        tags.push_back(entry.first);
    }
    consumers_.clear();
    return tags;
}

void Channel::notifyConsumersLost(const std::vector<std::string>& consumerTags, const std::string& reason) {
    ConsumerLostCallback callback;
    {
        std::lock_guard<std::recursive_mutex> lock(consumersMutex_);
        callback = consumerLost_;
    }
    if (!callback) {
        return;
    }

    for (const auto& tag : consumerTags) {
        try {
            callback(tag, reason);
        } catch (const std::exception& e) {
            spdlog::error("Consumer-lost handler for {} failed: {}", tag, e.what());
        }
    }
}

std::string Channel::queueForConsumer(const std::string& consumerTag) {
    std::lock_guard<std::recursive_mutex> lock(consumersMutex_);
    auto it = consumers_.find(consumerTag);
    return it != consumers_.end() ? it->second.queue : std::string();
}

Result<void> Channel::replyToError(amqp_connection_state_t conn, const amqp_rpc_reply_t& reply) {
    const std::string description = rpcReplyToString(reply);

    switch (reply.reply_type) {
        case AMQP_RESPONSE_LIBRARY_EXCEPTION:
            return Result<void>(amqpErrorToErrorType(reply.library_error), description);

        case AMQP_RESPONSE_SERVER_EXCEPTION:
            if (reply.reply.id == AMQP_CHANNEL_CLOSE_METHOD) {
                const auto* method = static_cast<const amqp_channel_close_t*>(reply.reply.decoded);
                const bool notFound = method->reply_code == AMQP_NOT_FOUND;

                // The broker closed this channel; confirm so the connection stays usable
                amqp_channel_close_ok_t closeOk{};
                if (amqp_send_method(conn, channelId_, AMQP_CHANNEL_CLOSE_OK_METHOD, &closeOk) != AMQP_STATUS_OK) {
                    spdlog::warn("Failed to confirm channel close on channel {}", channelId_);
                }
                state_ = ChannelState::Closed;

                return Result<void>(notFound ? ErrorType::NotFoundError : ErrorType::ChannelError, description);
            }

            if (reply.reply.id == AMQP_CONNECTION_CLOSE_METHOD) {
                amqp_connection_close_ok_t closeOk{};
                if (amqp_send_method(conn, 0, AMQP_CONNECTION_CLOSE_OK_METHOD, &closeOk) != AMQP_STATUS_OK) {
                    spdlog::warn("Failed to confirm connection close");
                }
                state_ = ChannelState::Failed;
                return Result<void>(ErrorType::ConnectionError, description);
            }
            return Result<void>(ErrorType::ProtocolError, description);

        default:
            return Result<void>(ErrorType::ProtocolError, description);
    }
}

} // namespace broker_client
