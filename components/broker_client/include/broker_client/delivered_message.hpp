#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>
#include <amqp.h>
#include "broker_client/types.hpp"

namespace broker_client {

// A message pushed by the broker to a consumer. Immutable once built.
class DeliveredMessage {
public:
    DeliveredMessage() = default;
    DeliveredMessage(std::string exchange, std::string routingKey, std::string queue,
                     std::vector<uint8_t> body, uint64_t deliveryTag,
                     MessageProperties properties = {}, bool redelivered = false);

    DeliveredMessage(const DeliveredMessage& other) = default;
    DeliveredMessage(DeliveredMessage&& other) noexcept = default;
    DeliveredMessage& operator=(const DeliveredMessage& other) = default;
    DeliveredMessage& operator=(DeliveredMessage&& other) noexcept = default;
    ~DeliveredMessage() = default;

    // Builds a message from a rabbitmq-c envelope; the envelope may be destroyed afterwards
    static DeliveredMessage fromEnvelope(const amqp_envelope_t& envelope, const std::string& queue);

    const std::string& getExchange() const { return exchange_; }
    const std::string& getRoutingKey() const { return routingKey_; }
    const std::string& getQueue() const { return queue_; }
    const std::vector<uint8_t>& getBody() const { return body_; }
    uint64_t getDeliveryTag() const { return deliveryTag_; }
    const MessageProperties& getProperties() const { return properties_; }
    bool isRedelivered() const { return redelivered_; }

    size_t getBodySize() const { return body_.size(); }
    std::string getBodyString() const;

    // Parses the body as JSON; returns a discarded value when it is not JSON
    nlohmann::json getBodyJson() const;

private:
    std::string exchange_;
    std::string routingKey_;
    std::string queue_;
    std::vector<uint8_t> body_;
    uint64_t deliveryTag_{0};
    MessageProperties properties_;
    bool redelivered_{false};
};

} // namespace broker_client
