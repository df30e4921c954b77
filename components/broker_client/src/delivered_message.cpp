#include "broker_client/delivered_message.hpp"

namespace broker_client {

DeliveredMessage::DeliveredMessage(std::string exchange, std::string routingKey, std::string queue,
                                   std::vector<uint8_t> body, uint64_t deliveryTag,
                                   MessageProperties properties, bool redelivered)
    : exchange_(std::move(exchange)),
      routingKey_(std::move(routingKey)),
      queue_(std::move(queue)),
      body_(std::move(body)),
      deliveryTag_(deliveryTag),
      properties_(std::move(properties)),
      redelivered_(redelivered) {
}

DeliveredMessage DeliveredMessage::fromEnvelope(const amqp_envelope_t& envelope, const std::string& queue) {
    const auto& body = envelope.message.body;
    std::vector<uint8_t> bytes;
    if (body.len > 0 && body.bytes != nullptr) {
        const auto* begin = static_cast<const uint8_t*>(body.bytes);
        bytes.assign(begin, begin + body.len);
    }

    return DeliveredMessage(amqpBytesToString(envelope.exchange),
                            amqpBytesToString(envelope.routing_key),
                            queue,
                            std::move(bytes),
                            envelope.delivery_tag,
                            amqpPropertiesToMessageProperties(envelope.message.properties),
                            envelope.redelivered != 0);
}

std::string DeliveredMessage::getBodyString() const {
    return std::string(body_.begin(), body_.end());
}

nlohmann::json DeliveredMessage::getBodyJson() const {
    // Parse without exceptions; a non-JSON body is an ordinary case here
    return nlohmann::json::parse(body_.begin(), body_.end(), nullptr, false);
}

} // namespace broker_client
