#include "message_output/formatters.hpp"

namespace message_output {

nlohmann::json JsonFormatter::propertiesToJson(const broker_client::MessageProperties& properties) {
    nlohmann::json json = nlohmann::json::object();

    if (properties.type) json["type"] = *properties.type;
    if (properties.messageId) json["messageId"] = *properties.messageId;
    if (properties.appId) json["appId"] = *properties.appId;
    if (properties.clusterId) json["clusterId"] = *properties.clusterId;
    if (properties.contentType) json["contentType"] = *properties.contentType;
    if (properties.contentEncoding) json["contentEncoding"] = *properties.contentEncoding;
    if (properties.correlationId) json["correlationId"] = *properties.correlationId;
    if (properties.deliveryMode) json["deliveryMode"] = *properties.deliveryMode;
    if (properties.expiration) json["expiration"] = *properties.expiration;
    if (properties.priority) json["priority"] = *properties.priority;
    if (properties.replyTo) json["replyTo"] = *properties.replyTo;
    if (properties.timestamp) json["timestamp"] = *properties.timestamp;
    if (properties.userId) json["userId"] = *properties.userId;
    if (properties.hasHeaders()) json["headers"] = properties.headers;

    return json;
}

nlohmann::json JsonFormatter::toJson(const broker_client::DeliveredMessage& message) {
    nlohmann::json json;
    json["exchange"] = message.getExchange();
    json["routingKey"] = message.getRoutingKey();
    json["queue"] = message.getQueue();
    json["deliveryTag"] = message.getDeliveryTag();
    json["redelivered"] = message.isRedelivered();

    auto body = message.getBodyJson();
    if (body.is_object() || body.is_array()) {
        json["body"] = std::move(body);
    } else {
        json["body"] = message.getBodyString();
    }

    if (message.getProperties().hasAnyProperty()) {
        json["properties"] = propertiesToJson(message.getProperties());
    }

    return json;
}

std::string JsonFormatter::format(const broker_client::DeliveredMessage& message) {
    // Bodies are not guaranteed to be valid UTF-8
    return toJson(message).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace message_output
