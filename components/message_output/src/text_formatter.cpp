#include "message_output/formatters.hpp"
#include <sstream>

namespace message_output {

namespace {

void appendProperty(std::ostringstream& out, const char* label, const std::optional<std::string>& value) {
    if (value) {
        out << label << ": " << *value << '\n';
    }
}

void appendProperty(std::ostringstream& out, const char* label, const std::optional<uint8_t>& value) {
    if (value) {
        out << label << ": " << static_cast<int>(*value) << '\n';
    }
}

} // namespace

std::string TextFormatter::format(const broker_client::DeliveredMessage& message) {
    std::ostringstream out;

    out << "DeliveryTag: " << message.getDeliveryTag() << '\n'
        << "Exchange: " << message.getExchange() << '\n'
        << "RoutingKey: " << message.getRoutingKey() << '\n'
        << "Redelivered: " << (message.isRedelivered() ? "true" : "false") << '\n';

    const auto& properties = message.getProperties();
    appendProperty(out, "Type", properties.type);
    appendProperty(out, "MessageId", properties.messageId);
    appendProperty(out, "AppId", properties.appId);
    appendProperty(out, "ClusterId", properties.clusterId);
    appendProperty(out, "ContentType", properties.contentType);
    appendProperty(out, "ContentEncoding", properties.contentEncoding);
    appendProperty(out, "CorrelationId", properties.correlationId);
    appendProperty(out, "DeliveryMode", properties.deliveryMode);
    appendProperty(out, "Expiration", properties.expiration);
    appendProperty(out, "Priority", properties.priority);
    appendProperty(out, "ReplyTo", properties.replyTo);
    if (properties.timestamp) {
        out << "Timestamp: " << *properties.timestamp << '\n';
    }
    appendProperty(out, "UserId", properties.userId);

    if (properties.hasHeaders()) {
        out << "Headers:\n";
        for (auto it = properties.headers.begin(); it != properties.headers.end(); ++it) {
            out << "  " << it.key() << ": " << HeaderValueFormatter::formatValue(it.value()) << '\n';
        }
    }

    out << "Body:\n" << message.getBodyString();
    return out.str();
}

std::string formatMessage(const broker_client::DeliveredMessage& message, OutputFormat format, bool compact) {
    switch (format) {
        case OutputFormat::Plain:
            return TextFormatter::format(message);
        case OutputFormat::Json:
            return JsonFormatter::format(message);
        case OutputFormat::Table:
        default:
            return TableFormatter::format(message, compact);
    }
}

} // namespace message_output
