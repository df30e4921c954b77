#pragma once

#include "message_output/output_options.hpp"
#include "broker_client/delivered_message.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace message_output {

/**
 * @brief Renders AMQP header values for human-readable output
 *
 * Small objects and arrays stay on one line; nested or larger ones are
 * spread over several lines indented two spaces per level.
 */
class HeaderValueFormatter {
public:
    static std::string formatValue(const nlohmann::json& value, int indent = 0);

private:
    static std::string formatObject(const nlohmann::json& object, int indent);
    static std::string formatArray(const nlohmann::json& array, int indent);
    static std::string escape(const std::string& text);
};

/**
 * @brief Line-oriented "Key: value" rendering
 */
class TextFormatter {
public:
    static std::string format(const broker_client::DeliveredMessage& message);
};

/**
 * @brief One compact JSON object per message
 *
 * A body that parses as a JSON object or array is embedded as JSON;
 * any other body is emitted as a string.
 */
class JsonFormatter {
public:
    static nlohmann::json toJson(const broker_client::DeliveredMessage& message);
    static nlohmann::json propertiesToJson(const broker_client::MessageProperties& properties);
    static std::string format(const broker_client::DeliveredMessage& message);
};

/**
 * @brief Boxed panel with routing, properties, headers and body sections
 */
class TableFormatter {
public:
    // Width of the label column
    static constexpr size_t kLabelWidth = 17;

    /**
     * @brief Render one message
     * @param compact Show only properties that are set instead of every
     *                property with "-" placeholders
     */
    static std::string format(const broker_client::DeliveredMessage& message, bool compact = false);

    static std::string formatDeliveryMode(uint8_t mode);
    static std::string formatTimestamp(uint64_t secondsSinceEpoch);
};

// Dispatches to the formatter for the given format
std::string formatMessage(const broker_client::DeliveredMessage& message, OutputFormat format, bool compact);

} // namespace message_output
