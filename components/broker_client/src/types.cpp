// src/types.cpp
#include "broker_client/types.hpp"
#include <amqp_framing.h>
#include <sstream>

namespace broker_client {

bool MessageProperties::hasAnyProperty() const {
    return type || messageId || appId || clusterId || contentType || contentEncoding ||
           correlationId || deliveryMode || expiration || priority || replyTo ||
           timestamp || userId || hasHeaders();
}

// Utility function implementations
std::string connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Disconnecting: return "Disconnecting";
        case ConnectionState::Error: return "Error";
        default: return "Unknown";
    }
}

std::string channelStateToString(ChannelState state) {
    switch (state) {
        case ChannelState::Closed: return "Closed";
        case ChannelState::Opening: return "Opening";
        case ChannelState::Open: return "Open";
        case ChannelState::Closing: return "Closing";
        case ChannelState::Failed: return "Failed";
        default: return "Unknown";
    }
}

std::string errorTypeToString(ErrorType error) {
    switch (error) {
        case ErrorType::None: return "None";
        case ErrorType::ConnectionError: return "ConnectionError";
        case ErrorType::ChannelError: return "ChannelError";
        case ErrorType::AuthenticationError: return "AuthenticationError";
        case ErrorType::NetworkError: return "NetworkError";
        case ErrorType::ProtocolError: return "ProtocolError";
        case ErrorType::TimeoutError: return "TimeoutError";
        case ErrorType::ResourceError: return "ResourceError";
        case ErrorType::NotFoundError: return "NotFoundError";
        default: return "Unknown";
    }
}

std::string amqpErrorToString(int error) {
    switch (error) {
        case AMQP_STATUS_OK: return "OK";
        case AMQP_STATUS_NO_MEMORY: return "No memory";
        case AMQP_STATUS_BAD_AMQP_DATA: return "Bad AMQP data";
        case AMQP_STATUS_UNKNOWN_CLASS: return "Unknown class";
        case AMQP_STATUS_UNKNOWN_METHOD: return "Unknown method";
        case AMQP_STATUS_HOSTNAME_RESOLUTION_FAILED: return "Hostname resolution failed";
        case AMQP_STATUS_INCOMPATIBLE_AMQP_VERSION: return "Incompatible AMQP version";
        case AMQP_STATUS_CONNECTION_CLOSED: return "Connection closed";
        case AMQP_STATUS_BAD_URL: return "Bad URL";
        case AMQP_STATUS_SOCKET_ERROR: return "Socket error";
        case AMQP_STATUS_INVALID_PARAMETER: return "Invalid parameter";
        case AMQP_STATUS_TABLE_TOO_BIG: return "Table too big";
        case AMQP_STATUS_WRONG_METHOD: return "Wrong method";
        case AMQP_STATUS_TIMEOUT: return "Timeout";
        case AMQP_STATUS_TIMER_FAILURE: return "Timer failure";
        case AMQP_STATUS_HEARTBEAT_TIMEOUT: return "Heartbeat timeout";
        case AMQP_STATUS_UNEXPECTED_STATE: return "Unexpected state";
        case AMQP_STATUS_SOCKET_CLOSED: return "Socket closed";
        case AMQP_STATUS_SOCKET_INUSE: return "Socket in use";
        case AMQP_STATUS_BROKER_UNSUPPORTED_SASL_METHOD: return "Broker unsupported SASL method";
        case AMQP_STATUS_UNSUPPORTED: return "Unsupported";
        default:
            return "Unknown error (" + std::to_string(error) + ")";
    }
}

ErrorType amqpErrorToErrorType(int error) {
    switch (error) {
        case AMQP_STATUS_OK:
            return ErrorType::None;
        case AMQP_STATUS_NO_MEMORY:
        case AMQP_STATUS_TABLE_TOO_BIG:
            return ErrorType::ResourceError;
        case AMQP_STATUS_BAD_AMQP_DATA:
        case AMQP_STATUS_UNKNOWN_CLASS:
        case AMQP_STATUS_UNKNOWN_METHOD:
        case AMQP_STATUS_INCOMPATIBLE_AMQP_VERSION:
        case AMQP_STATUS_WRONG_METHOD:
        case AMQP_STATUS_UNEXPECTED_STATE:
            return ErrorType::ProtocolError;
        case AMQP_STATUS_HOSTNAME_RESOLUTION_FAILED:
        case AMQP_STATUS_SOCKET_ERROR:
        case AMQP_STATUS_SOCKET_CLOSED:
        case AMQP_STATUS_SOCKET_INUSE:
            return ErrorType::NetworkError;
        case AMQP_STATUS_CONNECTION_CLOSED:
            return ErrorType::ConnectionError;
        case AMQP_STATUS_TIMEOUT:
        case AMQP_STATUS_HEARTBEAT_TIMEOUT:
        case AMQP_STATUS_TIMER_FAILURE:
            return ErrorType::TimeoutError;
        case AMQP_STATUS_BROKER_UNSUPPORTED_SASL_METHOD:
            return ErrorType::AuthenticationError;
        case AMQP_STATUS_BAD_URL:
        case AMQP_STATUS_INVALID_PARAMETER:
        case AMQP_STATUS_UNSUPPORTED:
        default:
            return ErrorType::ProtocolError;
    }
}

std::string amqpBytesToString(const amqp_bytes_t& bytes) {
    if (bytes.len == 0 || bytes.bytes == nullptr) {
        return {};
    }
    return std::string(static_cast<const char*>(bytes.bytes), bytes.len);
}

nlohmann::json amqpFieldValueToJson(const amqp_field_value_t& value) {
    switch (value.kind) {
        case AMQP_FIELD_KIND_BOOLEAN:
            return value.value.boolean != 0;
        case AMQP_FIELD_KIND_I8:
            return value.value.i8;
        case AMQP_FIELD_KIND_U8:
            return value.value.u8;
        case AMQP_FIELD_KIND_I16:
            return value.value.i16;
        case AMQP_FIELD_KIND_U16:
            return value.value.u16;
        case AMQP_FIELD_KIND_I32:
            return value.value.i32;
        case AMQP_FIELD_KIND_U32:
            return value.value.u32;
        case AMQP_FIELD_KIND_I64:
            return value.value.i64;
        case AMQP_FIELD_KIND_U64:
        case AMQP_FIELD_KIND_TIMESTAMP:
            return value.value.u64;
        case AMQP_FIELD_KIND_F32:
            return value.value.f32;
        case AMQP_FIELD_KIND_F64:
            return value.value.f64;
        case AMQP_FIELD_KIND_DECIMAL: {
            double scaled = static_cast<double>(value.value.decimal.value);
            for (uint8_t i = 0; i < value.value.decimal.decimals; ++i) {
                scaled /= 10.0;
            }
            return scaled;
        }
        case AMQP_FIELD_KIND_UTF8:
            return amqpBytesToString(value.value.bytes);
        case AMQP_FIELD_KIND_BYTES:
            // Raw byte arrays are not guaranteed to be valid UTF-8
            return "<binary data: " + std::to_string(value.value.bytes.len) + " bytes>";
        case AMQP_FIELD_KIND_ARRAY: {
            nlohmann::json array = nlohmann::json::array();
            for (int i = 0; i < value.value.array.num_entries; ++i) {
                array.push_back(amqpFieldValueToJson(value.value.array.entries[i]));
            }
            return array;
        }
        case AMQP_FIELD_KIND_TABLE:
            return amqpTableToJson(value.value.table);
        case AMQP_FIELD_KIND_VOID:
        default:
            return nullptr;
    }
}

nlohmann::json amqpTableToJson(const amqp_table_t& table) {
    nlohmann::json object = nlohmann::json::object();

    for (int i = 0; i < table.num_entries; ++i) {
        const auto& entry = table.entries[i];
        object[amqpBytesToString(entry.key)] = amqpFieldValueToJson(entry.value);
    }

    return object;
}

MessageProperties amqpPropertiesToMessageProperties(const amqp_basic_properties_t& properties) {
    MessageProperties result;
    const auto flags = properties._flags;

    if (flags & AMQP_BASIC_TYPE_FLAG) {
        result.type = amqpBytesToString(properties.type);
    }
    if (flags & AMQP_BASIC_MESSAGE_ID_FLAG) {
        result.messageId = amqpBytesToString(properties.message_id);
    }
    if (flags & AMQP_BASIC_APP_ID_FLAG) {
        result.appId = amqpBytesToString(properties.app_id);
    }
    if (flags & AMQP_BASIC_CLUSTER_ID_FLAG) {
        result.clusterId = amqpBytesToString(properties.cluster_id);
    }
    if (flags & AMQP_BASIC_CONTENT_TYPE_FLAG) {
        result.contentType = amqpBytesToString(properties.content_type);
    }
    if (flags & AMQP_BASIC_CONTENT_ENCODING_FLAG) {
        result.contentEncoding = amqpBytesToString(properties.content_encoding);
    }
    if (flags & AMQP_BASIC_CORRELATION_ID_FLAG) {
        result.correlationId = amqpBytesToString(properties.correlation_id);
    }
    if (flags & AMQP_BASIC_DELIVERY_MODE_FLAG) {
        result.deliveryMode = properties.delivery_mode;
    }
    if (flags & AMQP_BASIC_EXPIRATION_FLAG) {
        result.expiration = amqpBytesToString(properties.expiration);
    }
    if (flags & AMQP_BASIC_PRIORITY_FLAG) {
        result.priority = properties.priority;
    }
    if (flags & AMQP_BASIC_REPLY_TO_FLAG) {
        result.replyTo = amqpBytesToString(properties.reply_to);
    }
    if (flags & AMQP_BASIC_TIMESTAMP_FLAG) {
        result.timestamp = properties.timestamp;
    }
    if (flags & AMQP_BASIC_USER_ID_FLAG) {
        result.userId = amqpBytesToString(properties.user_id);
    }
    if (flags & AMQP_BASIC_HEADERS_FLAG) {
        result.headers = amqpTableToJson(properties.headers);
    }

    return result;
}

std::string rpcReplyToString(const amqp_rpc_reply_t& reply) {
    std::ostringstream oss;

    switch (reply.reply_type) {
        case AMQP_RESPONSE_NORMAL:
            return "OK";

        case AMQP_RESPONSE_NONE:
            return "Missing RPC reply type";

        case AMQP_RESPONSE_LIBRARY_EXCEPTION:
            return amqpErrorToString(reply.library_error);

        case AMQP_RESPONSE_SERVER_EXCEPTION:
            switch (reply.reply.id) {
                case AMQP_CONNECTION_CLOSE_METHOD: {
                    const auto* method = static_cast<const amqp_connection_close_t*>(reply.reply.decoded);
                    oss << "Server connection error " << method->reply_code << ": "
                        << amqpBytesToString(method->reply_text);
                    return oss.str();
                }
                case AMQP_CHANNEL_CLOSE_METHOD: {
                    const auto* method = static_cast<const amqp_channel_close_t*>(reply.reply.decoded);
                    oss << "Server channel error " << method->reply_code << ": "
                        << amqpBytesToString(method->reply_text);
                    return oss.str();
                }
                default:
                    oss << "Unknown server error, method id 0x" << std::hex << reply.reply.id;
                    return oss.str();
            }
    }

    return "Unknown RPC reply";
}

// Exception implementations
BrokerException::BrokerException(const std::string& message, ErrorType type)
    : message_(message), errorType_(type) {
}

const char* BrokerException::what() const noexcept {
    return message_.c_str();
}

ErrorType BrokerException::getErrorType() const noexcept {
    return errorType_;
}

ConnectionException::ConnectionException(const std::string& message)
    : BrokerException(message, ErrorType::ConnectionError) {
}

ChannelException::ChannelException(const std::string& message)
    : BrokerException(message, ErrorType::ChannelError) {
}

AuthenticationException::AuthenticationException(const std::string& message)
    : BrokerException(message, ErrorType::AuthenticationError) {
}

} // namespace broker_client
