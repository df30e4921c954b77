#pragma once

#include <functional>
#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <exception>
#include <amqp.h>
#include <nlohmann/json.hpp>

namespace broker_client {

// Forward declarations
class Connection;
class Channel;
class DeliveredMessage;

// Connection states
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Disconnecting,
    Error
};

// Channel states
enum class ChannelState {
    Closed,
    Opening,
    Open,
    Closing,
    Failed
};

// Error types
enum class ErrorType {
    None,
    ConnectionError,
    ChannelError,
    AuthenticationError,
    NetworkError,
    ProtocolError,
    TimeoutError,
    ResourceError,
    NotFoundError
};


// Result template for operations that can succeed or fail
template<typename T>
class Result {
public:
    // Success constructor
    explicit Result(T value) : success(true), value(std::move(value)), error(ErrorType::None) {}

    // Failure constructor
    explicit Result(ErrorType errorType, const std::string& errorMessage = "")
        : success(false), error(errorType), message(errorMessage) {}

    // Default constructor
    Result() : success(true), error(ErrorType::None) {}

    // Check if result is successful
    operator bool() const { return success; }

    // Access value (only if successful)
    T& operator*() { return value; }
    const T& operator*() const { return value; }

    T* operator->() { return &value; }
    const T* operator->() const { return &value; }

    bool success;
    T value{};
    ErrorType error{ErrorType::None};
    std::string message;
};

// Specialization for void
template<>
class Result<void> {
public:
    // Success constructor
    Result() : success(true), error(ErrorType::None) {}

    // Failure constructor
    explicit Result(ErrorType errorType, const std::string& errorMessage = "")
        : success(false), error(errorType), message(errorMessage) {}

    // Check if result is successful
    operator bool() const { return success; }

    bool success;
    ErrorType error{ErrorType::None};
    std::string message;
};


// Connection configuration
struct ConnectionConfig {
    std::string host{"localhost"};
    int port{5672};
    std::string vhost{"/"};
    std::string username{"guest"};
    std::string password{"guest"};

    // Connection settings
    std::chrono::seconds heartbeat{60};
    uint32_t frameMax{131072};
    uint16_t channelMax{0};
    std::chrono::milliseconds connectionTimeout{std::chrono::seconds(30)};

    // How long the consumer thread blocks in a single poll before yielding the connection
    std::chrono::milliseconds consumePollInterval{10};
};

// Queue information returned by a passive declare
struct QueueInfo {
    std::string name;
    uint64_t messageCount{0};
    uint64_t consumerCount{0};
};

// AMQP basic properties of a delivered message; unset fields stay empty
struct MessageProperties {
    std::optional<std::string> type;
    std::optional<std::string> messageId;
    std::optional<std::string> appId;
    std::optional<std::string> clusterId;
    std::optional<std::string> contentType;
    std::optional<std::string> contentEncoding;
    std::optional<std::string> correlationId;
    std::optional<uint8_t> deliveryMode;
    std::optional<std::string> expiration;
    std::optional<uint8_t> priority;
    std::optional<std::string> replyTo;
    std::optional<uint64_t> timestamp;      // seconds since the Unix epoch
    std::optional<std::string> userId;
    nlohmann::json headers = nlohmann::json::object();

    bool hasHeaders() const { return headers.is_object() && !headers.empty(); }
    bool hasAnyProperty() const;
};

// Delivery callback; invoked once per delivery, never concurrently for one consumer
using DeliveryCallback = std::function<void(DeliveredMessage message)>;

// Invoked when a subscription ends without basicCancel: broker cancel, channel or connection close
using ConsumerLostCallback = std::function<void(const std::string& consumerTag, const std::string& reason)>;

// Exception classes
class BrokerException : public std::exception {
public:
    explicit BrokerException(const std::string& message, ErrorType type = ErrorType::None);
    const char* what() const noexcept override;
    ErrorType getErrorType() const noexcept;

private:
    std::string message_;
    ErrorType errorType_;
};

class ConnectionException : public BrokerException {
public:
    explicit ConnectionException(const std::string& message);
};

class ChannelException : public BrokerException {
public:
    explicit ChannelException(const std::string& message);
};

class AuthenticationException : public BrokerException {
public:
    explicit AuthenticationException(const std::string& message);
};

// Utility function declarations
std::string connectionStateToString(ConnectionState state);
std::string channelStateToString(ChannelState state);
std::string errorTypeToString(ErrorType type);
std::string amqpErrorToString(int amqpStatus);
ErrorType amqpErrorToErrorType(int amqpStatus);

// AMQP utility functions
std::string amqpBytesToString(const amqp_bytes_t& bytes);
nlohmann::json amqpFieldValueToJson(const amqp_field_value_t& value);
nlohmann::json amqpTableToJson(const amqp_table_t& table);
MessageProperties amqpPropertiesToMessageProperties(const amqp_basic_properties_t& properties);
std::string rpcReplyToString(const amqp_rpc_reply_t& reply);

} // namespace broker_client
