#pragma once

#include "broker_client/types.hpp"
#include <stdexcept>
#include <string>

namespace message_retrieval {

/**
 * @brief Base exception class for retrieval failures that abort a run
 */
class RetrievalError : public std::exception {
public:
    explicit RetrievalError(const std::string& message) : message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }

protected:
    std::string message_;
};

/**
 * @brief The queue does not exist; raised before any subscription is made
 */
class QueueNotFoundError : public RetrievalError {
public:
    explicit QueueNotFoundError(const std::string& queue)
        : RetrievalError("Queue '" + queue + "' not found"), queue_(queue) {}

    const std::string& queue() const noexcept { return queue_; }

private:
    std::string queue_;
};

/**
 * @brief Conflicting retrieval options
 */
class ConfigurationError : public RetrievalError {
public:
    explicit ConfigurationError(const std::string& message)
        : RetrievalError("Configuration error: " + message) {}
};

/**
 * @brief A broker operation required to start retrieval failed
 */
class BrokerOperationError : public RetrievalError {
public:
    BrokerOperationError(const std::string& message, broker_client::ErrorType type)
        : RetrievalError(message), errorType_(type) {}

    broker_client::ErrorType errorType() const noexcept { return errorType_; }

private:
    broker_client::ErrorType errorType_;
};

/**
 * @brief The output sink failed; remaining in-flight messages are abandoned
 */
class OutputError : public RetrievalError {
public:
    explicit OutputError(const std::string& message)
        : RetrievalError("Output error: " + message) {}
};

} // namespace message_retrieval
