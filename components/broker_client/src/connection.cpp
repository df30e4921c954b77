#include "broker_client/connection.hpp"
#include "broker_client/channel.hpp"
#include <spdlog/spdlog.h>
#include <amqp_tcp_socket.h>
#include <sys/time.h>

namespace broker_client {

Connection::Connection(const ConnectionConfig& config)
    : config_(config) {
    spdlog::debug("Creating Connection to {}:{}", config_.host, config_.port);
}

Connection::~Connection() {
    spdlog::debug("Destroying Connection");
    close();
}

Result<void> Connection::open() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == ConnectionState::Connected) {
        return Result<void>();
    }

    spdlog::info("Opening connection to {}:{}{}", config_.host, config_.port, config_.vhost);
    state_ = ConnectionState::Connecting;

    connection_ = amqp_new_connection();
    if (!connection_) {
        return fail(ErrorType::ResourceError, "Failed to create AMQP connection");
    }

    socket_ = amqp_tcp_socket_new(connection_);
    if (!socket_) {
        return fail(ErrorType::ResourceError, "Failed to create TCP socket");
    }

    struct timeval timeout;
    timeout.tv_sec = static_cast<time_t>(config_.connectionTimeout.count() / 1000);
    timeout.tv_usec = static_cast<suseconds_t>((config_.connectionTimeout.count() % 1000) * 1000);

    int status = amqp_socket_open_noblock(socket_, config_.host.c_str(), config_.port, &timeout);
    if (status != AMQP_STATUS_OK) {
        return fail(amqpErrorToErrorType(status),
                    "Failed to open socket to " + config_.host + ":" + std::to_string(config_.port) +
                    ": " + amqpErrorToString(status));
    }

    amqp_rpc_reply_t reply = amqp_login(connection_,
                                        config_.vhost.c_str(),
                                        config_.channelMax,
                                        static_cast<int>(config_.frameMax),
                                        static_cast<int>(config_.heartbeat.count()),
                                        AMQP_SASL_METHOD_PLAIN,
                                        config_.username.c_str(),
                                        config_.password.c_str());

    if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
        ErrorType type = reply.reply_type == AMQP_RESPONSE_SERVER_EXCEPTION
                             ? ErrorType::AuthenticationError
                             : amqpErrorToErrorType(reply.library_error);
        return fail(type, "Login as '" + config_.username + "' failed: " + rpcReplyToString(reply));
    }

    state_ = ConnectionState::Connected;
    spdlog::info("Connection established to {}:{}", config_.host, config_.port);
    return Result<void>();
}

void Connection::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (connection_ == nullptr) {
        state_ = ConnectionState::Disconnected;
        return;
    }

    if (state_ == ConnectionState::Connected) {
        spdlog::info("Closing connection");
        state_ = ConnectionState::Disconnecting;

        amqp_rpc_reply_t reply = amqp_connection_close(connection_, AMQP_REPLY_SUCCESS);
        if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
            spdlog::warn("Connection close was not confirmed: {}", rpcReplyToString(reply));
        }
    }

    destroyHandle();
    state_ = ConnectionState::Disconnected;
}

bool Connection::isConnected() const {
    return state_ == ConnectionState::Connected;
}

ConnectionState Connection::getState() const {
    return state_;
}

Result<std::shared_ptr<Channel>> Connection::createChannel() {
    if (!isConnected()) {
        return Result<std::shared_ptr<Channel>>(ErrorType::ConnectionError,
                                                "Cannot create channel - not connected");
    }

    int channelId = nextChannelId_++;
    spdlog::debug("Creating channel with ID: {}", channelId);

    auto channel = std::make_shared<Channel>(shared_from_this(), static_cast<amqp_channel_t>(channelId));
    auto opened = channel->open();
    if (!opened) {
        return Result<std::shared_ptr<Channel>>(opened.error, opened.message);
    }

    return Result<std::shared_ptr<Channel>>(channel);
}

const ConnectionConfig& Connection::getConfig() const {
    return config_;
}

std::string Connection::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

amqp_connection_state_t Connection::getNativeHandle() const {
    return connection_;
}

std::mutex& Connection::getMutex() const {
    return mutex_;
}

// Private methods
Result<void> Connection::fail(ErrorType type, const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(errorMutex_);
        lastError_ = error;
    }

    spdlog::error("Connection error: {} ({})", error, errorTypeToString(type));

    destroyHandle();
    state_ = ConnectionState::Error;
    return Result<void>(type, error);
}

void Connection::destroyHandle() {
    if (connection_) {
        int status = amqp_destroy_connection(connection_);
        if (status != AMQP_STATUS_OK) {
            spdlog::warn("Failed to release AMQP connection: {}", amqpErrorToString(status));
        }
        connection_ = nullptr;
    }

    socket_ = nullptr; // Socket is owned by connection
}

} // namespace broker_client
