#pragma once

#include "broker_client/types.hpp"
#include <string>
#include <memory>
#include <atomic>
#include <mutex>
#include <amqp.h>

namespace broker_client {

class Channel;

// A single AMQP connection over rabbitmq-c. The native handle is not
// thread-safe; every library call goes through getMutex().
class Connection : public std::enable_shared_from_this<Connection> {
public:
    explicit Connection(const ConnectionConfig& config);
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection();

    // Connection management
    Result<void> open();
    void close();
    bool isConnected() const;
    ConnectionState getState() const;

    // Opens the next channel on this connection
    Result<std::shared_ptr<Channel>> createChannel();

    const ConnectionConfig& getConfig() const;
    std::string getLastError() const;

    // Low-level access (use with caution)
    amqp_connection_state_t getNativeHandle() const;
    std::mutex& getMutex() const;

private:
    ConnectionConfig config_;

    // AMQP connection state
    amqp_connection_state_t connection_ = nullptr;
    amqp_socket_t* socket_ = nullptr;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    int nextChannelId_ = 1;

    mutable std::mutex mutex_;
    mutable std::mutex errorMutex_;
    std::string lastError_;

    Result<void> fail(ErrorType type, const std::string& error);
    void destroyHandle();
};

} // namespace broker_client
