#pragma once

#include "message_retrieval/cancellation.hpp"
#include <boost/asio.hpp>
#include <thread>

namespace rmq_cli {

/**
 * @brief Turns SIGINT/SIGTERM into a cancellation request
 *
 * The first signal starts a graceful stop. A second one ends the process
 * immediately with 128 + signal, for a drain that is stuck. The signal set is
 * serviced by its own io_context thread for the lifetime of this object.
 */
class SignalCancellation {
public:
    explicit SignalCancellation(message_retrieval::CancellationSource& cancellation);
    ~SignalCancellation();

    SignalCancellation(const SignalCancellation&) = delete;
    SignalCancellation& operator=(const SignalCancellation&) = delete;

private:
    message_retrieval::CancellationSource& cancellation_;
    boost::asio::io_context ioContext_;
    boost::asio::signal_set signals_;
    std::thread thread_;

    void waitForSignal();
};

} // namespace rmq_cli
