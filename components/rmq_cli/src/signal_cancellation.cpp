#include "rmq_cli/signal_cancellation.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>

namespace rmq_cli {

SignalCancellation::SignalCancellation(message_retrieval::CancellationSource& cancellation)
    : cancellation_(cancellation), signals_(ioContext_, SIGINT, SIGTERM) {
    waitForSignal();
    thread_ = std::thread([this] { ioContext_.run(); });
}

SignalCancellation::~SignalCancellation() {
    boost::system::error_code ignored;
    signals_.cancel(ignored);
    ioContext_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void SignalCancellation::waitForSignal() {
    signals_.async_wait([this](const boost::system::error_code& error, int signal) {
        if (error) {
            return;
        }
        if (cancellation_.isCancelled()) {
            spdlog::warn("Received signal {} again, exiting without draining", signal);
            spdlog::default_logger()->flush();
            std::_Exit(128 + signal);
        }
        spdlog::info("Received signal {}, stopping (repeat to force exit)", signal);
        cancellation_.cancel();
        waitForSignal();
    });
}

} // namespace rmq_cli
