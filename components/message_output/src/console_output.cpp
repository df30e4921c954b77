#include "message_output/console_output.hpp"
#include "message_output/formatters.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace message_output {

ConsoleOutput::ConsoleOutput(std::ostream& out, OutputFormat format, bool compact)
    : out_(out), format_(format), compact_(compact) {
    spdlog::debug("Writing messages to the console as {}", outputFormatToString(format_));
}

void ConsoleOutput::write(const broker_client::DeliveredMessage& message) {
    out_ << formatMessage(message, format_, compact_) << '\n';
    if (!out_) {
        throw std::runtime_error("Failed to write message " + std::to_string(message.getDeliveryTag()) +
                                 " to the console");
    }
    spdlog::trace("Message #{} written to console", message.getDeliveryTag());
}

void ConsoleOutput::flush() {
    out_.flush();
}

} // namespace message_output
