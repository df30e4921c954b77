#pragma once

#include "message_output/output_options.hpp"
#include "message_retrieval/message_sink.hpp"
#include <ostream>

namespace message_output {

// Writes each message to a stream, one formatted message per write
class ConsoleOutput : public message_retrieval::IMessageSink {
public:
    ConsoleOutput(std::ostream& out, OutputFormat format, bool compact = false);

    void write(const broker_client::DeliveredMessage& message) override;
    void flush() override;

private:
    std::ostream& out_;
    OutputFormat format_;
    bool compact_;
};

} // namespace message_output
