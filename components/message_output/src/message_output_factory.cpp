#include "message_output/message_output_factory.hpp"
#include "message_output/console_output.hpp"
#include "message_output/file_output.hpp"

namespace message_output {

std::shared_ptr<message_retrieval::IMessageSink> createMessageOutput(const OutputOptions& options,
                                                                     const FileOutputConfig& fileConfig,
                                                                     int64_t messageCountLimit,
                                                                     std::ostream& console) {
    if (options.outputFile.empty()) {
        return std::make_shared<ConsoleOutput>(console, options.format, options.compact);
    }

    return std::make_shared<FileOutput>(options.outputFile, options.format, options.compact,
                                        fileConfig, messageCountLimit);
}

} // namespace message_output
