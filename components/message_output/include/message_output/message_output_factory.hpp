#pragma once

#include "message_output/output_options.hpp"
#include "message_retrieval/message_sink.hpp"
#include <cstdint>
#include <iostream>
#include <memory>

namespace message_output {

/**
 * @brief Create the sink for a retrieval run
 *
 * Console output when options.outputFile is empty, file output otherwise.
 */
std::shared_ptr<message_retrieval::IMessageSink> createMessageOutput(const OutputOptions& options,
                                                                     const FileOutputConfig& fileConfig,
                                                                     int64_t messageCountLimit,
                                                                     std::ostream& console = std::cout);

} // namespace message_output
