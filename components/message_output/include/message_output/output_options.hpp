#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace message_output {

// How each retrieved message is rendered
enum class OutputFormat {
    Plain,
    Table,
    Json
};

struct OutputOptions {
    OutputFormat format{OutputFormat::Table};
    bool compact{false};        // table: only rows with values
    std::string outputFile;     // empty writes to the console
};

// Settings that apply only when writing to files
struct FileOutputConfig {
    std::string messageDelimiter{"\n"};
    size_t messagesPerFile{10000};
};

std::string outputFormatToString(OutputFormat format);
std::optional<OutputFormat> outputFormatFromString(const std::string& value);

} // namespace message_output
