#include "message_output/output_options.hpp"
#include <algorithm>
#include <cctype>

namespace message_output {

std::string outputFormatToString(OutputFormat format) {
    switch (format) {
        case OutputFormat::Plain: return "plain";
        case OutputFormat::Table: return "table";
        case OutputFormat::Json: return "json";
        default: return "unknown";
    }
}

std::optional<OutputFormat> outputFormatFromString(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "plain") return OutputFormat::Plain;
    if (lower == "table") return OutputFormat::Table;
    if (lower == "json") return OutputFormat::Json;
    return std::nullopt;
}

} // namespace message_output
