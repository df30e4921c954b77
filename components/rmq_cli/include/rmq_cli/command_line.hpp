#pragma once

#include "rmq_cli/config.hpp"
#include "message_retrieval/types.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace rmq_cli {

// Parsed invocation: one subcommand plus global overrides
struct CommandLine {
    bool help{false};
    std::string helpText;

    message_retrieval::RetrievalMode mode{message_retrieval::RetrievalMode::Consume};
    message_retrieval::RetrievalOptions retrieval;

    // Output
    std::optional<message_output::OutputFormat> format;
    bool compact{false};
    std::string outputFile;

    // Global
    std::optional<std::string> configPath;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<std::string> virtualHost;
    std::optional<std::string> user;
    std::optional<std::string> password;
    bool verbose{false};
    bool quiet{false};
    bool noColor{false};
};

/**
 * @brief Parse "rmq-retriever [global options] <consume|peek> [command options]"
 * @throws std::invalid_argument or boost::program_options::error for bad input,
 *         message_retrieval::ConfigurationError for conflicting options
 */
CommandLine parseCommandLine(int argc, const char* const argv[]);

// Command-line values override the loaded configuration
void applyOverrides(CliConfig& config, const CommandLine& commandLine);

} // namespace rmq_cli
