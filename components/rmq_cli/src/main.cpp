#include "rmq_cli/command_line.hpp"
#include "rmq_cli/config.hpp"
#include "rmq_cli/result_output.hpp"
#include "rmq_cli/signal_cancellation.hpp"
#include "rmq_cli/status_output.hpp"
#include "broker_client/connection.hpp"
#include "broker_client/channel.hpp"
#include "message_output/message_output_factory.hpp"
#include "message_retrieval/cancellation.hpp"
#include "message_retrieval/retrieval_service.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <iostream>
#include <memory>

namespace {

void setupLogging(const rmq_cli::OutputSettings& output) {
    auto logger = spdlog::stderr_color_mt("rmq-retriever");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (output.quiet) {
        spdlog::set_level(spdlog::level::off);
    } else if (output.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

int runRetrieval(const rmq_cli::CommandLine& commandLine, const rmq_cli::CliConfig& config,
                 std::shared_ptr<rmq_cli::ConsoleStatusOutput> status) {
    auto connection = std::make_shared<broker_client::Connection>(rmq_cli::ConfigLoader::toConnectionConfig(config));

    spdlog::debug("Connecting to {}:{} vhost {}", config.rabbitmq.host, config.rabbitmq.port,
                  config.rabbitmq.virtualHost);

    auto opened = connection->open();
    if (!opened) {
        throw broker_client::ConnectionException("Failed to connect to RabbitMQ at " + config.rabbitmq.host + ":" +
                                                 std::to_string(config.rabbitmq.port) + ": " + opened.message);
    }

    auto channel = connection->createChannel();
    if (!channel) {
        connection->close();
        throw broker_client::ChannelException("Failed to open channel: " + channel.message);
    }

    message_output::OutputOptions outputOptions;
    outputOptions.format = config.output.format;
    outputOptions.compact = config.output.compact;
    outputOptions.outputFile = commandLine.outputFile;

    auto sink = message_output::createMessageOutput(outputOptions, config.fileOutput,
                                                    commandLine.retrieval.messageCountLimit);

    message_retrieval::CancellationSource cancellation;
    message_retrieval::RetrievalResult result;
    {
        rmq_cli::SignalCancellation signals(cancellation);
        message_retrieval::RetrievalService service(commandLine.mode, *channel, sink, status);

        try {
            result = service.run(commandLine.retrieval, cancellation);
        } catch (const std::exception&) {
            connection->close();
            throw;
        }
    }

    connection->close();

    rmq_cli::ResultOutput resultOutput(*status, std::cerr, config.output.format, config.output.quiet);
    resultOutput.report(result);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    rmq_cli::CommandLine commandLine;
    try {
        commandLine = rmq_cli::parseCommandLine(argc, argv);
    } catch (const std::exception& e) {
        rmq_cli::ConsoleStatusOutput(std::cerr, false, false).showError(e.what());
        std::cerr << "Run 'rmq-retriever --help' for usage" << std::endl;
        return 1;
    }

    if (commandLine.help) {
        std::cout << commandLine.helpText << std::endl;
        return 0;
    }

    rmq_cli::CliConfig config;
    try {
        config = rmq_cli::ConfigLoader::load(commandLine.configPath);
        rmq_cli::applyOverrides(config, commandLine);
    } catch (const std::exception& e) {
        rmq_cli::ConsoleStatusOutput(std::cerr, false, commandLine.noColor).showError(e.what());
        return 1;
    }

    setupLogging(config.output);
    auto status = std::make_shared<rmq_cli::ConsoleStatusOutput>(std::cerr, config.output.quiet,
                                                                 config.output.noColor);

    try {
        return runRetrieval(commandLine, config, status);
    } catch (const std::exception& e) {
        status->showError(e.what());
        return 1;
    }
}
