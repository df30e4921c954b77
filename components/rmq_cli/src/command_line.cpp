#include "rmq_cli/command_line.hpp"
#include "message_retrieval/retrieval_strategy.hpp"
#include <boost/program_options.hpp>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace po = boost::program_options;

namespace rmq_cli {

namespace {

constexpr int kCommandLineStyle = po::command_line_style::unix_style ^ po::command_line_style::allow_guessing;

po::options_description makeGlobalOptions() {
    po::options_description desc("Global options");
    desc.add_options()
        ("help,h", "Print help message")
        ("config", po::value<std::string>(), "Configuration file (JSON)")
        ("host", po::value<std::string>(), "RabbitMQ host")
        ("port", po::value<int>(), "RabbitMQ port")
        ("vhost", po::value<std::string>(), "RabbitMQ virtual host")
        ("user", po::value<std::string>(), "RabbitMQ user")
        ("password", po::value<std::string>(), "RabbitMQ password")
        ("verbose", po::bool_switch()->default_value(false), "Enable debug logging")
        ("quiet", po::bool_switch()->default_value(false), "Only print messages and errors")
        ("no-color", po::bool_switch()->default_value(false), "Disable coloured status output");
    return desc;
}

po::options_description makeConsumeOptions() {
    po::options_description desc("consume options");
    desc.add_options()
        ("queue,q", po::value<std::string>()->required(), "Queue to consume from")
        ("ack-mode,a", po::value<std::string>()->default_value("ack"), "ack, reject or requeue")
        ("count,c", po::value<int64_t>()->default_value(-1), "Number of messages to retrieve (-1 = continuous)")
        ("prefetch-count,p", po::value<int>(), "Prefetch count (0 = unlimited)")
        ("output,o", po::value<std::string>(), "Output format: plain, table or json")
        ("to-file", po::value<std::string>(), "Write messages to this file")
        ("compact", po::bool_switch()->default_value(false), "Only show properties that are set");
    return desc;
}

po::options_description makePeekOptions() {
    po::options_description desc("peek options");
    desc.add_options()
        ("queue,q", po::value<std::string>()->required(), "Queue to peek into")
        ("count,c", po::value<int64_t>()->default_value(1), "Number of messages to show")
        ("output,o", po::value<std::string>(), "Output format: plain, table or json")
        ("to-file", po::value<std::string>(), "Write messages to this file")
        ("compact", po::bool_switch()->default_value(false), "Only show properties that are set");
    return desc;
}

std::string makeHelpText(const po::options_description& globalOptions, const std::string& command) {
    std::ostringstream oss;
    oss << "Usage: rmq-retriever [global options] <consume|peek> [command options]\n\n";
    oss << globalOptions << "\n";
    if (command.empty() || command == "consume") {
        oss << makeConsumeOptions() << "\n";
    }
    if (command.empty() || command == "peek") {
        oss << makePeekOptions() << "\n";
    }
    return oss.str();
}

void readGlobalOptions(const po::variables_map& vm, CommandLine& commandLine) {
    if (vm.count("config")) {
        commandLine.configPath = vm["config"].as<std::string>();
    }
    if (vm.count("host")) {
        commandLine.host = vm["host"].as<std::string>();
    }
    if (vm.count("port")) {
        const int port = vm["port"].as<int>();
        if (port <= 0 || port > 65535) {
            throw std::invalid_argument("Port must be between 1 and 65535, got " + std::to_string(port));
        }
        commandLine.port = port;
    }
    if (vm.count("vhost")) {
        commandLine.virtualHost = vm["vhost"].as<std::string>();
    }
    if (vm.count("user")) {
        commandLine.user = vm["user"].as<std::string>();
    }
    if (vm.count("password")) {
        commandLine.password = vm["password"].as<std::string>();
    }

    commandLine.verbose = vm["verbose"].as<bool>();
    commandLine.quiet = vm["quiet"].as<bool>();
    commandLine.noColor = vm["no-color"].as<bool>();
}

void readOutputOptions(const po::variables_map& vm, CommandLine& commandLine) {
    if (vm.count("output")) {
        const auto name = vm["output"].as<std::string>();
        auto format = message_output::outputFormatFromString(name);
        if (!format) {
            throw std::invalid_argument("Unknown output format '" + name + "'; expected plain, table or json");
        }
        commandLine.format = *format;
    }
    if (vm.count("to-file")) {
        commandLine.outputFile = vm["to-file"].as<std::string>();
        if (commandLine.outputFile.empty()) {
            throw std::invalid_argument("--to-file requires a path");
        }
    }
    commandLine.compact = vm["compact"].as<bool>();
}

void readConsumeOptions(const po::variables_map& vm, CommandLine& commandLine) {
    auto& retrieval = commandLine.retrieval;
    retrieval.queue = vm["queue"].as<std::string>();

    const auto ackName = vm["ack-mode"].as<std::string>();
    auto ackMode = message_retrieval::ackModeFromString(ackName);
    if (!ackMode) {
        throw std::invalid_argument("Unknown ack mode '" + ackName + "'; expected ack, reject or requeue");
    }
    retrieval.ackMode = *ackMode;

    retrieval.messageCountLimit = vm["count"].as<int64_t>();
    if (retrieval.messageCountLimit == 0 || retrieval.messageCountLimit < -1) {
        throw std::invalid_argument("Message count must be positive, or -1 for continuous retrieval");
    }

    if (vm.count("prefetch-count")) {
        const int prefetch = vm["prefetch-count"].as<int>();
        if (prefetch < 0 || prefetch > std::numeric_limits<uint16_t>::max()) {
            throw std::invalid_argument("Prefetch count must be between 0 and 65535, got " +
                                        std::to_string(prefetch));
        }
        retrieval.prefetchCount = static_cast<uint16_t>(prefetch);
    }

    readOutputOptions(vm, commandLine);
}

void readPeekOptions(const po::variables_map& vm, CommandLine& commandLine) {
    auto& retrieval = commandLine.retrieval;
    retrieval.queue = vm["queue"].as<std::string>();
    retrieval.ackMode = message_retrieval::AckMode::Requeue;

    retrieval.messageCountLimit = vm["count"].as<int64_t>();
    if (retrieval.messageCountLimit < 1) {
        throw std::invalid_argument("Peek count must be at least 1");
    }

    readOutputOptions(vm, commandLine);
}

} // namespace

CommandLine parseCommandLine(int argc, const char* const argv[]) {
    CommandLine commandLine;

    po::options_description globalOptions = makeGlobalOptions();

    po::options_description commandArguments;
    commandArguments.add_options()
        ("command", po::value<std::string>(), "Command to run")
        ("subargs", po::value<std::vector<std::string>>(), "Arguments for the command");

    po::positional_options_description positional;
    positional.add("command", 1).add("subargs", -1);

    po::options_description all;
    all.add(globalOptions).add(commandArguments);

    po::parsed_options parsed = po::command_line_parser(argc, argv)
                                    .options(all)
                                    .positional(positional)
                                    .style(kCommandLineStyle)
                                    .allow_unregistered()
                                    .run();

    po::variables_map vm;
    po::store(parsed, vm);
    po::notify(vm);

    const std::string command = vm.count("command") ? vm["command"].as<std::string>() : std::string();

    if (vm.count("help")) {
        commandLine.help = true;
        commandLine.helpText = makeHelpText(globalOptions, command == "consume" || command == "peek" ? command : "");
        return commandLine;
    }

    readGlobalOptions(vm, commandLine);

    if (command.empty()) {
        throw std::invalid_argument("No command given; expected 'consume' or 'peek'");
    }

    po::options_description commandOptions;
    if (command == "consume") {
        commandLine.mode = message_retrieval::RetrievalMode::Consume;
        commandOptions.add(makeConsumeOptions());
    } else if (command == "peek") {
        commandLine.mode = message_retrieval::RetrievalMode::Peek;
        commandOptions.add(makePeekOptions());
    } else {
        throw std::invalid_argument("Unknown command '" + command + "'; expected 'consume' or 'peek'");
    }

    // Everything the first pass did not recognise, minus the command name itself
    std::vector<std::string> subargs = po::collect_unrecognized(parsed.options, po::include_positional);
    subargs.erase(subargs.begin());

    po::variables_map commandVm;
    po::store(po::command_line_parser(subargs).options(commandOptions).style(kCommandLineStyle).run(), commandVm);
    po::notify(commandVm);

    if (commandLine.mode == message_retrieval::RetrievalMode::Consume) {
        readConsumeOptions(commandVm, commandLine);
    } else {
        readPeekOptions(commandVm, commandLine);
    }

    // Conflicting ack mode and prefetch are rejected before any connection is made
    message_retrieval::RetrievalStrategy::resolve(commandLine.mode, commandLine.retrieval);

    return commandLine;
}

void applyOverrides(CliConfig& config, const CommandLine& commandLine) {
    if (commandLine.host) {
        config.rabbitmq.host = *commandLine.host;
    }
    if (commandLine.port) {
        config.rabbitmq.port = *commandLine.port;
    }
    if (commandLine.virtualHost) {
        config.rabbitmq.virtualHost = *commandLine.virtualHost;
    }
    if (commandLine.user) {
        config.rabbitmq.user = *commandLine.user;
    }
    if (commandLine.password) {
        config.rabbitmq.password = *commandLine.password;
    }

    if (commandLine.format) {
        config.output.format = *commandLine.format;
    }
    if (commandLine.compact) {
        config.output.compact = true;
    }
    if (commandLine.verbose) {
        config.output.verbose = true;
    }
    if (commandLine.quiet) {
        config.output.quiet = true;
    }
    if (commandLine.noColor) {
        config.output.noColor = true;
    }
}

} // namespace rmq_cli
