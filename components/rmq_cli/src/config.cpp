#include "rmq_cli/config.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>

namespace rmq_cli {

namespace {

bool fileExists(const std::string& path) {
    struct stat info;
    return ::stat(path.c_str(), &info) == 0 && S_ISREG(info.st_mode);
}

std::string environmentOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value != nullptr && *value != '\0') {
        return value;
    }
    return fallback;
}

} // namespace

CliConfig ConfigLoader::load(const std::optional<std::string>& customPath) {
    CliConfig config;

    applyFileIfExists(config, systemConfigPath());

    const std::string userPath = userConfigPath();
    if (!userPath.empty()) {
        applyFileIfExists(config, userPath);
    }

    if (customPath) {
        if (!fileExists(*customPath)) {
            throw std::runtime_error("Configuration file not found: " + *customPath);
        }
        apply(config, loadJsonFromFile(*customPath), *customPath);
        spdlog::debug("Loaded configuration from {}", *customPath);
    }

    return config;
}

void ConfigLoader::applyFileIfExists(CliConfig& config, const std::string& filepath) {
    if (!fileExists(filepath)) {
        spdlog::debug("Configuration file {} not present, skipping", filepath);
        return;
    }

    apply(config, loadJsonFromFile(filepath), filepath);
    spdlog::debug("Loaded configuration from {}", filepath);
}

void ConfigLoader::apply(CliConfig& config, const nlohmann::json& json, const std::string& source) {
    if (!json.is_object()) {
        throw std::runtime_error("Invalid configuration in " + source + ": top level must be an object");
    }

    try {
        if (json.contains("rabbitmq")) {
            const auto& rabbitmq = json["rabbitmq"];

            if (rabbitmq.contains("host")) {
                config.rabbitmq.host = rabbitmq["host"].get<std::string>();
            }

            if (rabbitmq.contains("port")) {
                const int port = rabbitmq["port"].get<int>();
                if (port <= 0 || port > 65535) {
                    throw std::runtime_error("Invalid configuration in " + source + ": port " +
                                             std::to_string(port) + " is out of range");
                }
                config.rabbitmq.port = port;
            }

            if (rabbitmq.contains("virtualHost")) {
                config.rabbitmq.virtualHost = rabbitmq["virtualHost"].get<std::string>();
            }

            if (rabbitmq.contains("user")) {
                config.rabbitmq.user = rabbitmq["user"].get<std::string>();
            }

            if (rabbitmq.contains("password")) {
                config.rabbitmq.password = rabbitmq["password"].get<std::string>();
            }
        }

        if (json.contains("output")) {
            const auto& output = json["output"];

            if (output.contains("format")) {
                const auto name = output["format"].get<std::string>();
                auto format = message_output::outputFormatFromString(name);
                if (!format) {
                    throw std::runtime_error("Invalid configuration in " + source +
                                             ": unknown output format '" + name + "'");
                }
                config.output.format = *format;
            }

            if (output.contains("compact")) {
                config.output.compact = output["compact"].get<bool>();
            }

            if (output.contains("quiet")) {
                config.output.quiet = output["quiet"].get<bool>();
            }

            if (output.contains("verbose")) {
                config.output.verbose = output["verbose"].get<bool>();
            }

            if (output.contains("noColor")) {
                config.output.noColor = output["noColor"].get<bool>();
            }
        }

        if (json.contains("fileOutput")) {
            const auto& fileOutput = json["fileOutput"];

            if (fileOutput.contains("messageDelimiter")) {
                config.fileOutput.messageDelimiter = fileOutput["messageDelimiter"].get<std::string>();
            }

            if (fileOutput.contains("messagesPerFile")) {
                const auto perFile = fileOutput["messagesPerFile"].get<int64_t>();
                if (perFile <= 0) {
                    throw std::runtime_error("Invalid configuration in " + source +
                                             ": messagesPerFile must be positive");
                }
                config.fileOutput.messagesPerFile = static_cast<size_t>(perFile);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid configuration in " + source + ": " + e.what());
    }
}

std::string ConfigLoader::systemConfigPath() {
    return environmentOr(kSystemPathVariable, "/etc/rmq-retriever/config.json");
}

std::string ConfigLoader::userConfigPath() {
    const char* override = std::getenv(kUserPathVariable);
    if (override != nullptr && *override != '\0') {
        return override;
    }

    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return {};
    }
    return std::string(home) + "/.config/rmq-retriever/config.json";
}

nlohmann::json ConfigLoader::loadJsonFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open configuration file: " + filepath);
    }

    try {
        nlohmann::json json;
        file >> json;
        return json;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse configuration file " + filepath + ": " + e.what());
    }
}

nlohmann::json ConfigLoader::toJson(const CliConfig& config) {
    nlohmann::json json;

    json["rabbitmq"] = {
        {"host", config.rabbitmq.host},
        {"port", config.rabbitmq.port},
        {"virtualHost", config.rabbitmq.virtualHost},
        {"user", config.rabbitmq.user},
        {"password", config.rabbitmq.password}
    };

    json["output"] = {
        {"format", message_output::outputFormatToString(config.output.format)},
        {"compact", config.output.compact},
        {"quiet", config.output.quiet},
        {"verbose", config.output.verbose},
        {"noColor", config.output.noColor}
    };

    json["fileOutput"] = {
        {"messageDelimiter", config.fileOutput.messageDelimiter},
        {"messagesPerFile", config.fileOutput.messagesPerFile}
    };

    return json;
}

broker_client::ConnectionConfig ConfigLoader::toConnectionConfig(const CliConfig& config) {
    broker_client::ConnectionConfig connection;
    connection.host = config.rabbitmq.host;
    connection.port = config.rabbitmq.port;
    connection.vhost = config.rabbitmq.virtualHost;
    connection.username = config.rabbitmq.user;
    connection.password = config.rabbitmq.password;
    return connection;
}

} // namespace rmq_cli
