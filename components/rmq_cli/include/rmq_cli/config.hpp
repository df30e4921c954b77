#pragma once

#include "message_output/output_options.hpp"
#include "broker_client/types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace rmq_cli {

struct RabbitMqSettings {
    std::string host{"localhost"};
    int port{5672};
    std::string virtualHost{"/"};
    std::string user{"guest"};
    std::string password{"guest"};
};

struct OutputSettings {
    message_output::OutputFormat format{message_output::OutputFormat::Table};
    bool compact{false};
    bool quiet{false};
    bool verbose{false};
    bool noColor{false};
};

struct CliConfig {
    RabbitMqSettings rabbitmq;
    OutputSettings output;
    message_output::FileOutputConfig fileOutput;
};

/**
 * @brief Layered JSON configuration
 *
 * Later sources win: built-in defaults, the system file, the user file, then
 * a file named on the command line. Missing system and user files are
 * skipped; a malformed file is an error.
 */
class ConfigLoader {
public:
    static constexpr const char* kSystemPathVariable = "RMQ_RETRIEVER_SYSTEM_CONFIG_PATH";
    static constexpr const char* kUserPathVariable = "RMQ_RETRIEVER_USER_CONFIG_PATH";

    /**
     * @brief Load and merge every configuration source
     * @param customPath File given with --config; must exist when set
     * @throws std::runtime_error naming the file that could not be read or parsed
     */
    static CliConfig load(const std::optional<std::string>& customPath = std::nullopt);

    /**
     * @brief Overlay the keys present in json onto config
     * @throws std::runtime_error if a value has the wrong type or is out of range
     */
    static void apply(CliConfig& config, const nlohmann::json& json, const std::string& source);

    static std::string systemConfigPath();
    static std::string userConfigPath();

    static nlohmann::json loadJsonFromFile(const std::string& filepath);
    static nlohmann::json toJson(const CliConfig& config);

    static broker_client::ConnectionConfig toConnectionConfig(const CliConfig& config);

private:
    static void applyFileIfExists(CliConfig& config, const std::string& filepath);
};

} // namespace rmq_cli
