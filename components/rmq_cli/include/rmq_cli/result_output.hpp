#pragma once

#include "message_output/output_options.hpp"
#include "message_retrieval/status_output.hpp"
#include "message_retrieval/types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ostream>
#include <string>

namespace rmq_cli {

/**
 * @brief End-of-run reporting
 *
 * Prints the completion status lines and a summary of the run, as plain
 * rows or as one JSON object when the output format is JSON.
 */
class ResultOutput {
public:
    ResultOutput(message_retrieval::IStatusOutput& status, std::ostream& out,
                 message_output::OutputFormat format, bool quiet);

    void report(const message_retrieval::RetrievalResult& result);

    static std::string toPlain(const message_retrieval::RetrievalResult& result);
    static nlohmann::json toJson(const message_retrieval::RetrievalResult& result,
                                 std::chrono::system_clock::time_point timestamp);

private:
    message_retrieval::IStatusOutput& status_;
    std::ostream& out_;
    message_output::OutputFormat format_;
    bool quiet_;
};

} // namespace rmq_cli
