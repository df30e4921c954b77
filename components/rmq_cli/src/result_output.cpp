#include "rmq_cli/result_output.hpp"
#include "message_output/output_utilities.hpp"
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace rmq_cli {

namespace {

std::string isoTimestamp(std::chrono::system_clock::time_point timestamp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string processedDescription(const message_retrieval::RetrievalResult& result) {
    std::string text = message_output::messageCountString(result.messagesProcessed);
    if (result.messagesSkipped > 0) {
        text += " (" + std::to_string(result.messagesSkipped) + " skipped & requeued by RabbitMQ)";
    }
    return text;
}

double messagesPerSecond(const message_retrieval::RetrievalResult& result) {
    if (result.elapsed.count() <= 0) {
        return 0.0;
    }
    const double rate = static_cast<double>(result.messagesProcessed) * 1000.0 /
                        static_cast<double>(result.elapsed.count());
    return std::round(rate * 100.0) / 100.0;
}

} // namespace

ResultOutput::ResultOutput(message_retrieval::IStatusOutput& status, std::ostream& out,
                           message_output::OutputFormat format, bool quiet)
    : status_(status), out_(out), format_(format), quiet_(quiet) {
}

void ResultOutput::report(const message_retrieval::RetrievalResult& result) {
    if (result.cancelledByUser) {
        status_.showWarning("\nMessage retrieval cancelled by user");
    }

    status_.showSuccess("Retrieved " + message_output::messageCountString(result.messagesProcessed) + " in " +
                        message_output::elapsedTimeString(result.elapsed));

    if (result.acksFailed > 0) {
        status_.showWarning(std::to_string(result.acksFailed) +
                            " acknowledgement(s) failed; those messages stay on the queue");
    }

    if (quiet_) {
        return;
    }

    if (format_ == message_output::OutputFormat::Json) {
        out_ << toJson(result, std::chrono::system_clock::now()).dump(2) << std::endl;
        return;
    }

    out_ << toPlain(result) << std::flush;
}

std::string ResultOutput::toPlain(const message_retrieval::RetrievalResult& result) {
    std::ostringstream oss;
    oss << "\nSummary:\n";
    oss << "  Queue:      " << result.queue << "\n";
    oss << "  Mode:       " << message_retrieval::retrievalModeToString(result.mode) << "\n";
    oss << "  Ack Mode:   " << message_retrieval::ackModeToString(result.ackMode) << "\n";
    oss << "  Received:   " << message_output::messageCountString(result.messagesReceived) << "\n";
    oss << "  Processed:  " << processedDescription(result) << "\n";
    oss << "  Total size: " << message_output::toSizeString(result.totalBytes) << "\n";
    return oss.str();
}

nlohmann::json ResultOutput::toJson(const message_retrieval::RetrievalResult& result,
                                    std::chrono::system_clock::time_point timestamp) {
    nlohmann::json details = {
        {"messages_received", result.messagesReceived},
        {"messages_processed", result.messagesProcessed},
        {"messages_skipped", result.messagesSkipped},
        {"duration_ms", result.elapsed.count()},
        {"duration", message_output::elapsedTimeString(result.elapsed)},
        {"ack_mode", message_retrieval::ackModeToString(result.ackMode)},
        {"retrieval_mode", message_retrieval::retrievalModeToString(result.mode)},
        {"messages_per_second", messagesPerSecond(result)},
        {"total_size_bytes", result.totalBytes},
        {"total_size", message_output::toSizeString(result.totalBytes)}
    };

    if (result.cancelledByUser) {
        details["cancellation_reason"] = message_retrieval::shutdownReasonToString(result.shutdownReason);
    }

    return {
        {"status", result.cancelledByUser ? "partial" : "success"},
        {"timestamp", isoTimestamp(timestamp)},
        {"queue", result.queue},
        {"result", details}
    };
}

} // namespace rmq_cli
