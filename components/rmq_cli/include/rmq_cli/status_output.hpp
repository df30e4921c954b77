#pragma once

#include "message_retrieval/status_output.hpp"
#include <mutex>
#include <ostream>

namespace rmq_cli {

/**
 * @brief Human-readable status lines on stderr
 *
 * Status, success and warning lines are dropped in quiet mode; errors are
 * always shown.
 */
class ConsoleStatusOutput : public message_retrieval::IStatusOutput {
public:
    ConsoleStatusOutput(std::ostream& out, bool quiet, bool noColor);

    void showStatus(const std::string& message) override;
    void showSuccess(const std::string& message) override;
    void showWarning(const std::string& message) override;
    void showError(const std::string& message, const std::string& details = "") override;

    bool noColor() const { return noColor_; }

private:
    std::ostream& out_;
    bool quiet_;
    bool noColor_;
    std::mutex mutex_;

    void writeLine(const char* color, const char* symbol, const std::string& message);
};

} // namespace rmq_cli
