#include "rmq_cli/status_output.hpp"

namespace rmq_cli {

namespace {

constexpr const char* kReset = "\033[0m";
constexpr const char* kBlue = "\033[34m";
constexpr const char* kGreen = "\033[32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kRed = "\033[31m";

constexpr const char* kStatusSymbol = "⛯";
constexpr const char* kSuccessSymbol = "✔";
constexpr const char* kWarningSymbol = "⚠";
constexpr const char* kErrorSymbol = "✗";

} // namespace

ConsoleStatusOutput::ConsoleStatusOutput(std::ostream& out, bool quiet, bool noColor)
    : out_(out), quiet_(quiet), noColor_(noColor) {
}

void ConsoleStatusOutput::showStatus(const std::string& message) {
    if (quiet_) {
        return;
    }
    writeLine(kBlue, kStatusSymbol, message);
}

void ConsoleStatusOutput::showSuccess(const std::string& message) {
    if (quiet_) {
        return;
    }
    writeLine(kGreen, kSuccessSymbol, message);
}

void ConsoleStatusOutput::showWarning(const std::string& message) {
    if (quiet_) {
        return;
    }
    writeLine(kYellow, kWarningSymbol, message);
}

void ConsoleStatusOutput::showError(const std::string& message, const std::string& details) {
    writeLine(kRed, kErrorSymbol, details.empty() ? message : message + ": " + details);
}

void ConsoleStatusOutput::writeLine(const char* color, const char* symbol, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Leading blank lines go before the symbol
    const auto textStart = message.find_first_not_of('\n');
    const std::string text = textStart == std::string::npos ? std::string() : message.substr(textStart);
    out_ << std::string(textStart == std::string::npos ? message.size() : textStart, '\n');

    if (noColor_) {
        out_ << symbol << " " << text << "\n";
    } else {
        out_ << color << symbol << kReset << " " << text << "\n";
    }
    out_.flush();
}

} // namespace rmq_cli
