#pragma once

#include <string>

namespace message_retrieval {

/**
 * @brief User-facing progress and diagnostics, separate from message output
 */
class IStatusOutput {
public:
    virtual ~IStatusOutput() = default;

    virtual void showStatus(const std::string& message) = 0;
    virtual void showSuccess(const std::string& message) = 0;
    virtual void showWarning(const std::string& message) = 0;
    virtual void showError(const std::string& message, const std::string& details = "") = 0;
};

} // namespace message_retrieval
