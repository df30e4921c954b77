#include "message_retrieval/types.hpp"
#include <algorithm>
#include <cctype>

namespace message_retrieval {

std::string ackModeToString(AckMode mode) {
    switch (mode) {
        case AckMode::Ack: return "Ack";
        case AckMode::Reject: return "Reject";
        case AckMode::Requeue: return "Requeue";
        default: return "Unknown";
    }
}

std::optional<AckMode> ackModeFromString(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "ack") return AckMode::Ack;
    if (lower == "reject") return AckMode::Reject;
    if (lower == "requeue") return AckMode::Requeue;
    return std::nullopt;
}

std::string retrievalModeToString(RetrievalMode mode) {
    switch (mode) {
        case RetrievalMode::Consume: return "consume";
        case RetrievalMode::Peek: return "peek";
        default: return "unknown";
    }
}

std::string shutdownReasonToString(ShutdownReason reason) {
    switch (reason) {
        case ShutdownReason::None: return "None";
        case ShutdownReason::UserCancelled: return "User cancellation (Ctrl+C)";
        case ShutdownReason::MessageLimitReached: return "Message count limit reached";
        case ShutdownReason::OutputFailure: return "Output failure";
        case ShutdownReason::ConsumerLost: return "Subscription ended by the broker";
        default: return "Unknown";
    }
}

} // namespace message_retrieval
