#include "message_output/formatters.hpp"
#include <algorithm>
#include <ctime>
#include <sstream>
#include <vector>

namespace message_output {

namespace {

// Box drawing, rounded corners
const std::string kTopLeft = "╭";
const std::string kTopRight = "╮";
const std::string kBottomLeft = "╰";
const std::string kBottomRight = "╯";
const std::string kHorizontal = "─";
const std::string kVertical = "│";

struct PanelLine {
    std::string text;
    bool rule{false};
};

// Terminal columns taken by a UTF-8 string, one per code point
size_t displayWidth(const std::string& text) {
    size_t width = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

std::string repeat(const std::string& piece, size_t count) {
    std::string result;
    result.reserve(piece.size() * count);
    for (size_t i = 0; i < count; ++i) {
        result += piece;
    }
    return result;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string line;
    for (char c : text) {
        if (c == '\n') {
            lines.push_back(line);
            line.clear();
        } else if (c == '\t') {
            line += "    ";
        } else if (c != '\r') {
            line += c;
        }
    }
    lines.push_back(line);
    return lines;
}

class PanelBuilder {
public:
    void addRow(const std::string& label, const std::string& value) {
        auto valueLines = splitLines(value);
        const size_t labelColumn = std::max(TableFormatter::kLabelWidth, displayWidth(label) + 1);

        std::string first = label + std::string(labelColumn - displayWidth(label), ' ') + valueLines.front();
        lines_.push_back(PanelLine{first, false});
        for (size_t i = 1; i < valueLines.size(); ++i) {
            lines_.push_back(PanelLine{std::string(labelColumn, ' ') + valueLines[i], false});
        }
    }

    void addRule(const std::string& title) {
        lines_.push_back(PanelLine{kHorizontal + kHorizontal + " " + title + " ", true});
    }

    void addText(const std::string& text) {
        for (auto& line : splitLines(text)) {
            lines_.push_back(PanelLine{std::move(line), false});
        }
    }

    std::string render(const std::string& title) const {
        const std::string heading = kHorizontal + " " + title + " ";

        size_t width = displayWidth(heading);
        for (const auto& line : lines_) {
            width = std::max(width, displayWidth(line.text) + (line.rule ? 2 : 0));
        }

        std::ostringstream out;
        out << kTopLeft << heading << repeat(kHorizontal, width + 2 - displayWidth(heading)) << kTopRight << '\n';

        for (const auto& line : lines_) {
            const size_t fill = width - displayWidth(line.text);
            out << kVertical << ' ' << line.text
                << (line.rule ? repeat(kHorizontal, fill) : std::string(fill, ' '))
                << ' ' << kVertical << '\n';
        }

        out << kBottomLeft << repeat(kHorizontal, width + 2) << kBottomRight;
        return out.str();
    }

private:
    std::vector<PanelLine> lines_;
};

void addPropertyRow(PanelBuilder& panel, const char* label, const std::optional<std::string>& value,
                    bool compact) {
    if (value) {
        panel.addRow(label, *value);
    } else if (!compact) {
        panel.addRow(label, "-");
    }
}

} // namespace

std::string TableFormatter::formatDeliveryMode(uint8_t mode) {
    switch (mode) {
        case 1: return "Non-persistent (1)";
        case 2: return "Persistent (2)";
        default: return std::to_string(mode);
    }
}

std::string TableFormatter::formatTimestamp(uint64_t secondsSinceEpoch) {
    std::time_t seconds = static_cast<std::time_t>(secondsSinceEpoch);
    std::tm utc{};
    if (gmtime_r(&seconds, &utc) == nullptr) {
        return std::to_string(secondsSinceEpoch);
    }

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &utc);
    return std::string(buffer) + " UTC";
}

std::string TableFormatter::format(const broker_client::DeliveredMessage& message, bool compact) {
    PanelBuilder panel;

    panel.addRow("Queue", message.getQueue().empty() ? "-" : message.getQueue());
    panel.addRow("Routing Key", message.getRoutingKey());
    panel.addRow("Exchange", message.getExchange().empty() ? "-" : message.getExchange());
    panel.addRow("Redelivered", message.isRedelivered() ? "Yes" : "No");

    const auto& properties = message.getProperties();
    if (properties.hasAnyProperty() || !compact) {
        panel.addRule("Properties");

        addPropertyRow(panel, "Message ID", properties.messageId, compact);
        addPropertyRow(panel, "Correlation ID", properties.correlationId, compact);

        std::optional<std::string> timestamp;
        if (properties.timestamp) {
            timestamp = formatTimestamp(*properties.timestamp);
        }
        addPropertyRow(panel, "Timestamp", timestamp, compact);

        addPropertyRow(panel, "Content Type", properties.contentType, compact);
        addPropertyRow(panel, "Content Encoding", properties.contentEncoding, compact);

        std::optional<std::string> deliveryMode;
        if (properties.deliveryMode) {
            deliveryMode = formatDeliveryMode(*properties.deliveryMode);
        }
        addPropertyRow(panel, "Delivery Mode", deliveryMode, compact);

        std::optional<std::string> priority;
        if (properties.priority) {
            priority = std::to_string(*properties.priority);
        }
        addPropertyRow(panel, "Priority", priority, compact);

        addPropertyRow(panel, "Expiration", properties.expiration, compact);
        addPropertyRow(panel, "Reply To", properties.replyTo, compact);
        addPropertyRow(panel, "Type", properties.type, compact);
        addPropertyRow(panel, "App ID", properties.appId, compact);
        addPropertyRow(panel, "Cluster ID", properties.clusterId, compact);
        addPropertyRow(panel, "User ID", properties.userId, compact);
    }

    if (properties.hasHeaders()) {
        panel.addRule("Custom Headers");
        for (auto it = properties.headers.begin(); it != properties.headers.end(); ++it) {
            panel.addRow(it.key(), HeaderValueFormatter::formatValue(it.value()));
        }
    }

    panel.addRule("Body (" + std::to_string(message.getBodySize()) + " bytes)");
    panel.addText(message.getBodyString());

    return panel.render("Message #" + std::to_string(message.getDeliveryTag()));
}

} // namespace message_output
