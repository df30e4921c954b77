#include "message_output/formatters.hpp"
#include <sstream>
#include <vector>

namespace message_output {

namespace {

const std::string kBinaryMarker = "<binary data:";

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::ostringstream out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out << separator;
        }
        out << parts[i];
    }
    return out.str();
}

} // namespace

std::string HeaderValueFormatter::formatValue(const nlohmann::json& value, int indent) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return "-";
        case nlohmann::json::value_t::string: {
            const auto& text = value.get_ref<const std::string&>();
            if (text.compare(0, kBinaryMarker.size(), kBinaryMarker) == 0) {
                return text;
            }
            return escape(text);
        }
        case nlohmann::json::value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        case nlohmann::json::value_t::object:
            return value.empty() ? "{}" : formatObject(value, indent);
        case nlohmann::json::value_t::array:
            return value.empty() ? "[]" : formatArray(value, indent);
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return value.dump();
        default:
            return "-";
    }
}

std::string HeaderValueFormatter::formatObject(const nlohmann::json& object, int indent) {
    bool nested = false;
    for (const auto& item : object) {
        if (item.is_object() || (item.is_array() && !item.empty() && item.front().is_object())) {
            nested = true;
            break;
        }
    }

    if (!nested && object.size() <= 3) {
        std::vector<std::string> pairs;
        for (auto it = object.begin(); it != object.end(); ++it) {
            pairs.push_back(it.key() + ": " + formatValue(it.value(), indent));
        }
        return "{" + join(pairs, ", ") + "}";
    }

    const std::string padding(static_cast<size_t>(indent + 1) * 2, ' ');
    std::vector<std::string> lines{"{"};
    for (auto it = object.begin(); it != object.end(); ++it) {
        lines.push_back(padding + it.key() + ": " + formatValue(it.value(), indent + 1));
    }
    lines.push_back(std::string(static_cast<size_t>(indent) * 2, ' ') + "}");
    return join(lines, "\n");
}

std::string HeaderValueFormatter::formatArray(const nlohmann::json& array, int indent) {
    bool hasObjects = false;
    for (const auto& item : array) {
        if (item.is_object()) {
            hasObjects = true;
            break;
        }
    }

    if (!hasObjects && array.size() <= 5) {
        std::vector<std::string> items;
        for (const auto& item : array) {
            items.push_back(formatValue(item, indent));
        }
        return "[" + join(items, ", ") + "]";
    }

    const std::string padding(static_cast<size_t>(indent + 1) * 2, ' ');
    std::vector<std::string> lines{"["};
    for (const auto& item : array) {
        lines.push_back(padding + formatValue(item, indent + 1));
    }
    lines.push_back(std::string(static_cast<size_t>(indent) * 2, ' ') + "]");
    return join(lines, "\n");
}

std::string HeaderValueFormatter::escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

} // namespace message_output
