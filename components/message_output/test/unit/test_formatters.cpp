// test/unit/test_formatters.cpp
#include <gtest/gtest.h>
#include "message_output/formatters.hpp"
#include <sstream>
#include <vector>

using namespace message_output;
using broker_client::DeliveredMessage;
using broker_client::MessageProperties;

namespace {

DeliveredMessage createMessage(const std::string& body, MessageProperties properties = {},
                               uint64_t deliveryTag = 1, bool redelivered = false) {
    return DeliveredMessage("amq.direct", "orders.created", "orders",
                            std::vector<uint8_t>(body.begin(), body.end()),
                            deliveryTag, std::move(properties), redelivered);
}

MessageProperties createFullProperties() {
    MessageProperties properties;
    properties.messageId = "msg-42";
    properties.correlationId = "corr-7";
    properties.contentType = "application/json";
    properties.deliveryMode = 2;
    properties.priority = 5;
    properties.timestamp = 1700000000;
    properties.headers = {{"retry", 3}, {"source", "billing"}};
    return properties;
}

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> result;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        result.push_back(line);
    }
    return result;
}

size_t codePoints(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

} // namespace

TEST(HeaderValueFormatterTest, Scalars) {
    EXPECT_EQ("-", HeaderValueFormatter::formatValue(nullptr));
    EXPECT_EQ("42", HeaderValueFormatter::formatValue(42));
    EXPECT_EQ("true", HeaderValueFormatter::formatValue(true));
    EXPECT_EQ("plain", HeaderValueFormatter::formatValue("plain"));
    EXPECT_EQ("a\\nb\\tc", HeaderValueFormatter::formatValue("a\nb\tc"));
    EXPECT_EQ("<binary data: 4 bytes>", HeaderValueFormatter::formatValue("<binary data: 4 bytes>"));
}

TEST(HeaderValueFormatterTest, SmallCollectionsStayInline) {
    EXPECT_EQ("[]", HeaderValueFormatter::formatValue(nlohmann::json::array()));
    EXPECT_EQ("{}", HeaderValueFormatter::formatValue(nlohmann::json::object()));
    EXPECT_EQ("[1, 2, 3]", HeaderValueFormatter::formatValue(nlohmann::json::array({1, 2, 3})));
    EXPECT_EQ("{a: 1, b: x}", HeaderValueFormatter::formatValue(nlohmann::json{{"a", 1}, {"b", "x"}}));
}

TEST(HeaderValueFormatterTest, NestedObjectsSpanLines) {
    nlohmann::json value = {{"inner", {{"depth", 2}}}};
    EXPECT_EQ("{\n  inner: {depth: 2}\n}", HeaderValueFormatter::formatValue(value));
}

TEST(HeaderValueFormatterTest, LongArraysSpanLines) {
    auto formatted = HeaderValueFormatter::formatValue(nlohmann::json::array({1, 2, 3, 4, 5, 6}));
    EXPECT_EQ("[\n  1\n  2\n  3\n  4\n  5\n  6\n]", formatted);
}

TEST(TextFormatterTest, MinimalMessage) {
    auto text = TextFormatter::format(createMessage("hello"));

    EXPECT_EQ("DeliveryTag: 1\n"
              "Exchange: amq.direct\n"
              "RoutingKey: orders.created\n"
              "Redelivered: false\n"
              "Body:\n"
              "hello",
              text);
}

TEST(TextFormatterTest, PropertiesAndHeaders) {
    auto text = TextFormatter::format(createMessage("{}", createFullProperties(), 9, true));

    EXPECT_NE(std::string::npos, text.find("DeliveryTag: 9\n"));
    EXPECT_NE(std::string::npos, text.find("Redelivered: true\n"));
    EXPECT_NE(std::string::npos, text.find("MessageId: msg-42\n"));
    EXPECT_NE(std::string::npos, text.find("DeliveryMode: 2\n"));
    EXPECT_NE(std::string::npos, text.find("Priority: 5\n"));
    EXPECT_NE(std::string::npos, text.find("Timestamp: 1700000000\n"));
    EXPECT_NE(std::string::npos, text.find("Headers:\n  retry: 3\n  source: billing\n"));
    EXPECT_EQ(std::string::npos, text.find("AppId:"));
}

TEST(JsonFormatterTest, JsonBodyIsEmbedded) {
    auto json = JsonFormatter::toJson(createMessage(R"({"id": 1, "items": [1, 2]})"));

    ASSERT_TRUE(json["body"].is_object());
    EXPECT_EQ(1, json["body"]["id"]);
    EXPECT_EQ("orders.created", json["routingKey"]);
    EXPECT_EQ("amq.direct", json["exchange"]);
    EXPECT_EQ("orders", json["queue"]);
    EXPECT_EQ(1u, json["deliveryTag"].get<uint64_t>());
    EXPECT_FALSE(json["redelivered"].get<bool>());
    EXPECT_FALSE(json.contains("properties"));
}

TEST(JsonFormatterTest, OtherBodiesAreStrings) {
    EXPECT_EQ("plain text", JsonFormatter::toJson(createMessage("plain text"))["body"]);
    EXPECT_EQ("42", JsonFormatter::toJson(createMessage("42"))["body"]);
    EXPECT_EQ("{broken", JsonFormatter::toJson(createMessage("{broken"))["body"]);
    EXPECT_EQ("", JsonFormatter::toJson(createMessage(""))["body"]);
}

TEST(JsonFormatterTest, OnlyPresentPropertiesAreWritten) {
    auto json = JsonFormatter::toJson(createMessage("x", createFullProperties()));

    ASSERT_TRUE(json.contains("properties"));
    const auto& properties = json["properties"];
    EXPECT_EQ("msg-42", properties["messageId"]);
    EXPECT_EQ(2, properties["deliveryMode"]);
    EXPECT_EQ(3, properties["headers"]["retry"]);
    EXPECT_FALSE(properties.contains("appId"));
    EXPECT_FALSE(properties.contains("replyTo"));
}

TEST(JsonFormatterTest, FormatIsSingleLine) {
    auto text = JsonFormatter::format(createMessage("line one\nline two"));

    EXPECT_EQ(std::string::npos, text.find('\n'));
    auto parsed = nlohmann::json::parse(text);
    EXPECT_EQ("line one\nline two", parsed["body"]);
}

TEST(JsonFormatterTest, InvalidUtf8DoesNotThrow) {
    std::string body = "bad \xff\xfe bytes";
    EXPECT_NO_THROW(JsonFormatter::format(createMessage(body)));
}

TEST(TableFormatterTest, PanelIsRectangular) {
    auto table = TableFormatter::format(createMessage("hello\nsecond line", createFullProperties(), 7));
    auto rows = lines(table);

    ASSERT_GT(rows.size(), 4u);
    EXPECT_EQ(0u, rows.front().find("╭─ Message #7 "));
    EXPECT_EQ(0u, rows.back().find("╰"));

    const size_t width = codePoints(rows.front());
    for (const auto& row : rows) {
        EXPECT_EQ(width, codePoints(row)) << row;
    }
}

TEST(TableFormatterTest, Sections) {
    auto table = TableFormatter::format(createMessage("hello", createFullProperties()));

    EXPECT_NE(std::string::npos, table.find("Queue            orders"));
    EXPECT_NE(std::string::npos, table.find("Routing Key      orders.created"));
    EXPECT_NE(std::string::npos, table.find("Redelivered      No"));
    EXPECT_NE(std::string::npos, table.find("── Properties "));
    EXPECT_NE(std::string::npos, table.find("Delivery Mode    Persistent (2)"));
    EXPECT_NE(std::string::npos, table.find("Timestamp        2023-11-14 22:13:20 UTC"));
    EXPECT_NE(std::string::npos, table.find("── Custom Headers "));
    EXPECT_NE(std::string::npos, table.find("source           billing"));
    EXPECT_NE(std::string::npos, table.find("── Body (5 bytes) "));
}

TEST(TableFormatterTest, FullModeShowsPlaceholders) {
    auto table = TableFormatter::format(createMessage("x"), false);

    EXPECT_NE(std::string::npos, table.find("── Properties "));
    EXPECT_NE(std::string::npos, table.find("Message ID       -"));
    EXPECT_NE(std::string::npos, table.find("Cluster ID       -"));
    EXPECT_EQ(std::string::npos, table.find("Custom Headers"));
}

TEST(TableFormatterTest, CompactModeHidesEmptyProperties) {
    auto bare = TableFormatter::format(createMessage("x"), true);
    EXPECT_EQ(std::string::npos, bare.find("Properties"));
    EXPECT_EQ(std::string::npos, bare.find("Message ID"));

    MessageProperties properties;
    properties.appId = "billing";
    auto partial = TableFormatter::format(createMessage("x", properties), true);
    EXPECT_NE(std::string::npos, partial.find("App ID           billing"));
    EXPECT_EQ(std::string::npos, partial.find("Message ID"));
}

TEST(TableFormatterTest, EmptyExchangeShowsDash) {
    DeliveredMessage message("", "orders", "orders", {}, 1);
    auto table = TableFormatter::format(message, true);
    EXPECT_NE(std::string::npos, table.find("Exchange         -"));
    EXPECT_NE(std::string::npos, table.find("Body (0 bytes)"));
}

TEST(TableFormatterTest, DeliveryModeAndTimestamp) {
    EXPECT_EQ("Non-persistent (1)", TableFormatter::formatDeliveryMode(1));
    EXPECT_EQ("Persistent (2)", TableFormatter::formatDeliveryMode(2));
    EXPECT_EQ("7", TableFormatter::formatDeliveryMode(7));
    EXPECT_EQ("1970-01-01 00:00:00 UTC", TableFormatter::formatTimestamp(0));
}

TEST(FormatMessageTest, DispatchesOnFormat) {
    auto message = createMessage("hello");

    EXPECT_EQ(TextFormatter::format(message), formatMessage(message, OutputFormat::Plain, false));
    EXPECT_EQ(JsonFormatter::format(message), formatMessage(message, OutputFormat::Json, false));
    EXPECT_EQ(TableFormatter::format(message, true), formatMessage(message, OutputFormat::Table, true));
}

TEST(OutputOptionsTest, FormatStrings) {
    EXPECT_EQ("plain", outputFormatToString(OutputFormat::Plain));
    EXPECT_EQ("json", outputFormatToString(OutputFormat::Json));
    EXPECT_EQ(OutputFormat::Table, outputFormatFromString("TABLE"));
    EXPECT_EQ(OutputFormat::Json, outputFormatFromString("json"));
    EXPECT_FALSE(outputFormatFromString("xml").has_value());

    OutputOptions options;
    EXPECT_EQ(OutputFormat::Table, options.format);
    FileOutputConfig config;
    EXPECT_EQ("\n", config.messageDelimiter);
    EXPECT_EQ(10000u, config.messagesPerFile);
}
