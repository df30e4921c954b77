// test/unit/test_result_output.cpp
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "rmq_cli/result_output.hpp"
#include <sstream>

using namespace rmq_cli;
using message_output::OutputFormat;
using message_retrieval::AckMode;
using message_retrieval::RetrievalMode;
using message_retrieval::RetrievalResult;
using message_retrieval::ShutdownReason;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::StrictMock;

namespace {

class MockStatusOutput : public message_retrieval::IStatusOutput {
public:
    MOCK_METHOD(void, showStatus, (const std::string& message), (override));
    MOCK_METHOD(void, showSuccess, (const std::string& message), (override));
    MOCK_METHOD(void, showWarning, (const std::string& message), (override));
    MOCK_METHOD(void, showError, (const std::string& message, const std::string& details), (override));
};

RetrievalResult createResult() {
    RetrievalResult result;
    result.queue = "orders";
    result.mode = RetrievalMode::Consume;
    result.ackMode = AckMode::Ack;
    result.messagesReceived = 12;
    result.messagesProcessed = 10;
    result.messagesSkipped = 2;
    result.totalBytes = 2048;
    result.elapsed = std::chrono::milliseconds(2000);
    result.shutdownReason = ShutdownReason::MessageLimitReached;
    return result;
}

} // namespace

TEST(ResultOutputTest, PlainSummary) {
    auto text = ResultOutput::toPlain(createResult());

    EXPECT_NE(std::string::npos, text.find("  Queue:      orders\n"));
    EXPECT_NE(std::string::npos, text.find("  Mode:       consume\n"));
    EXPECT_NE(std::string::npos, text.find("  Ack Mode:   Ack\n"));
    EXPECT_NE(std::string::npos, text.find("  Received:   12 messages\n"));
    EXPECT_NE(std::string::npos, text.find("  Processed:  10 messages (2 skipped & requeued by RabbitMQ)\n"));
    EXPECT_NE(std::string::npos, text.find("  Total size: 2 KB\n"));
}

TEST(ResultOutputTest, PlainSummaryOmitsZeroSkipped) {
    auto result = createResult();
    result.messagesSkipped = 0;
    result.messagesProcessed = 1;

    auto text = ResultOutput::toPlain(result);

    EXPECT_NE(std::string::npos, text.find("  Processed:  1 message\n"));
    EXPECT_EQ(std::string::npos, text.find("skipped"));
}

TEST(ResultOutputTest, JsonSummary) {
    const auto timestamp = std::chrono::system_clock::from_time_t(1700000000);
    auto json = ResultOutput::toJson(createResult(), timestamp);

    EXPECT_EQ("success", json["status"]);
    EXPECT_EQ("2023-11-14T22:13:20Z", json["timestamp"]);
    EXPECT_EQ("orders", json["queue"]);

    const auto& result = json["result"];
    EXPECT_EQ(12, result["messages_received"]);
    EXPECT_EQ(10, result["messages_processed"]);
    EXPECT_EQ(2, result["messages_skipped"]);
    EXPECT_EQ(2000, result["duration_ms"]);
    EXPECT_EQ("2s 0ms", result["duration"]);
    EXPECT_EQ("Ack", result["ack_mode"]);
    EXPECT_EQ("consume", result["retrieval_mode"]);
    EXPECT_DOUBLE_EQ(5.0, result["messages_per_second"].get<double>());
    EXPECT_EQ(2048, result["total_size_bytes"]);
    EXPECT_EQ("2 KB", result["total_size"]);
    EXPECT_FALSE(result.contains("cancellation_reason"));
}

TEST(ResultOutputTest, JsonSummaryForCancelledRun) {
    auto result = createResult();
    result.cancelledByUser = true;
    result.shutdownReason = ShutdownReason::UserCancelled;
    result.elapsed = std::chrono::milliseconds(0);

    auto json = ResultOutput::toJson(result, std::chrono::system_clock::now());

    EXPECT_EQ("partial", json["status"]);
    EXPECT_EQ("User cancellation (Ctrl+C)", json["result"]["cancellation_reason"]);
    EXPECT_DOUBLE_EQ(0.0, json["result"]["messages_per_second"].get<double>());
}

TEST(ResultOutputTest, ReportShowsCancellationBeforeCompletion) {
    StrictMock<MockStatusOutput> status;
    std::ostringstream out;
    ResultOutput output(status, out, OutputFormat::Table, false);

    auto result = createResult();
    result.cancelledByUser = true;

    {
        InSequence sequence;
        EXPECT_CALL(status, showWarning("\nMessage retrieval cancelled by user"));
        EXPECT_CALL(status, showSuccess("Retrieved 10 messages in 2s 0ms"));
    }

    output.report(result);

    EXPECT_NE(std::string::npos, out.str().find("Summary:"));
}

TEST(ResultOutputTest, ReportWarnsAboutFailedAcks) {
    NiceMock<MockStatusOutput> status;
    std::ostringstream out;
    ResultOutput output(status, out, OutputFormat::Plain, false);

    auto result = createResult();
    result.acksFailed = 3;

    EXPECT_CALL(status, showWarning(HasSubstr("3 acknowledgement(s) failed")));

    output.report(result);
}

TEST(ResultOutputTest, ReportWritesJsonWhenFormatIsJson) {
    NiceMock<MockStatusOutput> status;
    std::ostringstream out;
    ResultOutput output(status, out, OutputFormat::Json, false);

    output.report(createResult());

    auto json = nlohmann::json::parse(out.str());
    EXPECT_EQ("orders", json["queue"]);
    EXPECT_EQ(10, json["result"]["messages_processed"]);
}

TEST(ResultOutputTest, QuietReportPrintsNoSummary) {
    NiceMock<MockStatusOutput> status;
    std::ostringstream out;
    ResultOutput output(status, out, OutputFormat::Json, true);

    EXPECT_CALL(status, showSuccess(_));

    output.report(createResult());

    EXPECT_TRUE(out.str().empty());
}
