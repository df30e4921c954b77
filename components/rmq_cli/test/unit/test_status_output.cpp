// test/unit/test_status_output.cpp
#include <gtest/gtest.h>
#include "rmq_cli/status_output.hpp"
#include <sstream>

using namespace rmq_cli;

TEST(ConsoleStatusOutputTest, PlainSymbolsWithoutColor) {
    std::ostringstream out;
    ConsoleStatusOutput status(out, false, true);

    status.showStatus("Connecting");
    status.showSuccess("Done");
    status.showWarning("Queue is empty");
    status.showError("Failed");

    EXPECT_EQ("⛯ Connecting\n✔ Done\n⚠ Queue is empty\n✗ Failed\n", out.str());
}

TEST(ConsoleStatusOutputTest, ColoursSymbols) {
    std::ostringstream out;
    ConsoleStatusOutput status(out, false, false);

    status.showError("Failed");

    EXPECT_EQ("\033[31m✗\033[0m Failed\n", out.str());
}

TEST(ConsoleStatusOutputTest, QuietOnlyShowsErrors) {
    std::ostringstream out;
    ConsoleStatusOutput status(out, true, true);

    status.showStatus("Connecting");
    status.showSuccess("Done");
    status.showWarning("Careful");
    status.showError("Queue 'orders' not found");

    EXPECT_EQ("✗ Queue 'orders' not found\n", out.str());
}

TEST(ConsoleStatusOutputTest, ErrorDetailsAreAppended) {
    std::ostringstream out;
    ConsoleStatusOutput status(out, false, true);

    status.showError("Failed to connect", "Connection refused");

    EXPECT_EQ("✗ Failed to connect: Connection refused\n", out.str());
}

TEST(ConsoleStatusOutputTest, LeadingNewlineComesBeforeSymbol) {
    std::ostringstream out;
    ConsoleStatusOutput status(out, false, true);

    status.showWarning("\nMessage retrieval cancelled by user");

    EXPECT_EQ("\n⚠ Message retrieval cancelled by user\n", out.str());
}
