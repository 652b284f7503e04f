#include <catch2/catch_test_macros.hpp>

#include "utils/ErrorReporter.hpp"

#include <string>

using namespace utils;

TEST_CASE("ErrorReporter - queueing and draining", "[utils][errors]") {
    (void)ErrorReporter::TakePending();

    SECTION("Reports are drained once") {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "bad key", "line 3");
        ErrorReporter::ReportError(ErrorCategory::Dispatch, "loop fault");
        REQUIRE(ErrorReporter::PendingCount() == 2);

        auto reports = ErrorReporter::TakePending();
        REQUIRE(reports.size() == 2);
        REQUIRE(reports[0].category == ErrorCategory::Configuration);
        REQUIRE(reports[0].technical_details == "line 3");
        REQUIRE_FALSE(reports[0].timestamp.empty());
        REQUIRE(reports[1].severity == ErrorSeverity::Error);
        REQUIRE(ErrorReporter::PendingCount() == 0);
    }

    SECTION("Minimum severity filters the drain") {
        ErrorReporter::ReportWarning(ErrorCategory::Batch, "slow");
        ErrorReporter::Report(ErrorCategory::Network, ErrorSeverity::Fatal, "no route");

        auto reports = ErrorReporter::TakePending(ErrorSeverity::Error);
        REQUIRE(reports.size() == 1);
        REQUIRE(reports[0].user_message == "no route");
        REQUIRE(ErrorReporter::PendingCount() == 0);
    }

    SECTION("Queue is bounded") {
        for (std::size_t i = 0; i < ErrorReporter::kMaxQueued + 10; ++i)
            ErrorReporter::ReportWarning(ErrorCategory::Unknown, "warning " + std::to_string(i));

        auto reports = ErrorReporter::TakePending();
        REQUIRE(reports.size() == ErrorReporter::kMaxQueued);
        REQUIRE(reports.front().user_message == "warning 10");
    }

    SECTION("Category names") {
        REQUIRE(std::string(ErrorReporter::CategoryName(ErrorCategory::Dispatch)) == "Dispatch");
        REQUIRE(std::string(ErrorReporter::CategoryName(ErrorCategory::Unknown)) == "Unknown");
    }
}
