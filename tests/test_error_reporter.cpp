#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"

using namespace utils;

TEST_CASE("ErrorReporter - Queue", "[error_reporter]")
{
    ErrorReporter::ClearErrors();

    SECTION("Reports are handed out once")
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Invalid [scanner] cgminer_port", "70000");
        REQUIRE(ErrorReporter::HasPendingErrors());

        auto errors = ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].severity == ErrorSeverity::Warning);
        REQUIRE(errors[0].category == ErrorCategory::Configuration);
        REQUIRE_FALSE(errors[0].timestamp.empty());
        REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
    }

    SECTION("Identical reports fold together")
    {
        for (int i = 0; i < 5; ++i)
            ErrorReporter::ReportError(ErrorCategory::Persistence, "Scan results could not be saved", "disk full");
        ErrorReporter::ReportError(ErrorCategory::Persistence, "Scan results could not be saved", "read-only");

        auto errors = ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 2);
        REQUIRE(errors[0].repeat_count == 5);
        REQUIRE(ErrorReporter::Format(errors[0]) ==
                "Error [Persistence]: Scan results could not be saved (disk full) x5");
        REQUIRE(ErrorReporter::CountFor(ErrorCategory::Persistence) == 6);
    }

    SECTION("Severity floor drops lower reports")
    {
        ErrorReporter::ReportError(ErrorCategory::Scan, ErrorSeverity::Info, "Scan started");
        ErrorReporter::ReportError(ErrorCategory::Scan, "Scan aborted, results discarded");

        auto errors = ErrorReporter::GetPendingErrors(ErrorSeverity::Warning);
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].user_message == "Scan aborted, results discarded");
        REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
    }

    SECTION("Queue is bounded")
    {
        for (int i = 0; i < 150; ++i)
            ErrorReporter::ReportWarning(ErrorCategory::AddressRange, "Bad range " + std::to_string(i));

        auto errors = ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 100);
        REQUIRE(errors.front().user_message == "Bad range 50");
        REQUIRE(ErrorReporter::CountFor(ErrorCategory::AddressRange) == 150);
    }

    ErrorReporter::ClearErrors();
}
