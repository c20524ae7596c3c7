#include <catch2/catch_test_macros.hpp>
#include "utils/Diagnostics.hpp"
#include "utils/ErrorReporter.hpp"

#include <string>

using namespace utils;

TEST_CASE("ErrorReporter - History", "[utils]")
{
    ErrorReporter::ClearHistory();

    SECTION("Reports are kept in order")
    {
        ErrorReporter::ReportWarning(ErrorCategory::Lookup, "first");
        ErrorReporter::ReportError(ErrorCategory::ReferenceData, "second", "details");
        REQUIRE(ErrorReporter::GetLastError().message == "second");

        auto history = ErrorReporter::GetHistorySnapshot();
        REQUIRE(history.size() == 2);
        REQUIRE(history[0].severity == ErrorSeverity::Warning);
        REQUIRE(history[1].severity == ErrorSeverity::Error);
        REQUIRE(history[1].details == "details");
        REQUIRE(history[1].timestamp.size() == 19);
    }

    SECTION("Empty history yields a default report")
    {
        REQUIRE(ErrorReporter::GetHistorySnapshot().empty());
        REQUIRE(ErrorReporter::GetLastError().category == ErrorCategory::Unknown);
        REQUIRE(ErrorReporter::GetLastError().message.empty());
    }

    SECTION("Counts per category")
    {
        ErrorReporter::ReportWarning(ErrorCategory::Review, "a");
        ErrorReporter::ReportError(ErrorCategory::Review, "b");
        ErrorReporter::ReportError(ErrorCategory::Configuration, "c");
        REQUIRE(ErrorReporter::CountReports(ErrorCategory::Review) == 2);
        REQUIRE(ErrorReporter::CountReports(ErrorCategory::Configuration) == 1);
        REQUIRE(ErrorReporter::CountReports(ErrorCategory::Lookup) == 0);
    }

    SECTION("Oldest reports are dropped past the bound")
    {
        for (std::size_t i = 0; i < ErrorReporter::kMaxHistory + 50; ++i)
            ErrorReporter::ReportWarning(ErrorCategory::Review, "w" + std::to_string(i));
        auto history = ErrorReporter::GetHistorySnapshot();
        REQUIRE(history.size() == ErrorReporter::kMaxHistory);
        REQUIRE(history.front().message == "w50");
        REQUIRE(history.back().message == "w549");
    }

    SECTION("Names")
    {
        REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::ReferenceData) == "Reference Data");
        REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Unknown) == "Unknown");
    }

    ErrorReporter::ClearHistory();
}

TEST_CASE("Diagnostics - Value previews", "[utils]")
{
    const std::size_t saved = Diagnostics::MaxPreview();

    SECTION("Short values are quoted")
    {
        REQUIRE(Diagnostics::Preview("Sales") == "\"Sales\"");
    }

    SECTION("Control characters are escaped")
    {
        REQUIRE(Diagnostics::Preview("a\nb") == "\"a\\nb\"");
    }

    SECTION("Long values are truncated with their size")
    {
        Diagnostics::SetMaxPreview(4);
        REQUIRE(Diagnostics::Preview("Engineering") == "\"Engi\"... (11 bytes)");
    }

    SECTION("Truncation keeps whole UTF-8 characters")
    {
        // "caf\u00E9s": the limit lands inside the two-byte e-acute
        Diagnostics::SetMaxPreview(4);
        REQUIRE(Diagnostics::Preview("caf\xC3\xA9s") == "\"caf\"... (6 bytes)");

        Diagnostics::SetMaxPreview(5);
        REQUIRE(Diagnostics::Preview("caf\xC3\xA9s") == "\"caf\xC3\xA9\"... (6 bytes)");

        // Three-byte U+6771 twice, limit inside the second one
        Diagnostics::SetMaxPreview(4);
        REQUIRE(Diagnostics::Preview("\xE6\x9D\xB1\xE6\x9D\xB1") == "\"\xE6\x9D\xB1\"... (6 bytes)");
    }

    SECTION("Verbose switch")
    {
        Diagnostics::SetVerbose(true);
        REQUIRE(Diagnostics::IsVerbose());
        Diagnostics::SetVerbose(false);
        REQUIRE_FALSE(Diagnostics::IsVerbose());
    }

    Diagnostics::SetMaxPreview(saved);
}
