#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // Logger or directory setup
    Configuration,  // TOML parsing, invalid settings
    ReferenceData,  // Dataset ingestion, import/export
    Lookup,         // Lookup processing against a dataset
    Review,         // Review session and audit sink
    Unknown
};

enum class ErrorSeverity
{
    Warning, // Degraded result, the operation went on
    Error    // Operation failed, the caller can continue
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Warning;
    std::string message; // What failed, e.g. "Failed to import reference dataset"
    std::string details; // Paths, parser output, errno text
    std::string timestamp;
};

/**
 * @brief Operational failures of the library, logged and kept for the host
 *
 * Store imports, config loads, lookup runs and the audit sink report here
 * instead of throwing. Every report goes to plog; the most recent ones stay in
 * a bounded history the host can inspect.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::ReferenceData,
 *                              "Failed to import reference dataset",
 *                              "employees.json: expected array");
 *
 *   for (const auto& report : ErrorReporter::GetHistorySnapshot()) { ... }
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                       const std::string& details = "");

    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "");

    static void ReportWarning(ErrorCategory category, const std::string& message, const std::string& details = "");

    /// Most recent report, or a default one when the history is empty.
    static ErrorReport GetLastError();

    /// Oldest first.
    static std::vector<ErrorReport> GetHistorySnapshot();

    static std::size_t CountReports(ErrorCategory category);

    static void ClearHistory();

    static std::string CategoryToString(ErrorCategory category);

    /// Local time, "YYYY-MM-DD HH:MM:SS".
    static std::string GetTimestamp();

    static constexpr std::size_t kMaxHistory = 500;

private:
    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_history;
};

} // namespace utils
