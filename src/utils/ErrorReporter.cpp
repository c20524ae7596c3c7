#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_history;

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                           const std::string& details)
{
    std::string log_msg = "[" + CategoryToString(category) + "] " + message;
    if (!details.empty())
    {
        log_msg += " | Details: " + details;
    }

    if (severity == ErrorSeverity::Error)
        PLOG_ERROR << log_msg;
    else
        PLOG_WARNING << log_msg;

    ErrorReport report{ category, severity, message, details, GetTimestamp() };

    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_history.size() == kMaxHistory)
    {
        s_history.pop_front();
    }
    s_history.push_back(std::move(report));
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Error, message, details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Warning, message, details);
}

ErrorReport ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_history.empty() ? ErrorReport{} : s_history.back();
}

std::vector<ErrorReport> ErrorReporter::GetHistorySnapshot()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return { s_history.begin(), s_history.end() };
}

std::size_t ErrorReporter::CountReports(ErrorCategory category)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return static_cast<std::size_t>(std::count_if(s_history.begin(), s_history.end(),
                                                  [category](const ErrorReport& r) { return r.category == category; }));
}

void ErrorReporter::ClearHistory()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_history.clear();
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::ReferenceData:
        return "Reference Data";
    case ErrorCategory::Lookup:
        return "Lookup";
    case ErrorCategory::Review:
        return "Review";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

std::string ErrorReporter::GetTimestamp()
{
    auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm tm_buf{};
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
