#include "JsonlAuditLog.hpp"
#include "../utils/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <filesystem>
#include <fstream>
#include <system_error>

namespace review
{

namespace
{
constexpr std::size_t MAX_REPORTED_FAILURES = 3;
}

JsonlAuditLog::JsonlAuditLog(std::string path)
    : path_(std::move(path))
{
}

bool JsonlAuditLog::append(const ReviewEvent& event)
{
    std::error_code ec;
    auto parent_path = std::filesystem::path(path_).parent_path();
    if (!parent_path.empty())
    {
        std::filesystem::create_directories(parent_path, ec);
        if (ec)
        {
            reportFailure("Failed to create directory for review audit log",
                          "Path: " + parent_path.string() + " | Error: " + ec.message());
            return false;
        }
    }

    std::ofstream file(path_, std::ios::app | std::ios::binary);
    if (!file.is_open())
    {
        reportFailure("Failed to open review audit log", "Path: " + path_);
        return false;
    }

    nlohmann::json line = toJson(event);
    line["timestamp"] = utils::ErrorReporter::GetTimestamp();
    file << line.dump() << '\n';

    if (!file.good())
    {
        reportFailure("Error writing review audit log", "Path: " + path_);
        return false;
    }

    return true;
}

ReviewEventSink JsonlAuditLog::sink()
{
    return [this](const ReviewEvent& event) { append(event); };
}

std::vector<ReviewEvent> JsonlAuditLog::readAll() const
{
    std::vector<ReviewEvent> events;
    std::ifstream file(path_);
    if (!file.is_open())
        return events;

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(file, line))
    {
        ++line_number;
        if (line.empty())
            continue;

        try
        {
            if (auto event = reviewEventFromJson(nlohmann::json::parse(line)))
            {
                events.push_back(std::move(*event));
                continue;
            }
        }
        catch (const nlohmann::json::exception& e)
        {
            PLOG_WARNING_(utils::Diagnostics::kLogInstance)
                << "[JsonlAuditLog] " << path_ << ":" << line_number << " " << e.what();
            continue;
        }

        PLOG_WARNING_(utils::Diagnostics::kLogInstance)
            << "[JsonlAuditLog] " << path_ << ":" << line_number << " is not a review event";
    }

    return events;
}

void JsonlAuditLog::reportFailure(const std::string& message, const std::string& detail)
{
    if (failed_writes_++ < MAX_REPORTED_FAILURES)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Review, message, detail);
    }
}

} // namespace review
