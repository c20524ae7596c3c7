#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Diagnostics.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <vector>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace utils
{

namespace
{

// plog holds raw appender pointers for the life of the process and cannot
// detach them, so each instance gets one appender that never dies and
// forwards to outputs we are free to replace.
class ForwardingAppender : public plog::IAppender
{
public:
    void write(const plog::Record& record) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& target : targets_)
            target->write(record);
    }

    void reset(std::vector<std::unique_ptr<plog::IAppender>> targets)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets_ = std::move(targets);
    }

private:
    std::mutex mutex_;
    std::vector<std::unique_ptr<plog::IAppender>> targets_;
};

template <int InstanceId>
ForwardingAppender& forwarder()
{
    static ForwardingAppender appender;
    return appender;
}

} // namespace

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::string LogManager::s_log_dir = "logs";

bool LogManager::Initialize(const std::string& config_path, const std::string& log_dir)
{
    if (s_initialized)
        return true;

    s_log_dir = log_dir;
    ReadConfig(config_path);
    PrepareLogDirectory();

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        std::vector<std::unique_ptr<plog::IAppender>> targets;
        targets.push_back(std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count));
        if (config.add_console_appender)
        {
            targets.push_back(std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>());
        }

        auto& appender = forwarder<InstanceId>();
        appender.reset(std::move(targets));

        plog::Severity level = config.level_override.value_or(s_default_level);
        if (auto logger = plog::get<InstanceId>())
        {
            // Already wired to the forwarder, possibly silenced by Shutdown
            logger->setMaxSeverity(level);
        }
        else
        {
            plog::init<InstanceId>(level, &appender);
        }

        PLOG_INFO_(InstanceId) << "Logger '" << config.name << "' writing to " << config.filepath;
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<Diagnostics::kLogInstance>(const LoggerConfig&);

void LogManager::Shutdown()
{
    if (auto logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    if (auto logger = plog::get<Diagnostics::kLogInstance>())
        logger->setMaxSeverity(plog::none);

    forwarder<0>().reset({});
    forwarder<Diagnostics::kLogInstance>().reset({});
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

const std::string& LogManager::GetLogDirectory() { return s_log_dir; }

void LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(s_log_dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     s_log_dir + ": " + ec.message());
    }
}

void LogManager::ReadConfig(const std::string& config_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return;

    try
    {
        auto cfg = toml::parse_file(config_path);
        if (auto logging = cfg["logging"].as_table())
        {
            if (auto append = (*logging)["append_logs"].value<bool>())
            {
                s_append_logs = *append;
            }
            if (auto level = (*logging)["level"].value<int64_t>())
            {
                int level_int = static_cast<int>(*level);
                if (level_int >= 0 && level_int <= 6)
                {
                    s_default_level = static_cast<plog::Severity>(level_int);
                }
            }
            if (auto verbose = (*logging)["verbose"].value<bool>())
            {
                Diagnostics::SetVerbose(*verbose);
            }
        }
    }
    catch (const toml::parse_error& pe)
    {
        // Logging still comes up with defaults; ConfigManager reports the details
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging settings ignored, config has errors",
                                     std::string(pe.description()));
    }
}

} // namespace utils
