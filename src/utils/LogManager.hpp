#pragma once

#include <string>
#include <optional>
#include <plog/Severity.h>

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 5 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    /// Reads the [logging] table of config_path and prepares log_dir.
    static bool Initialize(const std::string& config_path = "config.toml", const std::string& log_dir = "logs");

    /// Points the instance at config's outputs. Registering again replaces them.
    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    /// Silences every logger and closes its files; Initialize + RegisterLogger bring them back.
    static void Shutdown();

    static bool IsInitialized();
    static bool IsAppendMode();
    static plog::Severity GetDefaultLogLevel();
    static const std::string& GetLogDirectory();

private:
    LogManager() = default;

    static void ReadConfig(const std::string& config_path);
    static void PrepareLogDirectory();

    static bool s_initialized;
    static bool s_append_logs;
    static plog::Severity s_default_level;
    static std::string s_log_dir;
};

} // namespace utils
