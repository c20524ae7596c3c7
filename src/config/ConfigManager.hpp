#pragma once

#include <string>
#include <functional>
#include <memory>
#include <vector>

#include <toml++/toml.h>

namespace config
{

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

/**
 * @brief Owner of the TOML configuration file.
 *
 * Settings objects register a table path plus the keys they own. load()
 * hands every handler its section (an empty table when the section or the
 * file is missing); save() merges the handlers' tables into the last parsed
 * document and replaces the file atomically.
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);
    bool load();
    bool reloadIfChanged();
    bool save();
    const toml::table& root() const;

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    toml::table* resolveTablePath(toml::table& root, const std::string& path);
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;
    void dispatchLoad() const;

    std::string config_path_;
    std::string last_error_;
    long long last_mtime_ = 0;

    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};

} // namespace config
