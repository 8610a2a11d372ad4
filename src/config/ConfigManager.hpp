#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

/// Owns config.toml. Modules register the table they read and write together
/// with the keys they own; unknown keys in the file are preserved on save.
class ConfigManager
{
public:
    explicit ConfigManager(std::string path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // A missing file is not an error: every handler sees an empty table and
    // keeps its defaults.
    bool load();
    bool save();
    const toml::table& root() const;

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    void dispatchLoad();

    // "a.b" addresses nested tables; the write variant creates missing ones
    toml::table* sectionForWrite(toml::table& root, const std::string& path);
    const toml::table* sectionForRead(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
