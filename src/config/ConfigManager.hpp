#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <functional>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

// Registry of TOML sections. Each handler owns a set of keys under a dotted
// table path and receives that table (or an empty one) on every load.
class ConfigManager
{
public:
    ConfigManager();
    explicit ConfigManager(std::string config_path);
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // Missing file is not an error: handlers see empty tables and keep their defaults
    bool load();
    bool loadFromString(std::string_view text, std::string_view source_name = "<string>");

    const toml::table& root() const;
    const std::string& configPath() const { return config_path_; }

    const char* lastError() const { return last_error_.c_str(); }

private:
    bool parseAndApply(std::string_view text, std::string_view source_name);
    void applyHandlers();
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
