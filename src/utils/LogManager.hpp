#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <memory>
#include <plog/Severity.h>

class ConfigManager;

namespace plog
{
class IAppender;
}

namespace utils
{

// [logging] table of the matching configuration file
struct LoggingConfig
{
    bool append = true;
    plog::Severity level = plog::info;
    std::string directory = "logs";
    bool console = false;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t backup_count = 3;
};

/// Registers [logging] on a ConfigManager; values land in config on every load().
bool registerLoggingConfig(ConfigManager& manager, LoggingConfig& config);

// Process-wide plog setup for the matching engine: instance 0 receives the
// application log (<directory>/paymatch.log) and the matching instance the
// strategy traces (<directory>/paymatch_matching.log). The first successful
// Initialize() wins; later calls keep the running loggers.
class LogManager
{
public:
    static bool Initialize(const LoggingConfig& config);

    [[nodiscard]] static bool IsInitialized();
    [[nodiscard]] static const LoggingConfig& Config();

    [[nodiscard]] static std::string ApplicationLogPath();
    [[nodiscard]] static std::string MatchingLogPath();

private:
    LogManager() = default;

    template<int InstanceId>
    static bool RegisterLogger(const std::string& name, const std::string& filepath);

    static bool PrepareLogDirectory();

    static bool s_initialized;
    static LoggingConfig s_config;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
