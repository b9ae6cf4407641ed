#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "config/ConfigManager.hpp"
#include "matching/Diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_initialized = false;
LoggingConfig LogManager::s_config;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool registerLoggingConfig(ConfigManager& manager, LoggingConfig& config)
{
    return manager.registerTable(
        "logging",
        {[&config](const toml::table& t)
         {
             if (auto append = t["append"].value<bool>())
                 config.append = *append;
             if (auto console = t["console"].value<bool>())
                 config.console = *console;
             if (auto directory = t["directory"].value<std::string>())
             {
                 if (!directory->empty())
                     config.directory = *directory;
             }
             if (auto level = t["level"].value<int64_t>())
             {
                 if (*level >= plog::none && *level <= plog::verbose)
                 {
                     config.level = static_cast<plog::Severity>(*level);
                 }
                 else
                 {
                     ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Ignoring out-of-range log level",
                                                  "level = " + std::to_string(*level), {{}, {}, "logging.level"});
                 }
             }
         }},
        {"append", "console", "directory", "level"});
}

bool LogManager::Initialize(const LoggingConfig& config)
{
    if (s_initialized)
        return true;

    s_config = config;
    if (!PrepareLogDirectory())
        return false;

    if (!RegisterLogger<0>("application", ApplicationLogPath()))
        return false;
    if (!RegisterLogger<matching::Diagnostics::kLogInstance>("matching", MatchingLogPath()))
        return false;

    s_initialized = true;
    PLOG_INFO << "Logging to " << s_config.directory << " at level " << plog::severityToString(s_config.level);
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const std::string& name, const std::string& filepath)
{
    try
    {
        if (!s_config.append)
        {
            std::ofstream(filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            filepath.c_str(), s_config.max_file_size, s_config.backup_count);

        plog::init<InstanceId>(s_config.level, file_appender.get());

        if (s_config.console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + name, ex.what(),
                                   {{}, {}, filepath});
        return false;
    }
}

bool LogManager::IsInitialized() { return s_initialized; }

const LoggingConfig& LogManager::Config() { return s_config; }

std::string LogManager::ApplicationLogPath()
{
    return (std::filesystem::path(s_config.directory) / "paymatch.log").string();
}

std::string LogManager::MatchingLogPath()
{
    return (std::filesystem::path(s_config.directory) / "paymatch_matching.log").string();
}

bool LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(s_config.directory, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message(),
                                   {{}, {}, s_config.directory});
        return false;
    }
    return true;
}

} // namespace utils
