#include "ErrorReporter.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_error_queue;

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string msg, std::string det, ErrorContext ctx)
    : category(cat)
    , severity(sev)
    , message(std::move(msg))
    , details(std::move(det))
    , context(std::move(ctx))
{
}

void ErrorReporter::Report(ErrorReport report)
{
    if (report.timestamp.empty())
        report.timestamp = UtcTimestamp();

    const std::string line = FormatLogLine(report);
    switch (report.severity)
    {
    case ErrorSeverity::Info:
        PLOG_INFO << line;
        break;
    case ErrorSeverity::Warning:
        PLOG_WARNING << line;
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << line;
        break;
    }

    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.push_back(std::move(report));
    if (s_error_queue.size() > kMaxQueueSize)
        s_error_queue.erase(s_error_queue.begin());
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const std::string& details,
                                ErrorContext context)
{
    Report(ErrorReport(category, ErrorSeverity::Error, message, details, std::move(context)));
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const std::string& details,
                                  ErrorContext context)
{
    Report(ErrorReport(category, ErrorSeverity::Warning, message, details, std::move(context)));
}

bool ErrorReporter::HasPendingReports()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_error_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::TakePendingReports()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> reports;
    reports.swap(s_error_queue);
    return reports;
}

std::vector<ErrorReport> ErrorReporter::PendingForTransaction(const std::string& transaction_id)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> reports;
    std::copy_if(s_error_queue.begin(), s_error_queue.end(), std::back_inserter(reports),
                 [&transaction_id](const ErrorReport& r) { return r.context.transaction_id == transaction_id; });
    return reports;
}

void ErrorReporter::ClearReports()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.clear();
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Matching:
        return "Matching";
    }
    return "Unknown";
}

std::string ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    }
    return "Unknown";
}

nlohmann::json ErrorReporter::ToJson(const ErrorReport& report)
{
    nlohmann::json j;
    j["category"] = CategoryToString(report.category);
    j["severity"] = SeverityToString(report.severity);
    j["message"] = report.message;
    j["details"] = report.details;
    j["timestamp"] = report.timestamp;
    if (!report.context.strategy.empty())
        j["strategy"] = report.context.strategy;
    if (!report.context.transaction_id.empty())
        j["transaction_id"] = report.context.transaction_id;
    if (!report.context.source.empty())
        j["source"] = report.context.source;
    return j;
}

// [Matching] strategy=fuzzy tx=tx-42: Matcher strategy failed | bad_alloc
std::string ErrorReporter::FormatLogLine(const ErrorReport& report)
{
    std::string line = "[" + CategoryToString(report.category) + "]";
    if (!report.context.strategy.empty())
        line += " strategy=" + report.context.strategy;
    if (!report.context.transaction_id.empty())
        line += " tx=" + report.context.transaction_id;
    if (!report.context.source.empty())
        line += " source=" + report.context.source;
    line += ": " + report.message;
    if (!report.details.empty())
        line += " | " + report.details;
    return line;
}

std::string ErrorReporter::UtcTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace utils
