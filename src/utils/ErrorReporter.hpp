#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <mutex>

#include <nlohmann/json_fwd.hpp>

namespace utils {

enum class ErrorCategory
{
    Initialization, // Logger setup, log directory, matcher construction
    Configuration,  // TOML parsing, invalid weights or thresholds
    Matching        // A matcher strategy failed during evaluation
};

enum class ErrorSeverity
{
    Info,
    Warning, // Degraded result, matching continues
    Error    // Operation failed, the caller decides how to continue
};

// Where a report came from. Empty fields are omitted from log lines and JSON.
struct ErrorContext
{
    std::string strategy;       // "fuzzy", "iban", ...
    std::string transaction_id; // Transaction being matched
    std::string source;         // Config file or table the problem was found in
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Matching;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string message;   // Short, actionable message
    std::string details;   // Exception text, offending value
    ErrorContext context;
    std::string timestamp; // UTC, ISO 8601

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string msg, std::string det, ErrorContext ctx = {});
};

/**
 * @brief Thread-safe collector for matching and configuration problems.
 *
 * Strategies fail on worker tasks and configuration loads happen before any
 * logger is set up, so problems are logged and also queued. The embedding
 * service drains the queue after a batch and forwards the reports (review
 * queue, audit trail) as JSON.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Matching, "Matcher strategy failed",
 *                                "bad_alloc", {"fuzzy", "tx-42"});
 *
 *   for (const auto& report : ErrorReporter::TakePendingReports())
 *       review_queue.push(ErrorReporter::ToJson(report));
 */
class ErrorReporter
{
public:
    static void Report(ErrorReport report);

    static void ReportError(ErrorCategory category, const std::string& message,
                            const std::string& details = "", ErrorContext context = {});

    static void ReportWarning(ErrorCategory category, const std::string& message,
                              const std::string& details = "", ErrorContext context = {});

    static bool HasPendingReports();

    /// Oldest first; the queue is empty afterwards.
    static std::vector<ErrorReport> TakePendingReports();

    /// Pending reports raised while matching one transaction; they stay queued.
    static std::vector<ErrorReport> PendingForTransaction(const std::string& transaction_id);

    static void ClearReports();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    /// {"category", "severity", "message", "details", "timestamp", "strategy"?, "transaction_id"?, "source"?}
    static nlohmann::json ToJson(const ErrorReport& report);

    static constexpr std::size_t kMaxQueueSize = 100;

private:
    static std::string FormatLogLine(const ErrorReport& report);
    static std::string UtcTimestamp();

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
};

} // namespace utils
