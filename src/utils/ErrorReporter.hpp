#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, settings file, log directory
    Configuration,  // config.toml parsing, invalid scanner settings
    AddressRange,   // malformed or inverted range specs
    Scan,           // AlreadyScanning, engine faults
    Persistence,    // btc_toolkit_config.json load/save
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // degraded, defaults used
    Error,   // operation failed, the program carries on
    Fatal
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // what the operator should read
    std::string technical_details; // cause, for logs and bug reports
    std::string timestamp;
    std::size_t repeat_count = 1;  // identical reports folded into this one

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);

    bool sameAs(const ErrorReport& other) const;
};

/**
 * @brief Thread-safe collector for operator-facing errors
 *
 * Every report is logged through plog and queued until the front end takes
 * it. A report identical to the last queued one bumps its repeat_count
 * instead of queueing again, so a dead subnet cannot flood the queue.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Persistence,
 *                              "Could not save scan results",
 *                              "rename: permission denied");
 *
 *   // After each pump of the coordinator:
 *   for (const auto& e : ErrorReporter::GetPendingErrors())
 *       std::cerr << ErrorReporter::Format(e) << '\n';
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    /// Take every queued report at or above `min_severity`; lower ones are dropped.
    static std::vector<ErrorReport> GetPendingErrors(ErrorSeverity min_severity = ErrorSeverity::Info);

    static void ClearErrors();

    // Reports made since start (or ClearErrors) in one category, repeats included
    static std::size_t CountFor(ErrorCategory category);

    // "Warning [Persistence]: message (details) x3"
    static std::string Format(const ErrorReport& report);

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static constexpr std::size_t MAX_QUEUE_SIZE = 100;
    static constexpr std::size_t kCategoryCount = static_cast<std::size_t>(ErrorCategory::Unknown) + 1;

    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_error_queue;
    static std::size_t s_category_counts[kCategoryCount];
};

} // namespace utils
