#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace utils
{

namespace
{

plog::Severity toPlogSeverity(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info: return plog::info;
    case ErrorSeverity::Warning: return plog::warning;
    case ErrorSeverity::Error: return plog::error;
    case ErrorSeverity::Fatal: return plog::fatal;
    }
    return plog::error;
}

} // namespace

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_error_queue;
std::size_t ErrorReporter::s_category_counts[ErrorReporter::kCategoryCount] = {};

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , user_message(std::move(user_msg))
    , technical_details(std::move(tech_details))
    , timestamp(ErrorReporter::GetTimestamp())
{
}

bool ErrorReport::sameAs(const ErrorReport& other) const
{
    return category == other.category && severity == other.severity && user_message == other.user_message &&
           technical_details == other.technical_details;
}

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                                const std::string& technical_details)
{
    ErrorReport report(category, severity, user_message, technical_details);

    PLOG(toPlogSeverity(severity)) << Format(report);

    std::lock_guard<std::mutex> lock(s_mutex);
    ++s_category_counts[static_cast<std::size_t>(category)];

    if (!s_error_queue.empty() && s_error_queue.back().sameAs(report))
    {
        ErrorReport& last = s_error_queue.back();
        ++last.repeat_count;
        last.timestamp = std::move(report.timestamp);
        return;
    }

    s_error_queue.push_back(std::move(report));
    while (s_error_queue.size() > MAX_QUEUE_SIZE)
        s_error_queue.pop_front();
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Warning, user_message, technical_details);
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_error_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors(ErrorSeverity min_severity)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> errors;
    errors.reserve(s_error_queue.size());
    for (auto& report : s_error_queue)
    {
        if (report.severity >= min_severity)
            errors.push_back(std::move(report));
    }
    s_error_queue.clear();
    return errors;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.clear();
    for (auto& count : s_category_counts)
        count = 0;
}

std::size_t ErrorReporter::CountFor(ErrorCategory category)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_category_counts[static_cast<std::size_t>(category)];
}

std::string ErrorReporter::Format(const ErrorReport& report)
{
    std::string out = SeverityToString(report.severity) + " [" + CategoryToString(report.category) + "]: " +
                      report.user_message;
    if (!report.technical_details.empty())
        out += " (" + report.technical_details + ")";
    if (report.repeat_count > 1)
        out += " x" + std::to_string(report.repeat_count);
    return out;
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::AddressRange:
        return "Address Range";
    case ErrorCategory::Scan:
        return "Scan";
    case ErrorCategory::Persistence:
        return "Persistence";
    case ErrorCategory::Unknown:
        return "Unknown";
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
    case ErrorSeverity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

std::string ErrorReporter::GetTimestamp()
{
    auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm tm_buf{};
    localtime_r(&time_t_now, &tm_buf);
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
