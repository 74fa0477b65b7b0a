#include "ErrorReporter.hpp"

#include <plog/Log.h>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_pending;

std::string ErrorReport::describe() const
{
    std::string text = std::string("[") + ErrorReporter::SeverityName(severity) + "] " +
                       ErrorReporter::CategoryName(category) + ": " + user_message;
    if (!technical_details.empty())
        text += " (" + technical_details + ")";
    return text;
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ErrorReport report{ category, ErrorSeverity::Error, user_message, technical_details };
    PLOG_ERROR << report.describe();
    Enqueue(std::move(report));
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    ErrorReport report{ category, ErrorSeverity::Warning, user_message, technical_details };
    PLOG_WARNING << report.describe();
    Enqueue(std::move(report));
}

void ErrorReporter::Enqueue(ErrorReport report)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    // Full queue: drop the oldest
    if (s_pending.size() == kMaxPending)
        s_pending.erase(s_pending.begin());
    s_pending.push_back(std::move(report));
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_pending.empty();
}

std::vector<ErrorReport> ErrorReporter::TakePendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> taken;
    taken.swap(s_pending);
    return taken;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_pending.clear();
}

const char* ErrorReporter::CategoryName(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Input:
        return "Input";
    case ErrorCategory::Conversion:
        return "Conversion";
    case ErrorCategory::Output:
        return "Output";
    }
    return "Unknown";
}

const char* ErrorReporter::SeverityName(ErrorSeverity severity)
{
    return severity == ErrorSeverity::Warning ? "Warning" : "Error";
}

} // namespace utils
