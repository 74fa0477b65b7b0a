#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils
{

enum class ErrorCategory
{
    Initialization, // logging, command line
    Configuration,  // config.toml
    Input,          // unreadable input, malformed CSV, unusable header
    Conversion,     // a pipeline stage threw
    Output          // unwritable output
};

enum class ErrorSeverity
{
    Warning, // dmsconv carried on with a fallback
    Error    // the requested operation did not happen
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Input;
    ErrorSeverity severity = ErrorSeverity::Error;
    std::string user_message;
    std::string technical_details;

    // "[Error] Input: Could not read input (cannot open x.csv)"
    [[nodiscard]] std::string describe() const;
};

// Collects infrastructure problems (config, files, stages) until the shell
// prints them on exit. Bad coordinates are not reported here; they stay in
// the ConversionReport of their batch.
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    // Hands over everything reported so far and empties the queue
    static std::vector<ErrorReport> TakePendingErrors();

    static void ClearErrors();

    static const char* CategoryName(ErrorCategory category);
    static const char* SeverityName(ErrorSeverity severity);

    static constexpr std::size_t kMaxPending = 64;

private:
    static void Enqueue(ErrorReport report);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_pending;
};

} // namespace utils
