#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Profile.hpp"
#include "../processing/Diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace utils
{

bool LogManager::s_ready = false;
bool LogManager::s_append = true;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(bool append, plog::Severity default_level)
{
    s_append = append;
    s_default_level = default_level;

    std::error_code ec;
    std::filesystem::create_directories("logs", ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Cannot create the logs directory", ec.message());
        s_ready = false;
        return false;
    }

    s_ready = true;
    return true;
}

template <int InstanceId>
bool LogManager::AddFileLogger(const LogFile& file)
{
    if (!s_ready)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Logging is not initialized", file.filepath);
        return false;
    }

    const plog::Severity level = file.level.value_or(s_default_level);
    if (auto* existing = plog::get<InstanceId>())
    {
        existing->setMaxSeverity(level);
        return true;
    }

    if (!s_append)
    {
        std::ofstream truncate(file.filepath, std::ios::trunc);
        if (!truncate)
        {
            ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Cannot open log file", file.filepath);
            return false;
        }
    }

    auto appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
        file.filepath.c_str(), kMaxFileBytes, kBackupFiles);
    auto& logger = plog::init<InstanceId>(level, appender.get());
    s_appenders.push_back(std::move(appender));

    if (file.echo_to_stderr)
    {
        auto console = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
        logger.addAppender(console.get());
        s_appenders.push_back(std::move(console));
    }
    return true;
}

template bool LogManager::AddFileLogger<0>(const LogFile&);
template bool LogManager::AddFileLogger<processing::diagnostics::kLogInstance>(const LogFile&);
#if DMSCONV_PROFILING_LEVEL >= 1
template bool LogManager::AddFileLogger<profiling::kProfilingLogInstance>(const LogFile&);
#endif

bool LogManager::IsAppendMode() { return s_append; }

plog::Severity LogManager::DefaultLevel() { return s_default_level; }

} // namespace utils
