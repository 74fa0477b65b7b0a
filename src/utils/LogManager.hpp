#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// One rolling plog file per logger instance:
//   0 - logs/run.log (application), 1 - logs/conversion.log (traces),
//   2 - logs/profiling.log (scope timers, profiling builds only)
struct LogFile
{
    std::string filepath;
    std::optional<plog::Severity> level; // LogManager's default when unset
    bool echo_to_stderr = false;
};

class LogManager
{
public:
    // Prepares logs/. With append == false each logger starts its file empty.
    static bool Initialize(bool append, plog::Severity default_level);

    // Adding an instance that already logs only updates its severity
    template<int InstanceId = 0>
    static bool AddFileLogger(const LogFile& file);

    [[nodiscard]] static bool IsAppendMode();
    [[nodiscard]] static plog::Severity DefaultLevel();

private:
    static constexpr std::size_t kMaxFileBytes = 5 * 1024 * 1024;
    static constexpr int kBackupFiles = 2;

    static bool s_ready;
    static bool s_append;
    static plog::Severity s_default_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
