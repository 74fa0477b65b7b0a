#pragma once

#include <chrono>
#include <string>
#include <string_view>

// DMSCONV_PROFILING_LEVEL is set via CMake:
//   0 = Disabled (no profiling)
//   1 = Timer only (std::chrono + plog)

#ifndef DMSCONV_PROFILING_LEVEL
#define DMSCONV_PROFILING_LEVEL 0
#endif

#if DMSCONV_PROFILING_LEVEL >= 1
#include <plog/Log.h>
#endif

namespace profiling
{

#if DMSCONV_PROFILING_LEVEL >= 1
constexpr int kProfilingLogInstance = 2;

namespace detail
{

/**
 * @brief RAII scope timer for measuring and logging execution time
 *
 * Captures start time on construction and logs elapsed time on destruction.
 */
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name)
        : name_(name)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer() noexcept
    {
        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
        PLOG_DEBUG_(profiling::kProfilingLogInstance) << "[PROFILE] " << name_ << " took " << duration.count() << " us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;
    ScopeTimer(ScopeTimer&&) = delete;
    ScopeTimer& operator=(ScopeTimer&&) = delete;

private:
    // Owned copy: stage names are often temporaries
    std::string name_;
    std::chrono::time_point<std::chrono::steady_clock> start_;
};

} // namespace detail
#endif

} // namespace profiling

#if DMSCONV_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))
#else
#define PROFILE_SCOPE_FUNCTION() ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::profiling::detail::ScopeTimer __profiling_timer(nameExpr)
#endif
