#pragma once

#include "CoordinateTypes.hpp"
#include "Diagnostics.hpp"
#include <chrono>
#include <string>
#include <plog/Log.h>
#include <utility>
#include <exception>

#include "../utils/Profile.hpp"
#include "../utils/ErrorReporter.hpp"

namespace processing {

// Utility to run a stage (callable returning T) and produce coordinates::StageResult<T>
// Measures duration and logs errors. Keeps stages consistent for pipeline tracing.
template<typename T, typename Fn>
coordinates::StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    using namespace std::chrono;
    auto start = steady_clock::now();
    try
    {
        T res = fn();
        auto dur = duration_cast<microseconds>(steady_clock::now() - start);
        auto sr = coordinates::StageResult<T>::success(std::move(res), dur, stage_name);
        if (diagnostics::verbose()) {
            PLOG_INFO_(diagnostics::kLogInstance) << "Stage '" << stage_name << "' succeeded in " << dur.count() << "us";
        }
        return sr;
    }
    catch (const std::exception& ex)
    {
        auto dur = duration_cast<microseconds>(steady_clock::now() - start);
        PLOG_ERROR_(diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed in " << dur.count() << "us: " << ex.what();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Conversion,
            "Conversion stage failed",
            stage_name + ": " + ex.what());
        return coordinates::StageResult<T>::failure(ex.what(), dur, stage_name);
    }
}

} // namespace processing
