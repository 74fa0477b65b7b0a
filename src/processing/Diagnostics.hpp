#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Conversion tracing: a process-wide verbose flag and the plog instance that
// receives per-value traces (logs/conversion.log).
namespace processing::diagnostics
{

inline constexpr int kLogInstance = 1;
inline constexpr std::size_t kPreviewBytes = 80;

void set_verbose(bool enabled) noexcept;
[[nodiscard]] bool verbose() noexcept;

// Quoted, single-line rendering of user input for log lines. Tabs and line
// breaks are escaped, other control bytes become '?', and text longer than
// max_bytes is cut at a UTF-8 boundary.
[[nodiscard]] std::string preview(std::string_view text, std::size_t max_bytes = kPreviewBytes);

} // namespace processing::diagnostics
