#pragma once

#include "../processing/CoordinateTypes.hpp"

#include <optional>
#include <string>
#include <string_view>

class ConfigManager;

enum class InputMode
{
    Columns,  // latitude and longitude columns of a CSV table
    Combined, // one CSV column holding both values
    Text      // free text, one pair per line
};

[[nodiscard]] std::optional<InputMode> input_mode_from_string(std::string_view name);
[[nodiscard]] const char* to_string(InputMode mode);

// Settings read from [global], [conversion], [output] and [app.debug] of config.toml.
// Command-line flags override these after load.
struct ConversionConfig
{
    InputMode mode = InputMode::Columns;
    std::string latitude_column;  // empty = detect from header
    std::string longitude_column;
    std::string combined_column;

    bool include_originals = false;
    int precision = 6;
    int preview_rows = 5;

    bool verbose = false;
    bool append_logs = true;   // [global]
    int logging_level = 4;     // [app.debug], plog severity 0 (none) .. 6 (verbose)

    // The struct must outlive the manager's load() calls
    void registerWith(ConfigManager& manager);

    // Requested columns; empty names are left for header detection
    [[nodiscard]] coordinates::ColumnSelection selection() const;
};
