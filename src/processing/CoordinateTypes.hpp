#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace coordinates {

// Core data contracts for the conversion pipeline.
// Normalizer, parser, extractor and batch converter exchange only these types.

enum class Hemisphere
{
    North,
    South,
    East,
    West
};

enum class Axis
{
    Latitude,
    Longitude
};

[[nodiscard]] inline std::optional<Hemisphere> hemisphere_from_char(char c) noexcept
{
    switch (c)
    {
    case 'N': case 'n': return Hemisphere::North;
    case 'S': case 's': return Hemisphere::South;
    case 'E': case 'e': return Hemisphere::East;
    case 'W': case 'w': return Hemisphere::West;
    default: return std::nullopt;
    }
}

[[nodiscard]] inline char to_char(Hemisphere h) noexcept
{
    switch (h)
    {
    case Hemisphere::North: return 'N';
    case Hemisphere::South: return 'S';
    case Hemisphere::East: return 'E';
    case Hemisphere::West: return 'W';
    }
    return '?';
}

// Fields recovered from one coordinate string before arithmetic.
// An absent minutes/seconds field and an explicit zero evaluate the same,
// but stay distinguishable here.
struct ParsedComponents {
    double degrees = 0.0;
    std::optional<double> minutes;
    std::optional<double> seconds;
    std::optional<Hemisphere> hemisphere;
    bool negative = false;                    // explicit leading '-' on the degrees field
};

struct ParseError {
    std::string reason;
    std::string input;                        // original, un-normalized text
};

// Outcome of parsing one coordinate string
struct ParseResult {
    std::optional<double> value;
    std::optional<ParseError> error;

    [[nodiscard]] bool succeeded() const noexcept { return value.has_value(); }

    static ParseResult success(double v) {
        ParseResult res;
        res.value = v;
        return res;
    }

    static ParseResult failure(std::string reason, std::string input) {
        ParseResult res;
        res.error = ParseError{ std::move(reason), std::move(input) };
        return res;
    }
};

// Latitude/longitude text as found, first token = latitude
struct CoordinatePair {
    std::string latitude;
    std::string longitude;

    bool operator==(const CoordinatePair& other) const = default;
};

// One table row: column name -> cell text
using Row = std::unordered_map<std::string, std::string>;

struct ConversionRow {
    std::size_t row_number = 0;               // 1-based position in the input
    std::string original_latitude;
    std::string original_longitude;
    double latitude = 0.0;
    double longitude = 0.0;
};

struct ConversionError {
    std::size_t row_number = 0;               // 1-based position in the input
    std::string original_latitude;
    std::string original_longitude;
    std::string reason;

    [[nodiscard]] std::string message() const {
        return "Row " + std::to_string(row_number) + ": Could not process (" + original_latitude + ", " +
               original_longitude + "). Error: " + reason;
    }
};

struct ConversionReport {
    std::vector<ConversionRow> rows;          // input order
    std::vector<ConversionError> errors;      // input order
    std::size_t skipped = 0;                  // rows that held no coordinate pair
};

// Which cells feed the converter. Owned by the caller, passed by value per call.
struct ColumnSelection {
    enum class Mode
    {
        SeparateColumns, // latitude and longitude in two named columns
        CombinedColumn   // one column holding both, split by extract_pair
    };

    Mode mode = Mode::SeparateColumns;
    std::string latitude_column;
    std::string longitude_column;
    std::string combined_column;

    static ColumnSelection separate(std::string lat, std::string lon) {
        ColumnSelection sel;
        sel.mode = Mode::SeparateColumns;
        sel.latitude_column = std::move(lat);
        sel.longitude_column = std::move(lon);
        return sel;
    }

    static ColumnSelection combined(std::string column) {
        ColumnSelection sel;
        sel.mode = Mode::CombinedColumn;
        sel.combined_column = std::move(column);
        return sel;
    }
};

// Pipeline execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result{};                               // The actual result payload
    bool succeeded = true;                    // Whether the stage completed successfully
    std::optional<std::string> error;         // Error message if stage failed
    std::chrono::microseconds duration{ 0 };  // How long the stage took to execute
    std::string stage_name;                   // Name of the stage (for logging/metrics)

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

} // namespace coordinates
