#pragma once

#include "../processing/CoordinateTypes.hpp"

#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace io
{

// Header-keyed table as read from a CSV file
struct Table
{
    std::vector<std::string> columns;
    std::vector<coordinates::Row> rows;
};

struct CsvWriteOptions
{
    bool include_originals = false;
    int precision = 6;
};

/// Reads RFC 4180 CSV with a header row. Quoted fields may hold commas,
/// doubled quotes and line breaks; CRLF and a UTF-8 BOM are accepted.
/// Blank records are dropped. Returns false and sets error on malformed input.
[[nodiscard]] bool read_csv(std::istream& in, Table& out, std::string& error);

/// Splits a whole document into records of raw field values
[[nodiscard]] bool parse_csv_records(std::string_view text, std::vector<std::vector<std::string>>& records,
                                     std::string& error);

/// Writes Latitude,Longitude (or the four-column layout with originals)
void write_report_csv(std::ostream& out, const coordinates::ConversionReport& report, const CsvWriteOptions& options);

[[nodiscard]] std::string escape_csv_field(std::string_view field);

/// First column whose name equals one of the candidates, ignoring ASCII case
[[nodiscard]] std::optional<std::string> find_column(const std::vector<std::string>& columns,
                                                     std::initializer_list<std::string_view> candidates);

/// Fills in the empty column names of a selection from the header:
/// latitude/lat and longitude/lon/lng/long, or coordinates/coordinate/coords/location
/// for a combined column, else the first (and second) column. Names already set
/// are kept even when the header lacks them; the rows report those.
[[nodiscard]] std::optional<coordinates::ColumnSelection> resolve_columns(const std::vector<std::string>& columns,
                                                                          coordinates::ColumnSelection requested,
                                                                          std::string& error);

} // namespace io
