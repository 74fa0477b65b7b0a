#include "CsvTable.hpp"

#include <algorithm>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <plog/Log.h>

namespace io
{

namespace
{

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

std::string trim(std::string_view s)
{
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos)
        return std::string();
    auto last = s.find_last_not_of(ws);
    return std::string(s.substr(first, last - first + 1));
}

char to_lower_ascii(char c)
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y)
                                              { return to_lower_ascii(x) == to_lower_ascii(y); });
}

std::string format_number(double value, int precision)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

bool is_blank_record(const std::vector<std::string>& record)
{
    return record.size() == 1 && trim(record.front()).empty();
}

} // anonymous namespace

bool parse_csv_records(std::string_view text, std::vector<std::vector<std::string>>& records, std::string& error)
{
    if (text.starts_with(kUtf8Bom))
        text.remove_prefix(kUtf8Bom.size());

    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;
    bool record_open = false;
    size_t line = 1;
    size_t quote_line = 0;

    auto end_field = [&]()
    {
        record.push_back(std::move(field));
        field.clear();
        field_quoted = false;
    };
    auto end_record = [&]()
    {
        end_field();
        records.push_back(std::move(record));
        record.clear();
        record_open = false;
    };

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (in_quotes)
        {
            if (c == '"')
            {
                if (i + 1 < text.size() && text[i + 1] == '"')
                {
                    field.push_back('"');
                    ++i;
                }
                else
                {
                    in_quotes = false;
                }
            }
            else
            {
                if (c == '\n')
                    ++line;
                field.push_back(c);
            }
            continue;
        }

        switch (c)
        {
        case '"':
            if (field.empty() && !field_quoted)
            {
                in_quotes = true;
                field_quoted = true;
                quote_line = line;
            }
            else
            {
                // Stray quote inside an unquoted field is kept literally (35°45'30"N)
                field.push_back(c);
            }
            record_open = true;
            break;
        case ',':
            end_field();
            record_open = true;
            break;
        case '\r':
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            end_record();
            ++line;
            break;
        case '\n':
            end_record();
            ++line;
            break;
        default:
            field.push_back(c);
            record_open = true;
            break;
        }
    }

    if (in_quotes)
    {
        error = "unterminated quoted field starting on line " + std::to_string(quote_line);
        return false;
    }
    if (record_open)
        end_record();

    return true;
}

bool read_csv(std::istream& in, Table& out, std::string& error)
{
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        error = "stream read failure";
        return false;
    }

    std::vector<std::vector<std::string>> records;
    if (!parse_csv_records(text, records, error))
        return false;

    records.erase(std::remove_if(records.begin(), records.end(), is_blank_record), records.end());
    if (records.empty())
    {
        error = "no header row";
        return false;
    }

    out.columns.clear();
    out.rows.clear();
    for (const auto& name : records.front())
        out.columns.push_back(trim(name));

    out.rows.reserve(records.size() - 1);
    for (size_t r = 1; r < records.size(); ++r)
    {
        const auto& record = records[r];
        if (record.size() > out.columns.size())
            PLOG_WARNING << "CSV record " << r << " has " << record.size() << " fields, header has "
                         << out.columns.size() << "; extra fields ignored";

        coordinates::Row row;
        const size_t n = std::min(record.size(), out.columns.size());
        for (size_t c = 0; c < n; ++c)
        {
            // Duplicate header names keep the leftmost column
            row.emplace(out.columns[c], record[c]);
        }
        out.rows.push_back(std::move(row));
    }

    return true;
}

void write_report_csv(std::ostream& out, const coordinates::ConversionReport& report, const CsvWriteOptions& options)
{
    if (options.include_originals)
        out << "Original Latitude,Original Longitude,Decimal Latitude,Decimal Longitude\n";
    else
        out << "Latitude,Longitude\n";

    for (const auto& row : report.rows)
    {
        if (options.include_originals)
        {
            out << escape_csv_field(row.original_latitude) << ',' << escape_csv_field(row.original_longitude) << ',';
        }
        out << format_number(row.latitude, options.precision) << ',' << format_number(row.longitude, options.precision)
            << '\n';
    }
}

std::string escape_csv_field(std::string_view field)
{
    if (field.find_first_of(",\"\r\n") == std::string_view::npos)
        return std::string(field);

    std::string escaped;
    escaped.reserve(field.size() + 2);
    escaped.push_back('"');
    for (char c : field)
    {
        if (c == '"')
            escaped.push_back('"');
        escaped.push_back(c);
    }
    escaped.push_back('"');
    return escaped;
}

std::optional<std::string> find_column(const std::vector<std::string>& columns,
                                       std::initializer_list<std::string_view> candidates)
{
    for (const auto& candidate : candidates)
    {
        for (const auto& column : columns)
        {
            if (iequals(column, candidate))
                return column;
        }
    }
    return std::nullopt;
}

std::optional<coordinates::ColumnSelection> resolve_columns(const std::vector<std::string>& columns,
                                                            coordinates::ColumnSelection requested,
                                                            std::string& error)
{
    auto pick = [&](std::string& name, std::initializer_list<std::string_view> candidates, size_t fallback_index)
    {
        if (!name.empty())
            return true;
        if (auto found = find_column(columns, candidates))
        {
            name = *found;
            return true;
        }
        if (fallback_index < columns.size())
        {
            name = columns[fallback_index];
            return true;
        }
        error = "too few columns: " + std::to_string(columns.size()) + " in header";
        return false;
    };

    if (requested.mode == coordinates::ColumnSelection::Mode::CombinedColumn)
    {
        if (!pick(requested.combined_column, { "coordinates", "coordinate", "coords", "location" }, 0))
            return std::nullopt;
        return requested;
    }

    if (!pick(requested.latitude_column, { "latitude", "lat" }, 0) ||
        !pick(requested.longitude_column, { "longitude", "lon", "lng", "long" }, 1))
        return std::nullopt;
    return requested;
}

} // namespace io
