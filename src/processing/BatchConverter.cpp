#include "BatchConverter.hpp"
#include "Diagnostics.hpp"

#include <plog/Log.h>

using coordinates::ColumnSelection;
using coordinates::ConversionError;
using coordinates::ConversionReport;
using coordinates::ConversionRow;
using coordinates::CoordinatePair;
using coordinates::Row;

namespace processing
{

namespace
{

void logSummary(const char* source, const ConversionReport& report)
{
    if (!diagnostics::verbose())
        return;
    PLOG_INFO_(diagnostics::kLogInstance) << "[BatchConverter] source=" << source << " converted=" << report.rows.size()
                                          << " errors=" << report.errors.size() << " skipped=" << report.skipped;
}

void addMissingColumn(std::size_t row_number, const std::string& column, const std::string& latitude,
                      const std::string& longitude, ConversionReport& report)
{
    report.errors.push_back(ConversionError{ row_number, latitude, longitude, "column '" + column + "' not found" });
}

} // anonymous namespace

BatchConverter::BatchConverter(const ITextNormalizer* normalizer)
    : parser_(normalizer)
    , extractor_(normalizer)
{
}

ConversionReport BatchConverter::convertRows(const std::vector<Row>& rows, ColumnSelection selection) const
{
    ConversionReport report;

    for (std::size_t i = 0; i < rows.size(); ++i)
    {
        const Row& row = rows[i];
        const std::size_t row_number = i + 1;

        if (selection.mode == ColumnSelection::Mode::SeparateColumns)
        {
            auto lat_it = row.find(selection.latitude_column);
            auto lon_it = row.find(selection.longitude_column);
            const std::string latitude = lat_it != row.end() ? lat_it->second : std::string();
            const std::string longitude = lon_it != row.end() ? lon_it->second : std::string();

            if (lat_it == row.end())
            {
                addMissingColumn(row_number, selection.latitude_column, latitude, longitude, report);
                continue;
            }
            if (lon_it == row.end())
            {
                addMissingColumn(row_number, selection.longitude_column, latitude, longitude, report);
                continue;
            }
            convertOne(row_number, latitude, longitude, report);
        }
        else
        {
            auto it = row.find(selection.combined_column);
            if (it == row.end())
            {
                addMissingColumn(row_number, selection.combined_column, std::string(), std::string(), report);
                continue;
            }

            auto pair = extractor_.extract(it->second);
            if (!pair)
            {
                ++report.skipped;
                continue;
            }
            convertOne(row_number, pair->latitude, pair->longitude, report);
        }
    }

    logSummary("rows", report);
    return report;
}

ConversionReport BatchConverter::convertPairs(const std::vector<CoordinatePair>& pairs) const
{
    ConversionReport report;
    for (std::size_t i = 0; i < pairs.size(); ++i)
    {
        convertOne(i + 1, pairs[i].latitude, pairs[i].longitude, report);
    }
    logSummary("pairs", report);
    return report;
}

ConversionReport BatchConverter::convertText(std::string_view text) const
{
    ConversionReport report;

    std::size_t line_number = 0;
    std::size_t start = 0;
    while (start <= text.size())
    {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos)
            end = text.size();
        std::string_view line = text.substr(start, end - start);
        ++line_number;
        start = end + 1;

        if (line.find_first_not_of(" \t\r\v\f") == std::string_view::npos)
            continue;

        auto pair = extractor_.extract(line);
        if (!pair)
        {
            ++report.skipped;
            continue;
        }
        convertOne(line_number, pair->latitude, pair->longitude, report);
    }

    logSummary("text", report);
    return report;
}

void BatchConverter::convertOne(std::size_t row_number, const std::string& latitude, const std::string& longitude,
                                ConversionReport& report) const
{
    auto lat = parser_.parse(latitude);
    auto lon = parser_.parse(longitude);

    if (lat.succeeded() && lon.succeeded())
    {
        report.rows.push_back(ConversionRow{ row_number, latitude, longitude, round_to_places(*lat.value),
                                             round_to_places(*lon.value) });
        return;
    }

    std::string reason;
    if (lat.error)
        reason = "latitude: " + lat.error->reason;
    if (lon.error)
    {
        if (!reason.empty())
            reason += "; ";
        reason += "longitude: " + lon.error->reason;
    }
    report.errors.push_back(ConversionError{ row_number, latitude, longitude, std::move(reason) });
}

ConversionReport convert_rows(const std::vector<Row>& rows, ColumnSelection selection)
{
    return BatchConverter().convertRows(rows, std::move(selection));
}

ConversionReport convert_pairs(const std::vector<CoordinatePair>& pairs)
{
    return BatchConverter().convertPairs(pairs);
}

ConversionReport convert_text(std::string_view text)
{
    return BatchConverter().convertText(text);
}

} // namespace processing
