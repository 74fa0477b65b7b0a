#pragma once

#include "CoordinateParser.hpp"
#include "CoordinateTypes.hpp"
#include "PairExtractor.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace processing
{

// Converts many coordinate pairs with per-row error isolation.
//
// A row is converted only when both of its fields parse; otherwise it yields
// one ConversionError and the batch moves on. Successes and failures keep the
// input order and carry the row's 1-based position.
class BatchConverter
{
public:
    explicit BatchConverter(const ITextNormalizer* normalizer = nullptr);

    [[nodiscard]] coordinates::ConversionReport convertRows(const std::vector<coordinates::Row>& rows,
                                                            coordinates::ColumnSelection selection) const;

    [[nodiscard]] coordinates::ConversionReport convertPairs(const std::vector<coordinates::CoordinatePair>& pairs) const;

    // One pair per line; lines without a pair are skipped
    [[nodiscard]] coordinates::ConversionReport convertText(std::string_view text) const;

private:
    void convertOne(std::size_t row_number, const std::string& latitude, const std::string& longitude,
                    coordinates::ConversionReport& report) const;

    CoordinateParser parser_;
    PairExtractor extractor_;
};

[[nodiscard]] coordinates::ConversionReport convert_rows(const std::vector<coordinates::Row>& rows,
                                                         coordinates::ColumnSelection selection);
[[nodiscard]] coordinates::ConversionReport convert_pairs(const std::vector<coordinates::CoordinatePair>& pairs);
[[nodiscard]] coordinates::ConversionReport convert_text(std::string_view text);

} // namespace processing
