#pragma once

#include "CoordinateTypes.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace processing
{

class ITextNormalizer;

inline constexpr const char* kNoComponentsReason = "no coordinate components found";
inline constexpr int kDecimalPlaces = 6;

// Converts one DMS or decimal-degree string into signed decimal degrees.
//
// Accepted dialects include 35°45'30"N, 35 45 30 N, 40-44-55N, N 40 44.5,
// 40°44'N, 40 N, 40.7486 and 40,7486. The normalizer is borrowed and must
// outlive the parser; nullptr selects default_normalizer().
class CoordinateParser
{
public:
    explicit CoordinateParser(const ITextNormalizer* normalizer = nullptr);

    [[nodiscard]] coordinates::ParseResult parse(std::string_view text) const;

    // Whole-string decimal literal, comma accepted as decimal separator
    [[nodiscard]] std::optional<double> parseDecimal(std::string_view normalized) const;

    // Numbers and hemisphere letter of already normalized text
    [[nodiscard]] std::optional<coordinates::ParsedComponents> extractComponents(std::string_view normalized) const;

private:
    const ITextNormalizer* normalizer_;
};

[[nodiscard]] double to_decimal(const coordinates::ParsedComponents& components);
[[nodiscard]] double round_to_places(double value, int places = kDecimalPlaces);

[[nodiscard]] coordinates::ParseResult parse_coordinate(std::string_view text);
[[nodiscard]] std::optional<coordinates::ParsedComponents> extract_components(std::string_view text);

} // namespace processing
