#include "CoordinateParser.hpp"
#include "ITextNormalizer.hpp"
#include "TextNormalizer.hpp"
#include "Diagnostics.hpp"

#include <charconv>
#include <cmath>
#include <regex>
#include <plog/Log.h>

using coordinates::Hemisphere;
using coordinates::ParsedComponents;
using coordinates::ParseResult;

namespace processing
{

namespace
{

const std::regex& decimal_literal_pattern()
{
    static const std::regex re(R"([+-]?(?:[0-9]+(?:\.[0-9]*)?|\.[0-9]+)(?:[eE][+-]?[0-9]+)?)");
    return re;
}

const std::regex& number_run_pattern()
{
    static const std::regex re(R"([0-9]+(?:\.[0-9]*)?|\.[0-9]+)");
    return re;
}

std::optional<double> to_double(std::string_view s)
{
    if (!s.empty() && s.front() == '+')
        s.remove_prefix(1);
    if (!s.empty() && s.back() == '.')
        s.remove_suffix(1);
    if (s.empty())
        return std::nullopt;

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || !std::isfinite(value))
        return std::nullopt;
    return value;
}

bool is_ascii_alpha(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool is_ascii_digit(char c)
{
    return c >= '0' && c <= '9';
}

// First free-standing hemisphere letter, else the first one inside a word
std::optional<Hemisphere> find_hemisphere(std::string_view text)
{
    std::optional<Hemisphere> first_in_word;
    for (size_t i = 0; i < text.size(); ++i)
    {
        auto hemisphere = coordinates::hemisphere_from_char(text[i]);
        if (!hemisphere)
            continue;

        bool letter_before = i > 0 && is_ascii_alpha(text[i - 1]);
        bool letter_after = i + 1 < text.size() && is_ascii_alpha(text[i + 1]);
        if (!letter_before && !letter_after)
            return hemisphere;
        if (!first_in_word)
            first_in_word = hemisphere;
    }
    return first_in_word;
}

} // anonymous namespace

CoordinateParser::CoordinateParser(const ITextNormalizer* normalizer)
    : normalizer_(normalizer ? normalizer : &default_normalizer())
{
}

ParseResult CoordinateParser::parse(std::string_view text) const
{
    std::string normalized = normalizer_->normalize(text);

    if (auto decimal = parseDecimal(normalized))
        return ParseResult::success(*decimal);

    auto components = extractComponents(normalized);
    if (!components)
    {
        if (diagnostics::verbose())
            PLOG_DEBUG_(diagnostics::kLogInstance) << "[CoordinateParser] no components in " << diagnostics::preview(text);
        return ParseResult::failure(kNoComponentsReason, std::string(text));
    }

    return ParseResult::success(round_to_places(to_decimal(*components)));
}

std::optional<double> CoordinateParser::parseDecimal(std::string_view normalized) const
{
    if (normalized.empty())
        return std::nullopt;

    std::string candidate(normalized);
    for (char& c : candidate)
    {
        if (c == ',')
            c = '.';
    }

    if (!std::regex_match(candidate, decimal_literal_pattern()))
        return std::nullopt;
    return to_double(candidate);
}

std::optional<ParsedComponents> CoordinateParser::extractComponents(std::string_view normalized) const
{
    const char* begin = normalized.data();
    const char* end = begin + normalized.size();

    ParsedComponents components;
    int count = 0;
    for (std::cregex_iterator it(begin, end, number_run_pattern()), last; it != last && count < 3; ++it)
    {
        auto value = to_double(std::string_view(begin + it->position(), static_cast<size_t>(it->length())));
        if (!value)
            continue;

        switch (count)
        {
        case 0:
        {
            components.degrees = *value;
            auto pos = static_cast<size_t>(it->position());
            components.negative = pos > 0 && normalized[pos - 1] == '-' &&
                                  (pos < 2 || !is_ascii_digit(normalized[pos - 2]));
            break;
        }
        case 1:
            components.minutes = *value;
            break;
        default:
            components.seconds = *value;
            break;
        }
        ++count;
    }

    if (count == 0)
        return std::nullopt;

    components.hemisphere = find_hemisphere(normalized);
    return components;
}

double to_decimal(const ParsedComponents& components)
{
    double value = components.degrees + components.minutes.value_or(0.0) / 60.0 +
                   components.seconds.value_or(0.0) / 3600.0;

    if (components.hemisphere)
    {
        if (*components.hemisphere == Hemisphere::South || *components.hemisphere == Hemisphere::West)
            value = -value;
    }
    else if (components.negative)
    {
        value = -value;
    }
    return value;
}

double round_to_places(double value, int places)
{
    const double scale = std::pow(10.0, places);
    // Beyond 2^53 / scale there are no fractional digits left to round away,
    // and value * scale may overflow
    if (!std::isfinite(value) || std::fabs(value) >= 9007199254740992.0 / scale)
        return value;

    double rounded = std::round(value * scale) / scale;
    return rounded == 0.0 ? 0.0 : rounded;
}

ParseResult parse_coordinate(std::string_view text)
{
    return CoordinateParser().parse(text);
}

std::optional<ParsedComponents> extract_components(std::string_view text)
{
    return CoordinateParser().extractComponents(normalize(text));
}

} // namespace processing
