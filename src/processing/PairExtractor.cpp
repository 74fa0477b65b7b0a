#include "PairExtractor.hpp"
#include "ITextNormalizer.hpp"
#include "TextNormalizer.hpp"
#include "Diagnostics.hpp"

#include <regex>
#include <plog/Log.h>

using coordinates::CoordinatePair;

namespace processing
{

namespace
{

// A digit, anything but a hemisphere letter, then the hemisphere letter
const std::regex& hemisphere_token_pattern()
{
    static const std::regex re(R"([0-9][^NSEWnsew]*[NSEWnsew])");
    return re;
}

bool is_delimiter(char c)
{
    return c == ',' || c == ';' || c == '/';
}

} // anonymous namespace

PairExtractor::PairExtractor(const ITextNormalizer* normalizer)
    : normalizer_(normalizer ? normalizer : &default_normalizer())
{
}

std::optional<CoordinatePair> PairExtractor::extract(std::string_view line) const
{
    std::string normalized = normalizer_->normalize(line);
    if (normalized.empty())
        return std::nullopt;

    auto tokens = findHemisphereTokens(normalized);
    if (tokens.size() >= 2)
    {
        if (diagnostics::verbose() && tokens.size() > 2)
            PLOG_DEBUG_(diagnostics::kLogInstance)
                << "[PairExtractor] " << tokens.size() << " tokens, keeping first two of " << diagnostics::preview(line);
        return CoordinatePair{ std::move(tokens[0]), std::move(tokens[1]) };
    }

    auto pieces = splitDelimited(normalized);
    if (pieces.size() == 2)
        return CoordinatePair{ std::move(pieces[0]), std::move(pieces[1]) };

    if (diagnostics::verbose())
        PLOG_DEBUG_(diagnostics::kLogInstance) << "[PairExtractor] no pair in " << diagnostics::preview(line);
    return std::nullopt;
}

std::vector<std::string> PairExtractor::findHemisphereTokens(std::string_view normalized) const
{
    std::vector<std::string> tokens;
    const char* begin = normalized.data();
    const char* end = begin + normalized.size();
    for (std::cregex_iterator it(begin, end, hemisphere_token_pattern()), last; it != last; ++it)
    {
        tokens.push_back(it->str());
    }
    return tokens;
}

std::vector<std::string> PairExtractor::splitDelimited(std::string_view normalized) const
{
    std::vector<std::string> pieces;
    size_t start = 0;
    for (size_t i = 0; i <= normalized.size(); ++i)
    {
        if (i < normalized.size() && !is_delimiter(normalized[i]))
            continue;

        // Normalized text only ever holds single ASCII spaces
        std::string_view piece = normalized.substr(start, i - start);
        while (!piece.empty() && piece.front() == ' ')
            piece.remove_prefix(1);
        while (!piece.empty() && piece.back() == ' ')
            piece.remove_suffix(1);
        if (!piece.empty())
            pieces.emplace_back(piece);

        start = i + 1;
    }
    return pieces;
}

std::optional<CoordinatePair> extract_pair(std::string_view line)
{
    return PairExtractor().extract(line);
}

} // namespace processing
