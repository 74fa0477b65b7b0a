#include "TextNormalizer.hpp"
#include "CoordinateNormalizer.hpp"

#include <array>

namespace processing
{

namespace
{

struct GlyphMapping
{
    std::string_view utf8;
    char ascii;
};

// UTF-8 encodings of the marks people type for minutes and seconds
// plus line breaks that NFKC keeps and collapse_whitespace would not see
constexpr std::array<GlyphMapping, 17> kGlyphMappings = { {
    { "′", '\'' }, // PRIME
    { "‵", '\'' }, // REVERSED PRIME
    { "ʹ", '\'' }, // MODIFIER LETTER PRIME
    { "’", '\'' }, // RIGHT SINGLE QUOTATION MARK
    { "‘", '\'' }, // LEFT SINGLE QUOTATION MARK
    { "‛", '\'' }, // SINGLE HIGH-REVERSED-9 QUOTATION MARK
    { "´", '\'' }, // ACUTE ACCENT
    { "`", '\'' },
    { "″", '"' },  // DOUBLE PRIME
    { "‶", '"' },  // REVERSED DOUBLE PRIME
    { "ʺ", '"' },  // MODIFIER LETTER DOUBLE PRIME
    { "“", '"' },  // LEFT DOUBLE QUOTATION MARK
    { "”", '"' },  // RIGHT DOUBLE QUOTATION MARK
    { "‟", '"' },  // DOUBLE HIGH-REVERSED-9 QUOTATION MARK
    { "\xC2\x85", ' ' },     // NEXT LINE
    { "\xE2\x80\xA8", ' ' }, // LINE SEPARATOR
    { "\xE2\x80\xA9", ' ' }, // PARAGRAPH SEPARATOR
} };

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

} // anonymous namespace

std::string map_prime_marks(std::string_view text)
{
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size())
    {
        bool mapped = false;
        std::string_view rest = text.substr(i);
        for (const auto& mapping : kGlyphMappings)
        {
            if (rest.starts_with(mapping.utf8))
            {
                out.push_back(mapping.ascii);
                i += mapping.utf8.size();
                mapped = true;
                break;
            }
        }
        if (!mapped)
        {
            out.push_back(text[i]);
            ++i;
        }
    }

    return out;
}

std::string collapse_whitespace(std::string_view text)
{
    std::string result;
    result.reserve(text.size());

    bool pending_space = false;
    for (char c : text)
    {
        if (is_space(c))
        {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space)
        {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(c);
    }

    return result;
}

const ITextNormalizer& default_normalizer()
{
    static const CoordinateNormalizer normalizer;
    return normalizer;
}

std::string normalize(std::string_view text)
{
    return default_normalizer().normalize(text);
}

} // namespace processing
