#pragma once

#include <string>
#include <string_view>

namespace processing
{

class ITextNormalizer
{
public:
    virtual ~ITextNormalizer() = default;

    // Maps prime, typographic quote and apostrophe glyphs to ASCII ' and "
    [[nodiscard]] virtual std::string mapPunctuation(std::string_view text) const = 0;

    // Trims and reduces every whitespace run to a single space
    [[nodiscard]] virtual std::string collapseWhitespace(std::string_view text) const = 0;

    // Full normalization pipeline: punctuation + Unicode NFKC + whitespace
    [[nodiscard]] virtual std::string normalize(std::string_view text) const = 0;
};

} // namespace processing
