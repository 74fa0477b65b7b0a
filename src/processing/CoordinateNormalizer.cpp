#include "CoordinateNormalizer.hpp"
#include "TextNormalizer.hpp"
#include "Diagnostics.hpp"

#include <cstdlib>
#include <utf8proc.h>
#include <plog/Log.h>

namespace processing
{

std::string CoordinateNormalizer::mapPunctuation(std::string_view text) const
{
    return map_prime_marks(text);
}

std::string CoordinateNormalizer::collapseWhitespace(std::string_view text) const
{
    return collapse_whitespace(text);
}

std::string CoordinateNormalizer::foldCompatibility(std::string_view text) const
{
    if (text.empty())
        return std::string();

    utf8proc_uint8_t* folded = nullptr;
    utf8proc_ssize_t len = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(text.data()),
                                        static_cast<utf8proc_ssize_t>(text.size()), &folded,
                                        static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_COMPOSE |
                                                                       UTF8PROC_COMPAT));

    if (len < 0 || !folded)
    {
        PLOG_WARNING << "NFKC normalization failed (" << utf8proc_errmsg(len)
                     << "), keeping text as is: " << diagnostics::preview(text);
        return std::string(text);
    }

    std::string result(reinterpret_cast<char*>(folded), static_cast<size_t>(len));
    std::free(folded);
    return result;
}

std::string CoordinateNormalizer::normalize(std::string_view text) const
{
    if (text.empty())
        return std::string();

    // Primes go first: NFKC would split U+2033 into two U+2032.
    // The second pass catches primes NFKC produced from triple primes.
    std::string mapped = mapPunctuation(text);
    std::string folded = foldCompatibility(mapped);
    return collapseWhitespace(mapPunctuation(folded));
}

} // namespace processing
