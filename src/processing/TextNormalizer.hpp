#pragma once

#include <string>
#include <string_view>

namespace processing
{

class ITextNormalizer;

[[nodiscard]] std::string map_prime_marks(std::string_view text);
[[nodiscard]] std::string collapse_whitespace(std::string_view text);

// Canonical coordinate text using the shared CoordinateNormalizer
[[nodiscard]] std::string normalize(std::string_view text);

[[nodiscard]] const ITextNormalizer& default_normalizer();

} // namespace processing
