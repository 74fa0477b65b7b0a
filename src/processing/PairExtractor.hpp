#pragma once

#include "CoordinateTypes.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace processing
{

class ITextNormalizer;

// Finds a latitude/longitude pair inside one line of free text.
//
// Hemisphere-terminated tokens ("35°45'30"N", "82 18 45 W") are tried first;
// a line without two of them is split on , ; or / instead. No attempt is
// made to check that the first token really is a latitude.
class PairExtractor
{
public:
    explicit PairExtractor(const ITextNormalizer* normalizer = nullptr);

    [[nodiscard]] std::optional<coordinates::CoordinatePair> extract(std::string_view line) const;

    // Every hemisphere-terminated token of an already normalized line, in order
    [[nodiscard]] std::vector<std::string> findHemisphereTokens(std::string_view normalized) const;

    // Non-empty trimmed pieces of an already normalized line split on , ; /
    [[nodiscard]] std::vector<std::string> splitDelimited(std::string_view normalized) const;

private:
    const ITextNormalizer* normalizer_;
};

[[nodiscard]] std::optional<coordinates::CoordinatePair> extract_pair(std::string_view line);

} // namespace processing
