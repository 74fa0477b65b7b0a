#pragma once

#include "ITextNormalizer.hpp"

namespace processing
{

class CoordinateNormalizer : public ITextNormalizer
{
public:
    CoordinateNormalizer() = default;
    ~CoordinateNormalizer() override = default;

    CoordinateNormalizer(const CoordinateNormalizer&) = delete;
    CoordinateNormalizer& operator=(const CoordinateNormalizer&) = delete;

    [[nodiscard]] std::string mapPunctuation(std::string_view text) const override;
    [[nodiscard]] std::string collapseWhitespace(std::string_view text) const override;
    [[nodiscard]] std::string normalize(std::string_view text) const override;

    // NFKC compatibility folding; returns the input unchanged on invalid UTF-8
    [[nodiscard]] std::string foldCompatibility(std::string_view text) const;
};

} // namespace processing
