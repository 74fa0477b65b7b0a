#pragma once

#include "CoordinateTypes.hpp"

#include <string>

namespace processing
{

// Renders decimal degrees as D°M'S"H, e.g. 35°45'30.0000"N.
// The hemisphere comes from the sign and the axis; seconds that round up to
// 60 carry into the minutes.
[[nodiscard]] std::string format_as_dms(double value, coordinates::Axis axis, int seconds_precision = 4);

// Renders magnitude with an explicit hemisphere, ignoring the sign of value
[[nodiscard]] std::string format_as_dms(double value, coordinates::Hemisphere hemisphere, int seconds_precision = 4);

} // namespace processing
