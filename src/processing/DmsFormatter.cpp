#include "DmsFormatter.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

using coordinates::Axis;
using coordinates::Hemisphere;

namespace processing
{

std::string format_as_dms(double value, Axis axis, int seconds_precision)
{
    Hemisphere hemisphere;
    if (axis == Axis::Latitude)
        hemisphere = value < 0.0 ? Hemisphere::South : Hemisphere::North;
    else
        hemisphere = value < 0.0 ? Hemisphere::West : Hemisphere::East;
    return format_as_dms(value, hemisphere, seconds_precision);
}

std::string format_as_dms(double value, Hemisphere hemisphere, int seconds_precision)
{
    const int precision = std::clamp(seconds_precision, 0, 9);
    const long long scale = static_cast<long long>(std::llround(std::pow(10.0, precision)));

    // Work in integer ticks of 10^-precision seconds so the carry is exact
    const long long ticks = std::llround(std::fabs(value) * 3600.0 * static_cast<double>(scale));
    const long long ticks_per_degree = 3600 * scale;
    const long long ticks_per_minute = 60 * scale;

    const long long degrees = ticks / ticks_per_degree;
    const long long minutes = (ticks % ticks_per_degree) / ticks_per_minute;
    const long long second_ticks = ticks % ticks_per_minute;

    std::ostringstream oss;
    oss << degrees << "°" << minutes << "'" << std::fixed << std::setprecision(precision)
        << static_cast<double>(second_ticks) / static_cast<double>(scale) << "\"" << coordinates::to_char(hemisphere);
    return oss.str();
}

} // namespace processing
