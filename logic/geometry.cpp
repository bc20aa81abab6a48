#include "geometry.h"
#include "shipem/constants.h"

#include <cmath>
#include <numbers>

namespace shipem::geom {

static double to_radians(double degrees) noexcept
{
    return degrees * std::numbers::pi / 180.0;
}

static double to_degrees(double radians) noexcept
{
    return radians * 180.0 / std::numbers::pi;
}

double great_circle_distance(double lon1, double lat1, double lon2, double lat2) noexcept
{
    lon1 = to_radians(lon1);
    lat1 = to_radians(lat1);
    lon2 = to_radians(lon2);
    lat2 = to_radians(lat2);

    const auto dlat = lat2 - lat1;
    const auto dlon = lon2 - lon1;
    const auto d    = std::pow(std::sin(dlat * 0.5), 2) + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(dlon * 0.5), 2);
    return 2 * constants::averageEarthRadiusMeter * std::atan2(std::sqrt(d), std::sqrt(1 - d));
}

double bearing(double lon1, double lat1, double lon2, double lat2) noexcept
{
    return std::fmod(to_degrees(std::atan2(lon2 - lon1, lat2 - lat1)) + 360.0, 360.0);
}

double average_bearing(double b1, double b2) noexcept
{
    if (std::abs(b1 - b2) > 180.0) {
        if (b1 < b2) {
            b1 += 360.0;
        } else {
            b2 += 360.0;
        }
    }

    return std::fmod((b1 + b2) / 2, 360.0);
}

bool is_valid_bearing(double bearing) noexcept
{
    return bearing >= 0.0 && bearing < 360.0;
}

}
