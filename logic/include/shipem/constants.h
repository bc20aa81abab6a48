#pragma once

#include <cstdint>
#include <string_view>

namespace shipem::constants {

inline constexpr const double averageEarthRadiusMeter = 6'370'986.0;
inline constexpr const double metersPerNauticalMile   = 1'852.0;
inline constexpr const double secondsPerHour          = 3'600.0;

// Upper bound for speeds over ground derived from consecutive positions (kts)
inline constexpr const double maxCalculatedSpeed = 16.0;

namespace sanitization {
inline constexpr const double maxDistanceDeviation      = 0.25;
inline constexpr const double maxDurationIncreaseFactor = 10.0;
}

}
