#pragma once

#include "shipem/constants.h"

#include <chrono>

namespace shipem {

inline constexpr double m_to_nm(double meters) noexcept
{
    return meters / constants::metersPerNauticalMile;
}

template <typename Rep, typename Period>
inline double to_hours(std::chrono::duration<Rep, Period> duration) noexcept
{
    return std::chrono::duration<double, std::ratio<3600>>(duration).count();
}

// Speed in knots needed to cover the distance in the given time, 0 for an empty duration
template <typename Rep, typename Period>
inline double speed_knots(double meters, std::chrono::duration<Rep, Period> duration) noexcept
{
    const auto hours = to_hours(duration);
    if (hours == 0.0) {
        return 0.0;
    }

    return m_to_nm(meters / hours);
}

}
