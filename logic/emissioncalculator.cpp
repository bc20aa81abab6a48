#include "shipem/emissioncalculator.h"
#include "shipem/exceptions.h"

#include "infra/log.h"
#include "unitconversion.h"

#include <algorithm>
#include <cmath>

namespace shipem {

using namespace inf;

double SegmentDurationSanitizer::sanitized_duration_hours(const Segment& segment) const noexcept
{
    return sanitized_duration_hours(segment.duration_hours(), segment.start().sog, segment.end().sog, segment.distance_m());
}

double SegmentDurationSanitizer::sanitized_duration_hours(double durationHours, double startSog, double endSog, double distanceM) const noexcept
{
    const auto assumedDistance = durationHours * ((startSog + endSog) / 2.0);
    const auto actualDistance  = m_to_nm(distanceM);
    if (assumedDistance == 0.0) {
        return durationHours;
    }

    const auto lowerBound = actualDistance * (1.0 - maxDistanceDeviation);
    const auto upperBound = actualDistance * (1.0 + maxDistanceDeviation);

    double factor = 1.0;
    if (assumedDistance < lowerBound) {
        factor = lowerBound / assumedDistance;
    } else if (assumedDistance > upperBound) {
        factor = upperBound / assumedDistance;
    }

    return durationHours * std::min(factor, maxDurationIncreaseFactor);
}

EmissionCalculator::EmissionCalculator(const EmissionConfiguration& config, VesselInfo vessel, SegmentDurationSanitizer durationSanitizer)
: _config(config)
, _vessel(std::move(vessel))
, _durationSanitizer(durationSanitizer)
{
}

const VesselInfo& EmissionCalculator::vessel_info() const noexcept
{
    return _vessel;
}

double EmissionCalculator::propulsion_load_at_stw(double stw) const noexcept
{
    const auto speedRatio = stw / _vessel.max_speed();
    return std::min(std::pow(speedRatio, 3.0) * _config.sea_margin_adjustment_factor(), 1.0);
}

double EmissionCalculator::segment_propulsion_load(const Segment& segment) const noexcept
{
    return (propulsion_load_at_stw(segment.start().stw) + propulsion_load_at_stw(segment.end().stw)) / 2.0;
}

Emissions EmissionCalculator::segment_propulsion_emissions(const Segment& segment, const EmissionProfile& profile) const
{
    const auto load          = segment_propulsion_load(segment);
    const auto durationHours = _durationSanitizer.sanitized_duration_hours(segment);
    if (durationHours != segment.duration_hours()) {
        Log::debug("Segment duration changed from {:.3f}h to {:.3f}h ({:.2f} nm covered)", segment.duration_hours(), durationHours, m_to_nm(segment.distance_m()));
    }

    const auto kwh = _vessel.engine_kw() * durationHours * load;
    return profile.low_load_adjusted(profile.emissions_from_energy(EngineGroup::Propulsion, kwh), load);
}

int32_t EmissionCalculator::corrected_segment_durations(const Track& track) const
{
    int32_t count = 0;
    for (const auto& segment : track.segments()) {
        if (_durationSanitizer.sanitized_duration_hours(segment) != segment.duration_hours()) {
            ++count;
        }
    }

    return count;
}

Emissions EmissionCalculator::auxiliary_emissions(double hours, const EmissionProfile& profile) const
{
    Emissions result;
    for (auto group : {EngineGroup::Auxiliary, EngineGroup::Boiler}) {
        result += profile.emissions_from_energy(group, profile.engine_power(group) * hours);
    }

    return result;
}

Emissions EmissionCalculator::calculate_track_emissions(const Track& track, Mode mode) const
{
    if (mode != Mode::Transit && mode != Mode::Maneuvering) {
        throw ValidationError("Invalid mode for track emissions: {} (expected transit or maneuvering)", mode);
    }

    const auto profile = _config.profile_for(_vessel, mode);

    Emissions result;
    for (const auto& segment : track.segments()) {
        result += segment_propulsion_emissions(segment, profile);
    }

    result += auxiliary_emissions(to_hours(track.duration()), profile);
    return result;
}

Emissions EmissionCalculator::calculate_mooring_emissions(std::chrono::seconds duration, Mode mode) const
{
    if (mode != Mode::Hotelling && mode != Mode::Anchorage) {
        throw ValidationError("Invalid mode for mooring emissions: {} (expected hotelling or anchorage)", mode);
    }

    if (duration.count() < 0) {
        throw ValidationError("Invalid mooring duration: {}s", duration.count());
    }

    const auto profile = _config.profile_for(_vessel, mode);
    return auxiliary_emissions(to_hours(duration), profile);
}

}
