#pragma once

#include "shipem/constants.h"
#include "shipem/emissionconfiguration.h"
#include "shipem/emissions.h"
#include "shipem/track.h"
#include "shipem/vesselinfo.h"

#include <chrono>

namespace shipem {

/* Corrects segment durations that do not agree with the reported speeds and the covered distance
 * The distance assumed from the duration and the mean reported speed has to stay within the
 * allowed deviation of the covered distance, otherwise the duration is scaled to the nearest bound.
 * The duration never increases more than the maximum factor and is left alone when the vessel
 * reported standing still. */
struct SegmentDurationSanitizer
{
    double maxDistanceDeviation      = constants::sanitization::maxDistanceDeviation;
    double maxDurationIncreaseFactor = constants::sanitization::maxDurationIncreaseFactor;

    double sanitized_duration_hours(const Segment& segment) const noexcept;
    double sanitized_duration_hours(double durationHours, double startSog, double endSog, double distanceM) const noexcept;
};

// Calculates the emissions of one vessel, the configuration must outlive the calculator
class EmissionCalculator
{
public:
    EmissionCalculator(const EmissionConfiguration& config, VesselInfo vessel, SegmentDurationSanitizer durationSanitizer = {});

    // Propulsion, auxiliary and boiler emissions while sailing (transit or maneuvering)
    Emissions calculate_track_emissions(const Track& track, Mode mode) const;
    // Auxiliary and boiler emissions while stationary (hotelling or anchorage)
    Emissions calculate_mooring_emissions(std::chrono::seconds duration, Mode mode) const;

    // Propeller law: (stw / max_speed)^3 with the sea margin applied, never more than full load
    double propulsion_load_at_stw(double stw) const noexcept;
    // Mean of the load at the start and at the end of the segment
    double segment_propulsion_load(const Segment& segment) const noexcept;
    Emissions segment_propulsion_emissions(const Segment& segment, const EmissionProfile& profile) const;
    // Number of segments of the track whose duration is corrected in the propulsion calculation
    int32_t corrected_segment_durations(const Track& track) const;

    const VesselInfo& vessel_info() const noexcept;

private:
    Emissions auxiliary_emissions(double hours, const EmissionProfile& profile) const;

    const EmissionConfiguration& _config;
    VesselInfo _vessel;
    SegmentDurationSanitizer _durationSanitizer;
};

}
