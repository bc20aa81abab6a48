#include "vesselemissions.h"

#include "shipem/emissioncalculator.h"
#include "shipem/exceptions.h"
#include "shipem/inputparsers.h"
#include "runsummary.h"

#include "infra/log.h"
#include "infra/string.h"

#include <optional>

namespace shipem {

using namespace inf;

namespace {

struct TrackResult
{
    fs::path path;
    Mode mode = Mode::Transit;
    size_t positions = 0;
    SanitizationSummary sanitization;
    int32_t correctedSegmentDurations = 0;
};

}

static std::vector<std::string> guessed_attribute_names(const Attributes& known)
{
    std::vector<std::string> result;
    for (auto name : vessel_info_attribute_names()) {
        if (known.count(name) == 0) {
            result.emplace_back(name);
        }
    }

    return result;
}

static void record_failure(const VesselInput& input, std::string_view error, RunSummary& summary)
{
    Log::error("Failed to calculate emissions for vessel '{}': {}", input.name, error);
    summary.add_vessel_failure(input.name, error);
}

std::vector<EmissionOutputEntry> calculate_vessel_emissions(const VesselInput& input, const EmissionConfiguration& emissionConfig, const RunConfiguration& cfg, RunSummary& summary)
{
    std::optional<VesselInfo> vessel;
    try {
        vessel = emissionConfig.guess_vessel_info(input.attributes);
    } catch (const std::exception& e) {
        record_failure(input, e.what(), summary);
        return {};
    }

    Log::info("Vessel '{}': {}", input.name, *vessel);
    summary.add_vessel(input.name, *vessel, guessed_attribute_names(input.attributes));

    std::vector<TrackResult> tracks;
    std::vector<EmissionOutputEntry> result;

    try {
        EmissionCalculator calculator(emissionConfig, *vessel, cfg.duration_sanitizer());

        for (const auto& trackInput : input.tracks) {
            const auto rawPositions = parse_positions(trackInput.path);
            const auto track        = sanitize(rawPositions, cfg.sog_plausibility(), cfg.distance_plausibility());

            if (const auto& sanitization = track.sanitization_summary(); sanitization.discardedPositions > 0) {
                Log::warn("Vessel '{}': {} implausible positions discarded from {}", input.name, sanitization.discardedPositions, trackInput.path);
            }

            EmissionOutputEntry entry;
            entry.vessel    = input.name;
            entry.activity  = str::from_u8(trackInput.path.filename().u8string());
            entry.mode      = trackInput.mode;
            entry.emissions = calculator.calculate_track_emissions(track, trackInput.mode);
            Log::debug("Vessel '{}' track {} ({}): {}", input.name, entry.activity, entry.mode, entry.emissions);

            TrackResult trackResult;
            trackResult.path                      = trackInput.path;
            trackResult.mode                      = trackInput.mode;
            trackResult.positions                 = track.size();
            trackResult.sanitization              = track.sanitization_summary();
            trackResult.correctedSegmentDurations = calculator.corrected_segment_durations(track);
            if (trackResult.correctedSegmentDurations > 0) {
                Log::info("Vessel '{}': {} segment durations corrected in {}", input.name, trackResult.correctedSegmentDurations, trackInput.path);
            }

            tracks.push_back(std::move(trackResult));
            result.push_back(std::move(entry));
        }

        for (const auto& mooring : input.moorings) {
            EmissionOutputEntry entry;
            entry.vessel    = input.name;
            entry.activity  = "mooring";
            entry.mode      = mooring.mode;
            entry.emissions = calculator.calculate_mooring_emissions(mooring.duration, mooring.mode);
            Log::debug("Vessel '{}' mooring ({}, {}s): {}", input.name, entry.mode, mooring.duration.count(), entry.emissions);

            result.push_back(std::move(entry));
        }
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        record_failure(input, e.what(), summary);
        return {};
    }

    for (const auto& track : tracks) {
        summary.add_track(input.name, track.path, track.mode, track.positions, track.sanitization, track.correctedSegmentDurations);
    }

    for (const auto& entry : result) {
        summary.add_emissions(entry.vessel, entry.activity, entry.mode, entry.emissions);
    }

    return result;
}

}
