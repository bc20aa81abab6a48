#pragma once

#include "shipem/attributes.h"
#include "shipem/matchconfig.h"
#include "shipem/vesselinfo.h"

#include <optional>

namespace shipem {

/* Completes partially known vessel information using the configured guess rules
 *
 * Every missing attribute is taken from the first matching rule that supplies it,
 * the rules are matched against the known attributes.
 * size and size_unit are only taken from a rule that also supplies the ship_type,
 * and only when that ship_type is the known (or already guessed) one.
 *
 * For c3 engines the NOx tier is usually determined by the keel laid year.
 * When neither the tier nor the keel laid year is known but the year of build is,
 * the keel laid year is derived from the average build time for the vessel
 * and the tier is guessed a second time with the keel laid year in the context. */
class VesselInfoGuesser
{
public:
    // Throws a ConfigurationError when the rules do not provide the required fallbacks
    VesselInfoGuesser(AttributeMatchConfigs guessData, AttributeMatchConfigs averageBuildTimes);

    // Returns all the VesselInfo attributes, known values are never replaced
    Attributes guess_missing(const Attributes& known) const;
    VesselInfo guess_vessel_info(const Attributes& known) const;

    // The vessel information that is guessed when nothing is known
    const VesselInfo& default_vessel_info() const noexcept;

    const AttributeMatchConfigs& guess_data() const noexcept;
    const AttributeMatchConfigs& average_build_times() const noexcept;

private:
    void validate_guess_data() const;
    void validate_build_times() const;

    std::optional<EngineNOxTier> improved_nox_tier_guess(const Attributes& known, const Attributes& guessed) const;
    double average_build_time(const Attributes& context) const;

    AttributeMatchConfigs _guessData;
    AttributeMatchConfigs _averageBuildTimes;
    std::optional<VesselInfo> _defaultVesselInfo;
};

}
