#pragma once

#include "shipem/criterion.h"
#include "shipem/emissions.h"
#include "shipem/matchconfig.h"
#include "shipem/vesselinfo.h"
#include "shipem/vesselinfoguesser.h"
#include "infra/enumutils.h"

#include <array>
#include <map>
#include <string>
#include <vector>

namespace shipem {

// The adjustment factors per pollutant for engine loads inside the range
struct LoadRangeFactor
{
    Range range;
    PollutantFactors factors;
};

using LoadRangeFactors           = std::vector<LoadRangeFactor>;
using LowLoadAdjustmentConfigs   = MatchConfigs<LoadRangeFactors>;
using NamedAttributeMatchConfigs = std::map<std::string, AttributeMatchConfigs, std::less<>>;

namespace configkey {
inline constexpr std::string_view GramsPerKwh    = "g_per_kwh";
inline constexpr std::string_view BaseValueName  = "base_value_name";
inline constexpr std::string_view Multiplier     = "multiplier";
inline constexpr std::string_view OffsetGPerKwh  = "offset_g_per_kwh";
inline constexpr std::string_view RangeFactors   = "range_factors";
inline constexpr std::string_view BuildTimeYears = "build_time_years";
}

/* Everything that is needed to calculate the emissions of one vessel in one mode
 * resolved once from the configuration */
class EmissionProfile
{
public:
    EmissionProfile(std::array<PollutantFactors, inf::enum_count<EngineGroup>()> emissionFactors,
                    double auxiliaryPowerKw,
                    double boilerPowerKw,
                    LoadRangeFactors lowLoadFactors);

    // Emission factors in g/kWh per pollutant
    const PollutantFactors& emission_factors(EngineGroup group) const noexcept;

    // Default power for the auxiliary engines and the boiler (0 for propulsion, it depends on the load)
    double engine_power(EngineGroup group) const noexcept;

    Emissions emissions_from_energy(EngineGroup group, double kwh) const;

    // The factors of the first range that contains the load, nullptr if there is none
    const PollutantFactors* low_load_factors(double load) const noexcept;
    Emissions low_load_adjusted(const Emissions& emissions, double load) const;

private:
    std::array<PollutantFactors, inf::enum_count<EngineGroup>()> _emissionFactors;
    double _auxiliaryPower;
    double _boilerPower;
    LoadRangeFactors _lowLoadFactors;
};

/* The complete emission configuration, validated on construction
 * (ConfigurationError for structural problems, ValidationError for invalid values)
 * Immutable after construction, can be shared between calculations on different threads */
class EmissionConfiguration
{
public:
    EmissionConfiguration(double seaMarginAdjustmentFactor,
                          NamedAttributeMatchConfigs baseValues,
                          NamedAttributeMatchConfigs pollutants,
                          AttributeMatchConfigs defaultEnginePowers,
                          AttributeMatchConfigs vesselInfoGuessData,
                          AttributeMatchConfigs averageVesselBuildTimes,
                          LowLoadAdjustmentConfigs lowLoadAdjustmentFactors);

    double sea_margin_adjustment_factor() const noexcept;

    const NamedAttributeMatchConfigs& base_values() const noexcept;
    const NamedAttributeMatchConfigs& pollutants() const noexcept;
    const AttributeMatchConfigs& default_engine_powers() const noexcept;
    const LowLoadAdjustmentConfigs& low_load_adjustment_factors() const noexcept;
    const VesselInfoGuesser& vessel_info_guesser() const noexcept;

    std::vector<std::string> pollutant_names() const;

    // g/kWh per pollutant for the context (vessel attributes + engine_group)
    PollutantFactors emission_factors(const Attributes& context) const;
    // Power in kW of an auxiliary engine or boiler for the mode
    double engine_power(const VesselInfo& vessel, EngineGroup group, Mode mode) const;
    LoadRangeFactors low_load_range_factors(const VesselInfo& vessel) const;

    EmissionProfile profile_for(const VesselInfo& vessel, Mode mode) const;

    Attributes guess_missing_vessel_info(const Attributes& known) const;
    VesselInfo guess_vessel_info(const Attributes& known) const;
    const VesselInfo& default_vessel_info() const noexcept;

private:
    void validate() const;

    double _seaMargin;
    NamedAttributeMatchConfigs _baseValues;
    NamedAttributeMatchConfigs _pollutants;
    AttributeMatchConfigs _defaultEnginePowers;
    LowLoadAdjustmentConfigs _lowLoadAdjustmentFactors;
    VesselInfoGuesser _guesser;
};

/* Checks the names and constants of the criteria against the known attributes
 * Throws a ValidationError for unknown names or invalid constants */
void validate_criteria(const MatchCriteria& criteria, std::string_view configName);

}
