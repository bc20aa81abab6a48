#include "shipem/emissionconfiguration.h"
#include "shipem/configresolver.h"
#include "shipem/exceptions.h"

#include "infra/algo.h"
#include "infra/log.h"

#include <algorithm>
#include <array>
#include <fmt/format.h>
#include <functional>

namespace shipem {

using namespace inf;

static constexpr std::array<std::string_view, 6> s_nonNegativeNumberCriteria{{
    attribute::MaxSpeed,
    attribute::EngineKw,
    attribute::EngineRpm,
    attribute::Size,
    attribute::Length,
    attribute::Width,
}};

static constexpr std::array<std::string_view, 3> s_uncheckedCriteria{{
    attribute::AisType,
    attribute::KeelLaidYear,
    attribute::YearOfBuild,
}};

static bool contains_name(std::span<const std::string_view> names, std::string_view name) noexcept
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

template <typename TFunc>
static bool converts_without_error(TFunc&& convert)
{
    try {
        convert();
        return true;
    } catch (const ValidationError&) {
        return false;
    }
}

static std::function<bool(const AttributeValue&)> criterion_value_validator(std::string_view name)
{
    if (contains_name(s_nonNegativeNumberCriteria, name)) {
        return [](const AttributeValue& value) {
            auto number = as_number(value);
            return number.has_value() && *number >= 0.0;
        };
    }

    if (name == attribute::EngineCategory) {
        return [](const AttributeValue& value) {
            auto text = as_text(value);
            return text.has_value() && converts_without_error([&]() { engine_category_from_string(*text); });
        };
    }

    if (name == attribute::EngineGroup) {
        return [](const AttributeValue& value) {
            auto text = as_text(value);
            return text.has_value() && converts_without_error([&]() { engine_group_from_string(*text); });
        };
    }

    if (name == attribute::EngineNOxTier) {
        return [](const AttributeValue& value) {
            auto number = as_number(value);
            return number.has_value() && converts_without_error([&]() { engine_nox_tier_from_number(*number); });
        };
    }

    if (name == attribute::ShipType) {
        return [](const AttributeValue& value) {
            auto text = as_text(value);
            return text.has_value() && is_valid_ship_type(*text);
        };
    }

    if (name == attribute::SizeUnit) {
        return [](const AttributeValue& value) {
            auto text = as_text(value);
            return text.has_value() && is_valid_size_unit(*text);
        };
    }

    if (contains_name(s_uncheckedCriteria, name)) {
        return [](const AttributeValue&) { return true; };
    }

    return nullptr;
}

void validate_criteria(const MatchCriteria& criteria, std::string_view configName)
{
    for (const auto& [name, criterion] : criteria) {
        auto validator = criterion_value_validator(name);
        if (!validator) {
            throw ValidationError("Unknown match criterion '{}' in '{}'", name, configName);
        }

        if (!criterion.constants_satisfy(validator)) {
            throw ValidationError("Invalid value in match criterion '{} = {}' in '{}'", name, criterion, configName);
        }
    }
}

template <typename TValue>
static void validate_criteria(const MatchConfigs<TValue>& configs, std::string_view configName)
{
    for (const auto& config : configs) {
        validate_criteria(config.criteria, configName);
    }
}

static bool has_number(const AttributeMatchConfig& config, std::string_view key) noexcept
{
    const auto* value = config.find(key);
    return value != nullptr && is_number(*value);
}

EmissionProfile::EmissionProfile(std::array<PollutantFactors, enum_count<EngineGroup>()> emissionFactors,
                                 double auxiliaryPowerKw,
                                 double boilerPowerKw,
                                 LoadRangeFactors lowLoadFactors)
: _emissionFactors(std::move(emissionFactors))
, _auxiliaryPower(auxiliaryPowerKw)
, _boilerPower(boilerPowerKw)
, _lowLoadFactors(std::move(lowLoadFactors))
{
}

const PollutantFactors& EmissionProfile::emission_factors(EngineGroup group) const noexcept
{
    return _emissionFactors[enum_value(group)];
}

double EmissionProfile::engine_power(EngineGroup group) const noexcept
{
    switch (group) {
    case EngineGroup::Auxiliary:
        return _auxiliaryPower;
    case EngineGroup::Boiler:
        return _boilerPower;
    default:
        return 0.0;
    }
}

Emissions EmissionProfile::emissions_from_energy(EngineGroup group, double kwh) const
{
    Emissions result;
    for (const auto& [pollutant, gramsPerKwh] : emission_factors(group)) {
        result.add(pollutant, kwh * gramsPerKwh);
    }

    return result;
}

const PollutantFactors* EmissionProfile::low_load_factors(double load) const noexcept
{
    for (const auto& rangeFactor : _lowLoadFactors) {
        if (rangeFactor.range.contains(load)) {
            return &rangeFactor.factors;
        }
    }

    return nullptr;
}

Emissions EmissionProfile::low_load_adjusted(const Emissions& emissions, double load) const
{
    if (const auto* factors = low_load_factors(load); factors != nullptr) {
        return emissions.scaled(*factors);
    }

    return emissions;
}

EmissionConfiguration::EmissionConfiguration(double seaMarginAdjustmentFactor,
                                             NamedAttributeMatchConfigs baseValues,
                                             NamedAttributeMatchConfigs pollutants,
                                             AttributeMatchConfigs defaultEnginePowers,
                                             AttributeMatchConfigs vesselInfoGuessData,
                                             AttributeMatchConfigs averageVesselBuildTimes,
                                             LowLoadAdjustmentConfigs lowLoadAdjustmentFactors)
: _seaMargin(seaMarginAdjustmentFactor)
, _baseValues(std::move(baseValues))
, _pollutants(std::move(pollutants))
, _defaultEnginePowers(std::move(defaultEnginePowers))
, _lowLoadAdjustmentFactors(std::move(lowLoadAdjustmentFactors))
, _guesser(std::move(vesselInfoGuessData), std::move(averageVesselBuildTimes))
{
    validate();
}

void EmissionConfiguration::validate() const
{
    if (!(_seaMargin > 0.0)) {
        throw ValidationError("sea_margin_adjustment_factor must be positive ({})", _seaMargin);
    }

    validate_criteria(_guesser.guess_data(), "vessel_info_guess_data");
    validate_criteria(_guesser.average_build_times(), "average_vessel_build_times");
    validate_criteria(_defaultEnginePowers, "default_engine_powers");
    validate_criteria(_lowLoadAdjustmentFactors, "low_load_adjustment_factors");

    for (const auto& [name, configs] : _baseValues) {
        validate_criteria(configs, fmt::format("base_values.{}", name));
        for (const auto& config : configs) {
            if (!has_number(config, configkey::GramsPerKwh)) {
                throw ConfigurationError("g_per_kwh is not a number in base value '{}' entry {}", name, to_string(config.data));
            }
        }
    }

    for (const auto& [pollutant, configs] : _pollutants) {
        validate_criteria(configs, fmt::format("pollutants.{}", pollutant));
        for (const auto& config : configs) {
            const auto* baseValueName = config.find(configkey::BaseValueName);
            if (baseValueName == nullptr || !is_text(*baseValueName)) {
                throw ConfigurationError("No base_value_name in pollutant '{}' entry {}", pollutant, to_string(config.data));
            }

            if (_baseValues.count(*as_text(*baseValueName)) == 0) {
                throw ConfigurationError("Pollutant '{}' refers to unknown base value '{}'", pollutant, *baseValueName);
            }

            for (auto key : {configkey::Multiplier, configkey::OffsetGPerKwh}) {
                if (config.contains(key) && !has_number(config, key)) {
                    throw ConfigurationError("{} is not a number in pollutant '{}' entry {}", key, pollutant, to_string(config.data));
                }
            }
        }
    }

    for (const auto& config : _defaultEnginePowers) {
        for (auto mode : {Mode::Transit, Mode::Maneuvering, Mode::Hotelling, Mode::Anchorage}) {
            if (!has_number(config, enum_to_string(mode))) {
                throw ConfigurationError("{} power is not a number in default engine powers entry {}", mode, to_string(config.data));
            }
        }
    }

    for (auto group : {EngineGroup::Auxiliary, EngineGroup::Boiler}) {
        const Attributes groupContext{{std::string(attribute::EngineGroup), std::string(enum_to_string(group))}};
        const bool fallbackPresent = std::any_of(_defaultEnginePowers.begin(), _defaultEnginePowers.end(), [&](const AttributeMatchConfig& config) {
            return config.criteria.has_only(attribute::EngineGroup) && config.matches(groupContext);
        });

        if (!fallbackPresent) {
            throw ConfigurationError("No default engine powers entry with only an engine_group criterion for '{}'", group);
        }
    }

    for (const auto& config : _lowLoadAdjustmentFactors) {
        const auto* rangeFactors = config.find(configkey::RangeFactors);
        if (rangeFactors == nullptr || rangeFactors->empty()) {
            throw ConfigurationError("No range_factors present in low load adjustment factors entry");
        }
    }
}

double EmissionConfiguration::sea_margin_adjustment_factor() const noexcept
{
    return _seaMargin;
}

const NamedAttributeMatchConfigs& EmissionConfiguration::base_values() const noexcept
{
    return _baseValues;
}

const NamedAttributeMatchConfigs& EmissionConfiguration::pollutants() const noexcept
{
    return _pollutants;
}

const AttributeMatchConfigs& EmissionConfiguration::default_engine_powers() const noexcept
{
    return _defaultEnginePowers;
}

const LowLoadAdjustmentConfigs& EmissionConfiguration::low_load_adjustment_factors() const noexcept
{
    return _lowLoadAdjustmentFactors;
}

const VesselInfoGuesser& EmissionConfiguration::vessel_info_guesser() const noexcept
{
    return _guesser;
}

std::vector<std::string> EmissionConfiguration::pollutant_names() const
{
    std::vector<std::string> result;
    result.reserve(_pollutants.size());
    for (const auto& [pollutant, configs] : _pollutants) {
        result.push_back(pollutant);
    }

    return result;
}

PollutantFactors EmissionConfiguration::emission_factors(const Attributes& context) const
{
    PollutantFactors result;

    for (const auto& [pollutant, configs] : _pollutants) {
        const auto* entry = resolve_entry<AttributeValue>(configs, context, configkey::BaseValueName);
        if (entry == nullptr) {
            Log::debug("Pollutant {} does not apply to {}", pollutant, to_string(context));
            continue;
        }

        const auto baseValueName = std::string(*as_text(*entry->find(configkey::BaseValueName)));
        double multiplier        = 1.0;
        double offset            = 0.0;
        if (const auto* value = entry->find(configkey::Multiplier); value != nullptr) {
            multiplier = *as_number(*value);
        }

        if (const auto* value = entry->find(configkey::OffsetGPerKwh); value != nullptr) {
            offset = *as_number(*value);
        }

        const auto& baseValues = find_in_map_required(_baseValues, baseValueName);
        const auto resolved    = resolve_required(baseValues, context, {configkey::GramsPerKwh}, fmt::format("base_values.{}", baseValueName));
        const auto gramsPerKwh = *as_number(resolved.begin()->second);

        result.emplace(pollutant, offset + multiplier * gramsPerKwh);
    }

    return result;
}

double EmissionConfiguration::engine_power(const VesselInfo& vessel, EngineGroup group, Mode mode) const
{
    if (group == EngineGroup::Propulsion) {
        throw ValidationError("No default engine power available for the propulsion engines");
    }

    auto context = vessel.to_attributes();
    context.insert_or_assign(std::string(attribute::EngineGroup), std::string(enum_to_string(group)));

    const auto resolved = resolve_required(_defaultEnginePowers, context, {enum_to_string(mode)}, "default_engine_powers");
    return *as_number(resolved.begin()->second);
}

LoadRangeFactors EmissionConfiguration::low_load_range_factors(const VesselInfo& vessel) const
{
    const auto context = vessel.to_attributes();
    if (const auto* entry = resolve_entry<LoadRangeFactors>(_lowLoadAdjustmentFactors, context, configkey::RangeFactors); entry != nullptr) {
        return *entry->find(configkey::RangeFactors);
    }

    return {};
}

EmissionProfile EmissionConfiguration::profile_for(const VesselInfo& vessel, Mode mode) const
{
    std::array<PollutantFactors, enum_count<EngineGroup>()> factors;

    auto context = vessel.to_attributes();
    for (auto group : {EngineGroup::Propulsion, EngineGroup::Auxiliary, EngineGroup::Boiler}) {
        context.insert_or_assign(std::string(attribute::EngineGroup), std::string(enum_to_string(group)));
        factors[enum_value(group)] = emission_factors(context);
    }

    return EmissionProfile(std::move(factors),
                           engine_power(vessel, EngineGroup::Auxiliary, mode),
                           engine_power(vessel, EngineGroup::Boiler, mode),
                           low_load_range_factors(vessel));
}

Attributes EmissionConfiguration::guess_missing_vessel_info(const Attributes& known) const
{
    return _guesser.guess_missing(known);
}

VesselInfo EmissionConfiguration::guess_vessel_info(const Attributes& known) const
{
    return _guesser.guess_vessel_info(known);
}

const VesselInfo& EmissionConfiguration::default_vessel_info() const noexcept
{
    return _guesser.default_vessel_info();
}

}
