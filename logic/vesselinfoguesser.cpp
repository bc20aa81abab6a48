#include "shipem/vesselinfoguesser.h"
#include "shipem/configresolver.h"
#include "shipem/exceptions.h"

#include "infra/algo.h"
#include "infra/log.h"

#include <algorithm>
#include <set>

namespace shipem {

using namespace inf;

static constexpr std::string_view BuildTimeYears = "build_time_years";

static bool is_vessel_info_attribute(std::string_view name) noexcept
{
    const auto names = vessel_info_attribute_names();
    return std::find(names.begin(), names.end(), name) != names.end();
}

VesselInfoGuesser::VesselInfoGuesser(AttributeMatchConfigs guessData, AttributeMatchConfigs averageBuildTimes)
: _guessData(std::move(guessData))
, _averageBuildTimes(std::move(averageBuildTimes))
{
    validate_guess_data();
    validate_build_times();

    _defaultVesselInfo = guess_vessel_info({});
}

void VesselInfoGuesser::validate_guess_data() const
{
    // placeholder values that get overridden with the data of a rule to check if it is usable
    const Attributes placeholder{
        {std::string(attribute::MaxSpeed), 1.0},
        {std::string(attribute::EngineKw), 1.0},
        {std::string(attribute::EngineRpm), 1.0},
        {std::string(attribute::EngineCategory), std::string("c1")},
        {std::string(attribute::EngineNOxTier), 1.0},
        {std::string(attribute::ShipType), std::string("misc")},
        {std::string(attribute::Size), 0.0},
        {std::string(attribute::SizeUnit), std::string("n/a")},
    };

    std::set<std::string, std::less<>> defaultAttributesSeen;
    std::set<std::string_view> shipTypesWithSize;
    const auto allShipTypes = ship_types();

    for (const auto& config : _guessData) {
        for (const auto& [key, value] : config.data) {
            if (!is_vessel_info_attribute(key)) {
                throw ConfigurationError("Invalid vessel info attribute '{}' in vessel info guess data {}", key, to_string(config.data));
            }
        }

        const auto typeAndSizeCount = config.contains(attribute::ShipType) + config.contains(attribute::Size) + config.contains(attribute::SizeUnit);
        if (typeAndSizeCount != 0 && typeAndSizeCount != 3) {
            throw ConfigurationError("ship_type, size and size_unit must always be specified together in vessel info guess data {}", to_string(config.data));
        }

        try {
            VesselInfo::from_attributes(merged_attributes(config.data, placeholder));
        } catch (const ValidationError& e) {
            throw ConfigurationError("Unable to create vessel info from vessel info guess data {}: {}", to_string(config.data), e.what());
        }

        if (config.criteria.empty()) {
            for (const auto& [key, value] : config.data) {
                defaultAttributesSeen.insert(key);
            }
        }

        if (config.criteria.has_only(attribute::ShipType) && config.contains(attribute::Size)) {
            for (auto shipType : allShipTypes) {
                if (config.criteria.matches({{std::string(attribute::ShipType), std::string(shipType)}})) {
                    shipTypesWithSize.insert(shipType);
                }
            }
        }
    }

    std::vector<std::string_view> missingDefaults;
    for (auto name : vessel_info_attribute_names()) {
        if (defaultAttributesSeen.count(name) == 0) {
            missingDefaults.push_back(name);
        }
    }

    if (!missingDefaults.empty()) {
        throw ConfigurationError("Vessel info attributes {} are not present in a criteria-less vessel info guess entry", str::join(missingDefaults, ", "));
    }

    std::vector<std::string_view> missingSizes;
    for (auto shipType : allShipTypes) {
        if (shipTypesWithSize.count(shipType) == 0) {
            missingSizes.push_back(shipType);
        }
    }

    if (!missingSizes.empty()) {
        throw ConfigurationError("No size and size unit guess entry (with only a ship_type criterion) for ship types {}", str::join(missingSizes, ", "));
    }
}

void VesselInfoGuesser::validate_build_times() const
{
    bool defaultBuildTimeSeen = false;
    for (const auto& config : _averageBuildTimes) {
        if (config.criteria.empty()) {
            defaultBuildTimeSeen = true;
        }

        const auto* buildTime = config.find(BuildTimeYears);
        if (buildTime == nullptr || !is_number(*buildTime)) {
            throw ConfigurationError("build_time_years is not a number in average vessel build times entry {}", to_string(config.data));
        }
    }

    if (!defaultBuildTimeSeen) {
        throw ConfigurationError("No criteria-less average vessel build time entry present");
    }
}

Attributes VesselInfoGuesser::guess_missing(const Attributes& known) const
{
    const auto knownShipType = find_text(known, attribute::ShipType);
    if (!known.count(attribute::ShipType) && (known.count(attribute::Size) || known.count(attribute::SizeUnit))) {
        throw ValidationError("Size specified without a ship type in {}", to_string(known));
    }

    Attributes result;
    std::vector<std::string_view> neededKeys;
    for (auto name : vessel_info_attribute_names()) {
        if (auto iter = known.find(name); iter != known.end()) {
            result.insert(*iter);
        } else {
            neededKeys.push_back(name);
        }
    }

    // size and size unit only make sense for the ship type of the rule that supplies them
    ResolveFilter<AttributeValue> sizeFilter = [&knownShipType](const AttributeMatchConfig& config, std::string_view key, const ResolvedValues<AttributeValue>& collected) {
        if (key != attribute::Size && key != attribute::SizeUnit) {
            return true;
        }

        const auto* configShipType = config.find(attribute::ShipType);
        if (configShipType == nullptr) {
            return false;
        }

        if (knownShipType.has_value()) {
            return attribute_equals(*configShipType, AttributeValue(std::string(*knownShipType)));
        }

        auto collectedShipType = collected.find(attribute::ShipType);
        return collectedShipType == collected.end() || attribute_equals(*configShipType, collectedShipType->second);
    };

    auto guessed = resolve<AttributeValue>(_guessData, known, neededKeys, sizeFilter);
    for (auto& [key, value] : guessed) {
        result.insert_or_assign(key, value);
    }

    if (known.count(attribute::EngineNOxTier) == 0) {
        if (auto tier = improved_nox_tier_guess(known, result); tier.has_value()) {
            result.insert_or_assign(std::string(attribute::EngineNOxTier), static_cast<double>(enum_to_number(*tier)));
        }
    }

    std::vector<std::string_view> missing;
    for (auto name : vessel_info_attribute_names()) {
        if (result.count(name) == 0) {
            missing.push_back(name);
        }
    }

    if (!missing.empty()) {
        throw ConfigurationError("No vessel info guess available for {} (known: {})", str::join(missing, ", "), to_string(known));
    }

    return result;
}

std::optional<EngineNOxTier> VesselInfoGuesser::improved_nox_tier_guess(const Attributes& known, const Attributes& guessed) const
{
    if (find_text(guessed, attribute::EngineCategory) != enum_to_string(EngineCategory::C3)) {
        return {};
    }

    if (known.count(attribute::KeelLaidYear) != 0) {
        return {};
    }

    const auto yearOfBuild = find_number(known, attribute::YearOfBuild);
    if (!yearOfBuild.has_value()) {
        return {};
    }

    // stage 1: derive the keel laid year using everything known or guessed so far
    auto context = merged_attributes(guessed, known);
    context.erase(std::string(attribute::EngineNOxTier));

    const auto keelLaidYear = *yearOfBuild - average_build_time(context);

    // stage 2: guess the tier again with the keel laid year in the context
    context.insert_or_assign(std::string(attribute::KeelLaidYear), keelLaidYear);
    const auto tier = resolve_required(_guessData, context, {attribute::EngineNOxTier}, "vessel_info_guess_data");
    const auto& tierValue = tier.at(std::string(attribute::EngineNOxTier));
    const auto tierNumber = as_number(tierValue);
    if (!tierNumber.has_value()) {
        throw ConfigurationError("Invalid engine_nox_tier guess: {}", tierValue);
    }

    Log::debug("Keel laid year {} derived from year of build {}, NOx tier guess: {}", keelLaidYear, *yearOfBuild, *tierNumber);
    return engine_nox_tier_from_number(*tierNumber);
}

double VesselInfoGuesser::average_build_time(const Attributes& context) const
{
    const auto buildTime = resolve_required(_averageBuildTimes, context, {BuildTimeYears}, "average_vessel_build_times");
    return as_number(buildTime.begin()->second).value();
}

VesselInfo VesselInfoGuesser::guess_vessel_info(const Attributes& known) const
{
    return VesselInfo::from_attributes(guess_missing(known));
}

const VesselInfo& VesselInfoGuesser::default_vessel_info() const noexcept
{
    return *_defaultVesselInfo;
}

const AttributeMatchConfigs& VesselInfoGuesser::guess_data() const noexcept
{
    return _guessData;
}

const AttributeMatchConfigs& VesselInfoGuesser::average_build_times() const noexcept
{
    return _averageBuildTimes;
}

}
