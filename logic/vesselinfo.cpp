#include "shipem/vesselinfo.h"
#include "shipem/exceptions.h"

#include "enuminfo.h"
#include "infra/algo.h"
#include "infra/cast.h"
#include "infra/enumutils.h"

#include <algorithm>
#include <array>
#include <cmath>

namespace shipem {

using namespace inf;

static const std::array<EnumInfo<EngineCategory>, enum_count<EngineCategory>()> s_engineCategories{{
    {EngineCategory::C1, "c1", "Category 1 engine (displacement < 5 l/cylinder)"},
    {EngineCategory::C2, "c2", "Category 2 engine (5 to 30 l/cylinder)"},
    {EngineCategory::C3, "c3", "Category 3 engine (displacement >= 30 l/cylinder)"},
}};

static const std::array<EnumInfo<EngineGroup>, enum_count<EngineGroup>()> s_engineGroups{{
    {EngineGroup::Propulsion, "propulsion", "Main propulsion engines"},
    {EngineGroup::Auxiliary, "auxiliary", "Auxiliary engines"},
    {EngineGroup::Boiler, "boiler", "Auxiliary boilers"},
}};

static const std::array<MultiEnumInfo<Mode>, enum_count<Mode>()> s_modes{{
    {Mode::Transit, {"transit"}, "Sailing at sea"},
    {Mode::Maneuvering, {"maneuvering", "manoeuvring"}, "Sailing in or near the port"},
    {Mode::Hotelling, {"hotelling"}, "Moored at berth"},
    {Mode::Anchorage, {"anchorage"}, "At anchor"},
}};

struct ShipTypeInfo
{
    std::string_view name;
    std::vector<std::string_view> sizeUnits;
};

static const std::vector<ShipTypeInfo> s_shipTypes{
    {"barge", {"n/a"}},
    {"crew_supply", {"n/a"}},
    {"excursion", {"n/a"}},
    {"fishing", {"n/a"}},
    {"towboat_pushboat", {"n/a"}},
    {"dredging", {"n/a"}},
    {"sailing", {"n/a"}},
    {"recreational", {"n/a"}},
    {"pilot", {"n/a"}},
    {"tug", {"n/a"}},
    {"workboat", {"n/a"}},
    {"government", {"n/a"}},
    {"bulk_carrier", {"dwt"}},
    {"chemical_tanker", {"dwt"}},
    {"container_ship", {"teu"}},
    {"cruise", {"gt"}},
    {"ferry_passenger", {"gt", "n/a"}},
    {"ferry_roro_passenger", {"gt"}},
    {"general_cargo", {"dwt"}},
    {"liquified_gas_tanker", {"dwt"}},
    {"offshort_support_drillship", {"n/a"}},
    {"oil_tanker", {"dwt"}},
    {"other_service", {"n/a"}},
    {"other_tanker", {"n/a"}},
    {"reefer", {"n/a"}},
    {"roro", {"gt"}},
    {"vehicle_carrier", {"number_vehicles"}},
    {"misc", {"n/a"}},
};

static const std::array<std::string_view, 8> s_vesselInfoAttributes{{
    attribute::MaxSpeed,
    attribute::EngineKw,
    attribute::EngineRpm,
    attribute::EngineCategory,
    attribute::EngineNOxTier,
    attribute::ShipType,
    attribute::Size,
    attribute::SizeUnit,
}};

std::string_view enum_to_string(EngineCategory category) noexcept
{
    return s_engineCategories[enum_value(category)].serializedName;
}

std::string_view enum_to_string(EngineGroup group) noexcept
{
    return s_engineGroups[enum_value(group)].serializedName;
}

std::string_view enum_to_string(Mode mode) noexcept
{
    return s_modes[enum_value(mode)].serialized_name();
}

int32_t enum_to_number(EngineNOxTier tier) noexcept
{
    return enum_value(tier);
}

EngineCategory engine_category_from_string(std::string_view str)
{
    if (auto category = enum_from_serialized_name<EngineCategory>(s_engineCategories, str); category.has_value()) {
        return *category;
    }

    throw ValidationError("Invalid engine category: '{}' (expected c1, c2 or c3)", str);
}

EngineGroup engine_group_from_string(std::string_view str)
{
    if (auto group = enum_from_serialized_name<EngineGroup>(s_engineGroups, str); group.has_value()) {
        return *group;
    }

    throw ValidationError("Invalid engine group: '{}' (expected propulsion, auxiliary or boiler)", str);
}

Mode mode_from_string(std::string_view str)
{
    if (auto mode = enum_from_serialized_name<Mode>(s_modes, str); mode.has_value()) {
        return *mode;
    }

    throw ValidationError("Invalid mode: '{}' (expected transit, maneuvering, hotelling or anchorage)", str);
}

EngineNOxTier engine_nox_tier_from_number(double number)
{
    if (std::trunc(number) != number || number < 0 || number >= enum_count<EngineNOxTier>()) {
        throw ValidationError("Invalid engine NOx tier: '{}' (expected 0, 1, 2 or 3)", number);
    }

    return static_cast<EngineNOxTier>(truncate<int32_t>(number));
}

std::vector<std::string_view> ship_types()
{
    std::vector<std::string_view> result;
    result.reserve(s_shipTypes.size());
    for (const auto& info : s_shipTypes) {
        result.push_back(info.name);
    }

    return result;
}

std::span<const std::string_view> valid_size_units(std::string_view shipType)
{
    const auto* info = find_in_container(s_shipTypes, [shipType](const ShipTypeInfo& info) {
        return info.name == shipType;
    });

    if (info == nullptr) {
        throw ValidationError("Invalid ship type: '{}'", shipType);
    }

    return info->sizeUnits;
}

bool is_valid_ship_type(std::string_view shipType) noexcept
{
    return std::any_of(s_shipTypes.begin(), s_shipTypes.end(), [shipType](const ShipTypeInfo& info) {
        return info.name == shipType;
    });
}

bool is_valid_size_unit(std::string_view sizeUnit) noexcept
{
    return std::any_of(s_shipTypes.begin(), s_shipTypes.end(), [sizeUnit](const ShipTypeInfo& info) {
        return std::find(info.sizeUnits.begin(), info.sizeUnits.end(), sizeUnit) != info.sizeUnits.end();
    });
}

bool is_valid_size_unit_for_ship_type(std::string_view shipType, std::string_view sizeUnit) noexcept
{
    const auto* info = find_in_container(s_shipTypes, [shipType](const ShipTypeInfo& info) {
        return info.name == shipType;
    });

    return info != nullptr && std::find(info->sizeUnits.begin(), info->sizeUnits.end(), sizeUnit) != info->sizeUnits.end();
}

std::span<const std::string_view> vessel_info_attribute_names() noexcept
{
    return s_vesselInfoAttributes;
}

VesselInfo::VesselInfo(double maxSpeed,
                       double engineKw,
                       double engineRpm,
                       EngineCategory category,
                       EngineNOxTier noxTier,
                       std::string_view shipType,
                       double size,
                       std::string_view sizeUnit)
: _maxSpeed(maxSpeed)
, _engineKw(engineKw)
, _engineRpm(engineRpm)
, _category(category)
, _noxTier(noxTier)
, _shipType(shipType)
, _size(size)
, _sizeUnit(sizeUnit)
{
    if (!(maxSpeed > 0)) {
        throw ValidationError("Invalid vessel max_speed: {} (must be positive)", maxSpeed);
    }

    if (!(engineKw > 0)) {
        throw ValidationError("Invalid vessel engine_kw: {} (must be positive)", engineKw);
    }

    if (!(engineRpm > 0)) {
        throw ValidationError("Invalid vessel engine_rpm: {} (must be positive)", engineRpm);
    }

    if (!(size >= 0)) {
        throw ValidationError("Invalid vessel size: {} (must not be negative)", size);
    }

    if (!is_valid_ship_type(shipType)) {
        throw ValidationError("Invalid ship type: '{}'", shipType);
    }

    if (!is_valid_size_unit_for_ship_type(shipType, sizeUnit)) {
        throw ValidationError("'{}' is not a valid size unit for ship type '{}'", sizeUnit, shipType);
    }
}

static double required_number(const Attributes& attrs, std::string_view name)
{
    auto iter = attrs.find(name);
    if (iter == attrs.end()) {
        throw ValidationError("Missing vessel attribute '{}'", name);
    }

    if (auto number = as_number(iter->second); number.has_value()) {
        return *number;
    }

    throw ValidationError("Vessel attribute '{}' should be a number ({})", name, iter->second);
}

static std::string_view required_text(const Attributes& attrs, std::string_view name)
{
    auto iter = attrs.find(name);
    if (iter == attrs.end()) {
        throw ValidationError("Missing vessel attribute '{}'", name);
    }

    if (auto text = as_text(iter->second); text.has_value()) {
        return *text;
    }

    throw ValidationError("Vessel attribute '{}' should be text ({})", name, iter->second);
}

VesselInfo VesselInfo::from_attributes(const Attributes& attrs)
{
    return VesselInfo(required_number(attrs, attribute::MaxSpeed),
                      required_number(attrs, attribute::EngineKw),
                      required_number(attrs, attribute::EngineRpm),
                      engine_category_from_string(required_text(attrs, attribute::EngineCategory)),
                      engine_nox_tier_from_number(required_number(attrs, attribute::EngineNOxTier)),
                      required_text(attrs, attribute::ShipType),
                      required_number(attrs, attribute::Size),
                      required_text(attrs, attribute::SizeUnit));
}

double VesselInfo::max_speed() const noexcept
{
    return _maxSpeed;
}

double VesselInfo::engine_kw() const noexcept
{
    return _engineKw;
}

double VesselInfo::engine_rpm() const noexcept
{
    return _engineRpm;
}

EngineCategory VesselInfo::engine_category() const noexcept
{
    return _category;
}

EngineNOxTier VesselInfo::engine_nox_tier() const noexcept
{
    return _noxTier;
}

const std::string& VesselInfo::ship_type() const noexcept
{
    return _shipType;
}

double VesselInfo::size() const noexcept
{
    return _size;
}

const std::string& VesselInfo::size_unit() const noexcept
{
    return _sizeUnit;
}

Attributes VesselInfo::to_attributes() const
{
    Attributes result;
    result.emplace(attribute::MaxSpeed, _maxSpeed);
    result.emplace(attribute::EngineKw, _engineKw);
    result.emplace(attribute::EngineRpm, _engineRpm);
    result.emplace(attribute::EngineCategory, std::string(enum_to_string(_category)));
    result.emplace(attribute::EngineNOxTier, static_cast<double>(enum_to_number(_noxTier)));
    result.emplace(attribute::ShipType, _shipType);
    result.emplace(attribute::Size, _size);
    result.emplace(attribute::SizeUnit, _sizeUnit);
    return result;
}

bool VesselInfo::operator==(const VesselInfo& other) const noexcept
{
    return _maxSpeed == other._maxSpeed &&
           _engineKw == other._engineKw &&
           _engineRpm == other._engineRpm &&
           _category == other._category &&
           _noxTier == other._noxTier &&
           _shipType == other._shipType &&
           _size == other._size &&
           _sizeUnit == other._sizeUnit;
}

}
