#pragma once

#include "shipem/attributes.h"
#include "infra/span.h"

#include <cstdint>
#include <fmt/core.h>
#include <string>
#include <string_view>
#include <vector>

namespace shipem {

enum class EngineCategory
{
    C1,
    C2,
    C3,
    EnumCount,
};

enum class EngineNOxTier
{
    Tier0,
    Tier1,
    Tier2,
    Tier3,
    EnumCount,
};

enum class EngineGroup
{
    Propulsion,
    Auxiliary,
    Boiler,
    EnumCount,
};

// Operating mode of a vessel
enum class Mode
{
    Transit,
    Maneuvering,
    Hotelling,
    Anchorage,
    EnumCount,
};

std::string_view enum_to_string(EngineCategory category) noexcept;
std::string_view enum_to_string(EngineGroup group) noexcept;
std::string_view enum_to_string(Mode mode) noexcept;
int32_t enum_to_number(EngineNOxTier tier) noexcept;

EngineCategory engine_category_from_string(std::string_view str);
EngineGroup engine_group_from_string(std::string_view str);
Mode mode_from_string(std::string_view str);
EngineNOxTier engine_nox_tier_from_number(double number);

// Ship types and the size units that are valid for them
std::vector<std::string_view> ship_types();
std::span<const std::string_view> valid_size_units(std::string_view shipType);
bool is_valid_ship_type(std::string_view shipType) noexcept;
bool is_valid_size_unit(std::string_view sizeUnit) noexcept;
bool is_valid_size_unit_for_ship_type(std::string_view shipType, std::string_view sizeUnit) noexcept;

namespace attribute {
inline constexpr std::string_view MaxSpeed       = "max_speed";
inline constexpr std::string_view EngineKw       = "engine_kw";
inline constexpr std::string_view EngineRpm      = "engine_rpm";
inline constexpr std::string_view EngineCategory = "engine_category";
inline constexpr std::string_view EngineNOxTier  = "engine_nox_tier";
inline constexpr std::string_view ShipType       = "ship_type";
inline constexpr std::string_view Size           = "size";
inline constexpr std::string_view SizeUnit       = "size_unit";
inline constexpr std::string_view EngineGroup    = "engine_group";
inline constexpr std::string_view KeelLaidYear   = "keel_laid_year";
inline constexpr std::string_view YearOfBuild    = "year_of_build";
inline constexpr std::string_view AisType        = "ais_type";
inline constexpr std::string_view Length         = "length";
inline constexpr std::string_view Width          = "width";
}

// The attribute names that make up a complete VesselInfo
std::span<const std::string_view> vessel_info_attribute_names() noexcept;

/* Complete description of a vessel, as needed to calculate its emissions
 * Values are validated on construction (ValidationError) */
class VesselInfo
{
public:
    VesselInfo(double maxSpeed,
               double engineKw,
               double engineRpm,
               EngineCategory category,
               EngineNOxTier noxTier,
               std::string_view shipType,
               double size,
               std::string_view sizeUnit);

    // Throws a ValidationError when an attribute is missing or invalid
    static VesselInfo from_attributes(const Attributes& attrs);

    double max_speed() const noexcept;
    double engine_kw() const noexcept;
    double engine_rpm() const noexcept;
    EngineCategory engine_category() const noexcept;
    EngineNOxTier engine_nox_tier() const noexcept;
    const std::string& ship_type() const noexcept;
    double size() const noexcept;
    const std::string& size_unit() const noexcept;

    // The vessel as resolution context: categories as text, tier as number
    Attributes to_attributes() const;

    bool operator==(const VesselInfo& other) const noexcept;

private:
    double _maxSpeed;
    double _engineKw;
    double _engineRpm;
    EngineCategory _category;
    EngineNOxTier _noxTier;
    std::string _shipType;
    double _size;
    std::string _sizeUnit;
};

}

template <>
struct fmt::formatter<shipem::VesselInfo>
{
    FMT_CONSTEXPR20 auto parse(format_parse_context& ctx) -> format_parse_context::iterator
    {
        return ctx.begin();
    }

    auto format(const shipem::VesselInfo& val, format_context& ctx) const -> format_context::iterator
    {
        return fmt::format_to(ctx.out(), "{} (size {} {}, max speed {} kts, engine {} kW at {} rpm, {} tier {})",
                              val.ship_type(),
                              val.size(),
                              val.size_unit(),
                              val.max_speed(),
                              val.engine_kw(),
                              val.engine_rpm(),
                              shipem::enum_to_string(val.engine_category()),
                              shipem::enum_to_number(val.engine_nox_tier()));
    }
};

template <>
struct fmt::formatter<shipem::Mode>
{
    FMT_CONSTEXPR20 auto parse(format_parse_context& ctx) -> format_parse_context::iterator
    {
        return ctx.begin();
    }

    auto format(shipem::Mode val, format_context& ctx) const -> format_context::iterator
    {
        return fmt::format_to(ctx.out(), "{}", shipem::enum_to_string(val));
    }
};

template <>
struct fmt::formatter<shipem::EngineGroup>
{
    FMT_CONSTEXPR20 auto parse(format_parse_context& ctx) -> format_parse_context::iterator
    {
        return ctx.begin();
    }

    auto format(shipem::EngineGroup val, format_context& ctx) const -> format_context::iterator
    {
        return fmt::format_to(ctx.out(), "{}", shipem::enum_to_string(val));
    }
};
