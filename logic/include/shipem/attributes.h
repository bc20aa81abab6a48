#pragma once

#include <fmt/core.h>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace shipem {

// A value of a named attribute: either a number or a piece of text
using AttributeValue = std::variant<double, std::string>;

// Named attribute values used as the context of a rule lookup
using Attributes = std::map<std::string, AttributeValue, std::less<>>;

/* Numbers compare numerically, text compares exactly
 * a number never equals a text value */
bool attribute_equals(const AttributeValue& lhs, const AttributeValue& rhs) noexcept;

bool is_number(const AttributeValue& value) noexcept;
bool is_text(const AttributeValue& value) noexcept;

std::optional<double> as_number(const AttributeValue& value) noexcept;
std::optional<std::string_view> as_text(const AttributeValue& value) noexcept;

std::optional<double> find_number(const Attributes& attrs, std::string_view name) noexcept;
std::optional<std::string_view> find_text(const Attributes& attrs, std::string_view name) noexcept;

// Returns the attributes of lhs extended with the attributes from rhs that are not present in lhs
Attributes merged_attributes(const Attributes& lhs, const Attributes& rhs);

std::string to_string(const AttributeValue& value);
std::string to_string(const Attributes& attrs);

}

template <>
struct fmt::formatter<shipem::AttributeValue>
{
    FMT_CONSTEXPR20 auto parse(format_parse_context& ctx) -> format_parse_context::iterator
    {
        return ctx.begin();
    }

    auto format(const shipem::AttributeValue& val, format_context& ctx) const -> format_context::iterator
    {
        return fmt::format_to(ctx.out(), "{}", shipem::to_string(val));
    }
};
