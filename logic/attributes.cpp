#include "shipem/attributes.h"

#include "infra/string.h"

#include <fmt/format.h>
#include <vector>

namespace shipem {

using namespace inf;

bool attribute_equals(const AttributeValue& lhs, const AttributeValue& rhs) noexcept
{
    if (lhs.index() != rhs.index()) {
        return false;
    }

    if (const auto* number = std::get_if<double>(&lhs)) {
        return *number == std::get<double>(rhs);
    }

    return std::get<std::string>(lhs) == std::get<std::string>(rhs);
}

bool is_number(const AttributeValue& value) noexcept
{
    return std::holds_alternative<double>(value);
}

bool is_text(const AttributeValue& value) noexcept
{
    return std::holds_alternative<std::string>(value);
}

std::optional<double> as_number(const AttributeValue& value) noexcept
{
    if (const auto* number = std::get_if<double>(&value)) {
        return *number;
    }

    return {};
}

std::optional<std::string_view> as_text(const AttributeValue& value) noexcept
{
    if (const auto* text = std::get_if<std::string>(&value)) {
        return std::string_view(*text);
    }

    return {};
}

std::optional<double> find_number(const Attributes& attrs, std::string_view name) noexcept
{
    if (auto iter = attrs.find(name); iter != attrs.end()) {
        return as_number(iter->second);
    }

    return {};
}

std::optional<std::string_view> find_text(const Attributes& attrs, std::string_view name) noexcept
{
    if (auto iter = attrs.find(name); iter != attrs.end()) {
        return as_text(iter->second);
    }

    return {};
}

Attributes merged_attributes(const Attributes& lhs, const Attributes& rhs)
{
    Attributes result = lhs;
    for (const auto& [name, value] : rhs) {
        result.emplace(name, value);
    }

    return result;
}

std::string to_string(const AttributeValue& value)
{
    if (const auto* number = std::get_if<double>(&value)) {
        return fmt::format("{}", *number);
    }

    return fmt::format("'{}'", std::get<std::string>(value));
}

std::string to_string(const Attributes& attrs)
{
    std::vector<std::string> entries;
    entries.reserve(attrs.size());
    for (const auto& [name, value] : attrs) {
        entries.push_back(fmt::format("{}: {}", name, to_string(value)));
    }

    return fmt::format("{{{}}}", str::join(entries, ", "));
}

}
