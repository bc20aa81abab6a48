#pragma once

#include "infra/exception.h"
#include "infra/filesystem.h"

#include <cassert>
#include <optional>
#include <string>
#include <string_view>
#include <toml++/toml.h>

namespace shipem {

using namespace inf;

struct NamedSection
{
    NamedSection(std::string_view theName, toml::node_view<const toml::node> theSection)
    : name(theName)
    , section(theSection)
    {
    }

    std::string name;
    toml::node_view<const toml::node> section;
};

inline std::optional<double> node_as_number(const toml::node& node) noexcept
{
    if (const auto* intValue = node.as_integer(); intValue != nullptr) {
        return static_cast<double>(intValue->get());
    }

    if (const auto* floatValue = node.as_floating_point(); floatValue != nullptr) {
        return floatValue->get();
    }

    return {};
}

inline fs::path read_path(const NamedSection& ns, std::string_view name, const fs::path& basePath)
{
    assert(ns.section.is_table());
    auto nodeValue = ns.section[name];

    if (!nodeValue) {
        throw RuntimeError("'{0:}' key not present in '{1:}' section (e.g. {0:} = \"/some/path\")", name, ns.name);
    }

    if (auto pathValue = nodeValue.value<std::string_view>(); pathValue.has_value()) {
        auto result = fs::u8path(*pathValue);
        if (result.is_relative()) {
            result = fs::absolute(basePath / result);
        }

        return result;
    } else {
        throw RuntimeError("Invalid path value for '{0:}' key in '{1:}' section (e.g. {0:} = \"/some/path\")", name, ns.name);
    }
}

inline std::string read_string(const NamedSection& ns, std::string_view name)
{
    assert(ns.section.is_table());
    auto nodeValue = ns.section[name];

    if (!nodeValue) {
        throw RuntimeError("'{}' key not present in '{}' section", name, ns.name);
    }

    if (!nodeValue.is_string()) {
        throw RuntimeError("'{0:}' key value in '{1:}' section should be a quoted string (e.g. {0:} = \"value\")", name, ns.name);
    }

    assert(nodeValue.value<std::string>().has_value());
    return nodeValue.value<std::string>().value();
}

inline std::optional<double> read_optional_number(const NamedSection& ns, std::string_view name)
{
    assert(ns.section.is_table());
    auto nodeValue = ns.section[name];

    if (!nodeValue) {
        return {};
    }

    if (auto number = node_as_number(*nodeValue.node()); number.has_value()) {
        return number;
    }

    throw RuntimeError("'{0:}' key value in '{1:}' section should be a number (e.g. {0:} = 1.5)", name, ns.name);
}

inline double read_number(const NamedSection& ns, std::string_view name)
{
    if (auto number = read_optional_number(ns, name); number.has_value()) {
        return *number;
    }

    throw RuntimeError("'{0:}' key not present in '{1:}' section (e.g. {0:} = 1.5)", name, ns.name);
}

inline void throw_on_missing_section(const toml::table& table, std::string_view name)
{
    if (!table.contains(name)) {
        throw RuntimeError("No '{}' section present in configuration", name);
    }
}

// Parses the toml document, parse errors are rethrown with their location
inline toml::table parse_toml(std::string_view contents, const fs::path& tomlPath, std::string_view description)
{
    try {
        return toml::parse(contents, tomlPath.generic_string());
    } catch (const toml::parse_error& e) {
        if (const auto& errorBegin = e.source().begin; errorBegin) {
            throw RuntimeError("Failed to parse {}: {} (line {} column {})", description, e.description(), errorBegin.line, errorBegin.column);
        }

        throw RuntimeError("Failed to parse {}: {}", description, e.description());
    }
}

}
