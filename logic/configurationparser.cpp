#include "shipem/configurationparser.h"
#include "shipem/exceptions.h"

#include "configurationutil.h"
#include "infra/chrono.h"
#include "infra/log.h"

#include <fmt/format.h>

namespace shipem {

using namespace inf;

static constexpr std::string_view s_matchCriteria = "match_criteria";

static std::optional<AttributeValue> node_as_attribute_value(const toml::node& node)
{
    if (auto number = node_as_number(node); number.has_value()) {
        return AttributeValue(*number);
    }

    if (const auto* text = node.as_string(); text != nullptr) {
        return AttributeValue(text->get());
    }

    return {};
}

static Range parse_range(const toml::table& table, std::string_view context)
{
    const auto* ge = table.get("ge");
    const auto* lt = table.get("lt");
    if (ge == nullptr || lt == nullptr || table.size() != 2) {
        throw ValidationError("Invalid range in {}: a range needs exactly a 'ge' and an 'lt' value (e.g. {{ ge = 0, lt = 10 }})", context);
    }

    auto geValue = node_as_number(*ge);
    auto ltValue = node_as_number(*lt);
    if (!geValue.has_value() || !ltValue.has_value()) {
        throw ValidationError("Invalid range in {}: 'ge' and 'lt' should be numbers", context);
    }

    return make_range(*geValue, *ltValue);
}

static Criterion parse_criterion(const toml::node& node, std::string_view name)
{
    if (auto value = node_as_attribute_value(node); value.has_value()) {
        return Criterion::equal_to(std::move(*value));
    }

    const auto* table = node.as_table();
    if (table == nullptr) {
        throw ValidationError("Unsupported match criterion value for '{}' (expected a number, a string, a range or any_of)", name);
    }

    if (const auto* anyOf = table->get("any_of"); anyOf != nullptr) {
        const auto* members = anyOf->as_array();
        if (members == nullptr || table->size() != 1) {
            throw ValidationError("Invalid any_of criterion for '{}' (e.g. {} = {{ any_of = [\"a\", \"b\"] }})", name, name);
        }

        std::vector<Criterion::Member> result;
        for (const auto& member : *members) {
            if (auto value = node_as_attribute_value(member); value.has_value()) {
                result.emplace_back(std::move(*value));
            } else if (const auto* rangeTable = member.as_table(); rangeTable != nullptr) {
                result.emplace_back(parse_range(*rangeTable, name));
            } else {
                throw ValidationError("Unsupported any_of member for '{}' (expected a number, a string or a range)", name);
            }
        }

        return Criterion::any_of(std::move(result));
    }

    const auto range = parse_range(*table, name);
    return Criterion::in_range(range.ge, range.lt);
}

static MatchCriteria parse_criteria_table(const toml::table& table)
{
    MatchCriteria result;
    for (const auto& [key, node] : table) {
        result.add(key.str(), parse_criterion(node, key.str()));
    }

    return result;
}

template <typename TValue, typename TDataParser>
static MatchConfigs<TValue> parse_rules(toml::node_view<const toml::node> node, std::string_view configName, TDataParser&& parseData)
{
    if (!node) {
        throw ConfigurationError("No '{}' rules present in emission configuration", configName);
    }

    const auto* rules = node.as_array();
    if (rules == nullptr) {
        throw ConfigurationError("'{}' should be a list of tables (e.g. [[{}]])", configName, configName);
    }

    MatchConfigs<TValue> result;
    result.reserve(rules->size());

    for (const auto& ruleNode : *rules) {
        const auto* ruleTable = ruleNode.as_table();
        if (ruleTable == nullptr) {
            throw ConfigurationError("'{}' should be a list of tables (e.g. [[{}]])", configName, configName);
        }

        const auto& rule = *ruleTable;

        const auto* criteriaNode = rule.get(s_matchCriteria);
        if (criteriaNode == nullptr || !criteriaNode->is_table()) {
            throw ConfigurationError("No match_criteria table present in '{}' entry (e.g. match_criteria = {{}})", configName);
        }

        MatchConfig<TValue> config;
        config.criteria = parse_criteria_table(*criteriaNode->as_table());

        for (const auto& [key, value] : rule) {
            if (key.str() == s_matchCriteria) {
                continue;
            }

            config.data.emplace(key.str(), parseData(key.str(), value));
        }

        result.push_back(std::move(config));
    }

    return result;
}

static AttributeMatchConfigs parse_attribute_rules(toml::node_view<const toml::node> node, std::string_view configName)
{
    return parse_rules<AttributeValue>(node, configName, [configName](std::string_view key, const toml::node& value) {
        if (auto attr = node_as_attribute_value(value); attr.has_value()) {
            return std::move(*attr);
        }

        throw ConfigurationError("Invalid value for '{}' in '{}' entry (expected a number or a string)", key, configName);
    });
}

static NamedAttributeMatchConfigs parse_named_attribute_rules(const toml::table& table, std::string_view configName)
{
    const auto* section = table.get_as<toml::table>(configName);
    if (section == nullptr) {
        throw ConfigurationError("No '{}' section present in emission configuration", configName);
    }

    NamedAttributeMatchConfigs result;
    for (const auto& [name, rules] : *section) {
        result.emplace(name.str(), parse_attribute_rules(toml::node_view<const toml::node>(&rules), fmt::format("{}.{}", configName, name.str())));
    }

    return result;
}

static LoadRangeFactors parse_range_factors(const toml::node& node)
{
    const auto* entries = node.as_array();
    if (entries == nullptr) {
        throw ConfigurationError("range_factors should be a list (e.g. range_factors = [{{ range = {{ ge = 0, lt = 0.1 }}, factors = {{ co2 = 2 }} }}])");
    }

    LoadRangeFactors result;
    for (const auto& entryNode : *entries) {
        const auto* entry = entryNode.as_table();
        if (entry == nullptr) {
            throw ConfigurationError("range_factors entries should be tables with a range and factors");
        }

        const auto* range   = entry->get_as<toml::table>("range");
        const auto* factors = entry->get_as<toml::table>("factors");
        if (range == nullptr || factors == nullptr) {
            throw ConfigurationError("range_factors entries need a range and factors table");
        }

        LoadRangeFactor rangeFactor;
        rangeFactor.range = parse_range(*range, "range_factors");
        for (const auto& [pollutant, factorNode] : *factors) {
            auto factor = node_as_number(factorNode);
            if (!factor.has_value()) {
                throw ConfigurationError("Low load adjustment factor for '{}' should be a number", pollutant.str());
            }

            rangeFactor.factors.emplace(pollutant.str(), *factor);
        }

        result.push_back(std::move(rangeFactor));
    }

    return result;
}

static LowLoadAdjustmentConfigs parse_low_load_rules(toml::node_view<const toml::node> node)
{
    return parse_rules<LoadRangeFactors>(node, "low_load_adjustment_factors", [](std::string_view key, const toml::node& value) {
        if (key != configkey::RangeFactors) {
            throw ConfigurationError("Unexpected key '{}' in low_load_adjustment_factors entry", key);
        }

        return parse_range_factors(value);
    });
}

static EmissionConfiguration parse_emission_configuration_impl(std::string_view configContents, const fs::path& tomlPath)
{
    chrono::ScopedDurationLog durationLog("Parse emission configuration");

    const toml::table table = parse_toml(configContents, tomlPath, "emission configuration");

    auto seaMargin = table["sea_margin_adjustment_factor"];
    if (!seaMargin) {
        throw ConfigurationError("No sea_margin_adjustment_factor present in emission configuration (e.g. sea_margin_adjustment_factor = 1.1)");
    }

    const auto seaMarginValue = node_as_number(*seaMargin.node());
    if (!seaMarginValue.has_value()) {
        throw ConfigurationError("sea_margin_adjustment_factor should be a number");
    }

    return EmissionConfiguration(*seaMarginValue,
                                 parse_named_attribute_rules(table, "base_values"),
                                 parse_named_attribute_rules(table, "pollutants"),
                                 parse_attribute_rules(table["default_engine_powers"], "default_engine_powers"),
                                 parse_attribute_rules(table["vessel_info_guess_data"], "vessel_info_guess_data"),
                                 parse_attribute_rules(table["average_vessel_build_times"], "average_vessel_build_times"),
                                 parse_low_load_rules(table["low_load_adjustment_factors"]));
}

EmissionConfiguration parse_emission_configuration_file(const fs::path& config)
{
    Log::debug("Loading emission configuration from {}", str::from_u8(config.u8string()));
    return parse_emission_configuration_impl(file::read_as_text(config), config);
}

EmissionConfiguration parse_emission_configuration(std::string_view configContents)
{
    return parse_emission_configuration_impl(configContents, fs::path());
}

MatchCriteria parse_match_criteria(std::string_view tomlInlineTable)
{
    const toml::table table = parse_toml(fmt::format("match_criteria = {}", tomlInlineTable), fs::path(), "match criteria");
    const auto* criteria    = table.get_as<toml::table>(s_matchCriteria);
    if (criteria == nullptr) {
        throw ValidationError("Match criteria should be an inline table (e.g. {{ ship_type = \"tug\" }})");
    }

    return parse_criteria_table(*criteria);
}

}
