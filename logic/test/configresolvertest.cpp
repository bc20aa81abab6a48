#include "shipem/configresolver.h"
#include "shipem/configurationparser.h"

#include <array>
#include <doctest/doctest.h>

namespace shipem::test {

using namespace doctest;

static AttributeMatchConfig rule(std::string_view criteria, AttributeMatchConfig::Data data)
{
    return AttributeMatchConfig(parse_match_criteria(criteria), std::move(data));
}

static AttributeValue text(std::string_view value)
{
    return AttributeValue(std::string(value));
}

TEST_CASE("Config resolver")
{
    const AttributeMatchConfigs configs{
        rule(R"({ ship_type = "container_ship", size = { ge = 2000, lt = 3000 } })", {{"max_speed", 23.0}, {"engine_kw", 21800.0}}),
        rule(R"({ ship_type = "container_ship" })", {{"max_speed", 20.0}, {"engine_rpm", 100.0}}),
        rule(R"({ ship_type = { any_of = ["tug", "pilot"] } })", {{"max_speed", 12.0}}),
        rule("{}", {{"max_speed", 10.0}, {"engine_kw", 1000.0}, {"engine_rpm", 1500.0}}),
        rule(R"({ ship_type = "tug" })", {{"engine_kw", 5000.0}}),
    };

    SUBCASE("first match wins per key")
    {
        const Attributes context{{"ship_type", text("container_ship")}, {"size", 2500.0}};
        const auto result = resolve(configs, context, {"max_speed", "engine_kw", "engine_rpm"});

        REQUIRE(result.size() == 3);
        CHECK(result.at("max_speed") == AttributeValue(23.0));
        CHECK(result.at("engine_kw") == AttributeValue(21800.0));
        CHECK(result.at("engine_rpm") == AttributeValue(100.0));
    }

    SUBCASE("keys are accumulated over multiple matching rules")
    {
        const Attributes context{{"ship_type", text("container_ship")}, {"size", 3000.0}};
        const auto result = resolve(configs, context, {"max_speed", "engine_kw", "engine_rpm"});

        CHECK(result.at("max_speed") == AttributeValue(20.0));
        CHECK(result.at("engine_rpm") == AttributeValue(100.0));
        CHECK(result.at("engine_kw") == AttributeValue(1000.0));
    }

    SUBCASE("the fallback precedes later more specific rules")
    {
        const Attributes context{{"ship_type", text("tug")}};
        const auto result = resolve(configs, context, {"max_speed", "engine_kw"});

        CHECK(result.at("max_speed") == AttributeValue(12.0));
        CHECK(result.at("engine_kw") == AttributeValue(1000.0));
    }

    SUBCASE("empty context only matches the fallback")
    {
        const auto result = resolve(configs, {}, {"max_speed"});
        CHECK(result.at("max_speed") == AttributeValue(10.0));
    }

    SUBCASE("only the needed keys are resolved")
    {
        const auto result = resolve(configs, {{"ship_type", text("container_ship")}}, {"engine_rpm"});
        CHECK(result.size() == 1);
        CHECK(result.count("max_speed") == 0);

        CHECK(resolve(configs, {}, {}).empty());
    }

    SUBCASE("keys without a matching rule are absent")
    {
        const auto result = resolve(configs, {}, {"max_speed", "engine_category"});
        CHECK(result.size() == 1);
        CHECK(result.count("engine_category") == 0);
    }

    SUBCASE("resolve required")
    {
        CHECK(resolve_required(configs, {}, {"max_speed"}, "test").at("max_speed") == AttributeValue(10.0));
        CHECK_THROWS_AS(resolve_required(configs, {}, {"max_speed", "engine_category"}, "test"), ConfigurationError);
    }

    SUBCASE("filter rejects values")
    {
        ResolveFilter<AttributeValue> noFallback = [](const AttributeMatchConfig& config, std::string_view, const ResolvedValues<AttributeValue>&) {
            return !config.criteria.empty();
        };

        const Attributes context{{"ship_type", text("tug")}};
        const auto keys   = std::array<std::string_view, 2>{"max_speed", "engine_kw"};
        const auto result = resolve<AttributeValue>(configs, context, keys, noFallback);

        CHECK(result.at("max_speed") == AttributeValue(12.0));
        CHECK(result.at("engine_kw") == AttributeValue(5000.0));
    }

    SUBCASE("resolve entry")
    {
        const Attributes context{{"ship_type", text("container_ship")}, {"size", 5000.0}};
        const auto* entry = resolve_entry<AttributeValue>(configs, context, "engine_rpm");
        REQUIRE(entry != nullptr);
        CHECK(entry == &configs[1]);

        CHECK(resolve_entry<AttributeValue>(configs, context, "engine_category") == nullptr);
    }
}

}
