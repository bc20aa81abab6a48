#include "shipem/configurationparser.h"
#include "shipem/exceptions.h"
#include "shipem/vesselinfoguesser.h"

#include "testconfig.h"

#include <doctest/doctest.h>

namespace shipem::test {

using namespace doctest;

static AttributeValue text(std::string_view value)
{
    return AttributeValue(std::string(value));
}

static const EmissionConfiguration& example_config()
{
    static const auto config = parse_emission_configuration_file(fs::u8path(TEST_DATA_DIR) / "config.toml");
    return config;
}

TEST_CASE("Vessel info guessing with the example configuration")
{
    const auto& config = example_config();

    SUBCASE("nothing known")
    {
        const VesselInfo expected(10, 1000, 1500, EngineCategory::C2, EngineNOxTier::Tier1, "misc", 0, "n/a");
        CHECK(config.guess_vessel_info({}) == expected);
        CHECK(config.default_vessel_info() == expected);
    }

    SUBCASE("container ship by size")
    {
        const auto vessel = config.guess_vessel_info({
            {"ship_type", text("container_ship")},
            {"size", 4000.0},
            {"size_unit", text("teu")},
        });

        CHECK(vessel.max_speed() == 25);
        CHECK(vessel.engine_kw() == 37000);
        CHECK(vessel.engine_rpm() == 100);
        CHECK(vessel.engine_category() == EngineCategory::C3);
        CHECK(vessel.engine_nox_tier() == EngineNOxTier::Tier1);
        CHECK(vessel.ship_type() == "container_ship");
        CHECK(vessel.size() == 4000);
        CHECK(vessel.size_unit() == "teu");
    }

    SUBCASE("nox tier derived from the year of build")
    {
        Attributes known{
            {"ship_type", text("container_ship")},
            {"size", 4000.0},
            {"size_unit", text("teu")},
        };

        // container ships take 2 years to build: keel laid in 2003
        known.insert_or_assign("year_of_build", 2005.0);
        CHECK(config.guess_vessel_info(known).engine_nox_tier() == EngineNOxTier::Tier1);

        // keel laid in 1999
        known.insert_or_assign("year_of_build", 2001.0);
        CHECK(config.guess_vessel_info(known).engine_nox_tier() == EngineNOxTier::Tier0);

        // keel laid in 2000: the lower bound of the range is inclusive
        known.insert_or_assign("year_of_build", 2002.0);
        CHECK(config.guess_vessel_info(known).engine_nox_tier() == EngineNOxTier::Tier1);

        // keel laid in 2014
        known.insert_or_assign("year_of_build", 2016.0);
        CHECK(config.guess_vessel_info(known).engine_nox_tier() == EngineNOxTier::Tier2);

        known.insert_or_assign("year_of_build", 2020.0);
        CHECK(config.guess_vessel_info(known).engine_nox_tier() == EngineNOxTier::Tier3);
    }

    SUBCASE("the build time depends on the guessed ship attributes")
    {
        // the default build time is 1 year: keel laid in 2016
        const auto misc = config.guess_vessel_info({
            {"ship_type", text("misc")},
            {"engine_category", text("c3")},
            {"year_of_build", 2017.0},
        });

        CHECK(misc.engine_nox_tier() == EngineNOxTier::Tier3);

        // container ships take 2 years to build: keel laid in 2015
        const auto container = config.guess_vessel_info({
            {"ship_type", text("container_ship")},
            {"size", 4000.0},
            {"size_unit", text("teu")},
            {"year_of_build", 2017.0},
        });

        CHECK(container.engine_nox_tier() == EngineNOxTier::Tier2);
    }

    SUBCASE("a known keel laid year is used directly")
    {
        const auto vessel = config.guess_vessel_info({
            {"ship_type", text("container_ship")},
            {"size", 4000.0},
            {"size_unit", text("teu")},
            {"keel_laid_year", 2012.0},
            {"year_of_build", 2001.0},
        });

        CHECK(vessel.engine_nox_tier() == EngineNOxTier::Tier2);
    }

    SUBCASE("a known nox tier is never replaced")
    {
        const auto vessel = config.guess_vessel_info({
            {"ship_type", text("container_ship")},
            {"size", 4000.0},
            {"size_unit", text("teu")},
            {"engine_nox_tier", 3.0},
            {"year_of_build", 2001.0},
        });

        CHECK(vessel.engine_nox_tier() == EngineNOxTier::Tier3);
    }

    SUBCASE("no tier derivation for other engine categories")
    {
        const auto vessel = config.guess_vessel_info({
            {"ship_type", text("misc")},
            {"year_of_build", 1990.0},
        });

        CHECK(vessel.engine_category() == EngineCategory::C2);
        CHECK(vessel.engine_nox_tier() == EngineNOxTier::Tier1);
    }

    SUBCASE("size guessed from the ship type")
    {
        const auto vessel = config.guess_vessel_info({{"ship_type", text("container_ship")}});
        CHECK(vessel.ship_type() == "container_ship");
        CHECK(vessel.size() == 2500);
        CHECK(vessel.size_unit() == "teu");

        const auto cruise = config.guess_vessel_info({{"ship_type", text("cruise")}});
        CHECK(cruise.size() == 500);
        CHECK(cruise.size_unit() == "gt");
    }

    SUBCASE("size is not taken from a rule for another ship type")
    {
        // the matching rule supplies the size of a bulk carrier, the fallback the size of misc
        CHECK_THROWS_AS(config.guess_vessel_info({{"ship_type", text("oil_tanker")}}), ConfigurationError);
    }

    SUBCASE("known values are kept")
    {
        const auto guessed = config.guess_missing_vessel_info({
            {"ship_type", text("container_ship")},
            {"size", 4000.0},
            {"size_unit", text("teu")},
            {"max_speed", 30.0},
        });

        CHECK(find_number(guessed, "max_speed") == 30.0);
        CHECK(find_number(guessed, "engine_kw") == 37000.0);
        CHECK(guessed.size() == vessel_info_attribute_names().size());
    }

    SUBCASE("guessing a complete vessel changes nothing")
    {
        const VesselInfo vessel(14, 3200, 750, EngineCategory::C2, EngineNOxTier::Tier2, "tug", 0, "n/a");
        CHECK(config.guess_vessel_info(vessel.to_attributes()) == vessel);

        const VesselInfo container(19.5, 12000, 90, EngineCategory::C3, EngineNOxTier::Tier0, "container_ship", 2200, "teu");
        auto known = container.to_attributes();
        known.emplace("year_of_build", 2020.0);
        CHECK(config.guess_vessel_info(known) == container);
    }

    SUBCASE("size without ship type")
    {
        CHECK_THROWS_AS(config.guess_vessel_info({{"size", 4000.0}}), ValidationError);
        CHECK_THROWS_AS(config.guess_vessel_info({{"size_unit", text("teu")}}), ValidationError);
    }

    SUBCASE("invalid known values")
    {
        CHECK_THROWS_AS(config.guess_vessel_info({{"ship_type", text("submarine")}}), ConfigurationError);
        CHECK_THROWS_AS(config.guess_vessel_info({{"max_speed", -5.0}}), ValidationError);
    }
}

static AttributeMatchConfig rule(std::string_view criteria, AttributeMatchConfig::Data data)
{
    return AttributeMatchConfig(parse_match_criteria(criteria), std::move(data));
}

static AttributeMatchConfig size_rule_for_all_ship_types()
{
    std::vector<Criterion::Member> members;
    for (auto shipType : ship_types()) {
        members.emplace_back(text(shipType));
    }

    MatchCriteria criteria;
    criteria.add("ship_type", Criterion::any_of(std::move(members)));
    return AttributeMatchConfig(std::move(criteria), {{"ship_type", text("misc")}, {"size", 0.0}, {"size_unit", text("n/a")}});
}

static AttributeMatchConfig::Data default_guess_data()
{
    return {
        {"max_speed", 10.0},
        {"engine_kw", 1000.0},
        {"engine_rpm", 1500.0},
        {"engine_category", text("c2")},
        {"engine_nox_tier", 1.0},
        {"ship_type", text("misc")},
        {"size", 0.0},
        {"size_unit", text("n/a")},
    };
}

TEST_CASE("Vessel info guess data validation")
{
    const AttributeMatchConfigs buildTimes{rule("{}", {{"build_time_years", 1.0}})};

    SUBCASE("valid")
    {
        VesselInfoGuesser guesser({size_rule_for_all_ship_types(), rule("{}", default_guess_data())}, buildTimes);
        CHECK(guesser.default_vessel_info().ship_type() == "misc");
    }

    SUBCASE("the defaults may be spread over multiple rules")
    {
        auto defaults = default_guess_data();
        defaults.erase("max_speed");

        VesselInfoGuesser guesser({size_rule_for_all_ship_types(), rule("{}", defaults), rule("{}", {{"max_speed", 8.0}})}, buildTimes);
        CHECK(guesser.default_vessel_info().max_speed() == 8.0);
    }

    SUBCASE("missing default")
    {
        auto defaults = default_guess_data();
        defaults.erase("engine_rpm");
        CHECK_THROWS_AS(VesselInfoGuesser({size_rule_for_all_ship_types(), rule("{}", defaults)}, buildTimes), ConfigurationError);
    }

    SUBCASE("ship type without size")
    {
        CHECK_THROWS_AS(VesselInfoGuesser({size_rule_for_all_ship_types(), rule(R"({ size = { ge = 0, lt = 10 } })", {{"ship_type", text("tug")}}), rule("{}", default_guess_data())}, buildTimes), ConfigurationError);
    }

    SUBCASE("size unit that does not fit the ship type")
    {
        CHECK_THROWS_AS(VesselInfoGuesser({size_rule_for_all_ship_types(), rule("{}", {{"ship_type", text("tug")}, {"size", 0.0}, {"size_unit", text("teu")}}), rule("{}", default_guess_data())}, buildTimes), ConfigurationError);
    }

    SUBCASE("unknown attribute")
    {
        CHECK_THROWS_AS(VesselInfoGuesser({size_rule_for_all_ship_types(), rule("{}", {{"color", text("red")}}), rule("{}", default_guess_data())}, buildTimes), ConfigurationError);
    }

    SUBCASE("invalid value")
    {
        CHECK_THROWS_AS(VesselInfoGuesser({size_rule_for_all_ship_types(), rule("{}", {{"engine_category", text("c9")}}), rule("{}", default_guess_data())}, buildTimes), ConfigurationError);
    }

    SUBCASE("ship type without size rule")
    {
        CHECK_THROWS_AS(VesselInfoGuesser({rule(R"({ ship_type = "misc" })", {{"ship_type", text("misc")}, {"size", 0.0}, {"size_unit", text("n/a")}}), rule("{}", default_guess_data())}, buildTimes), ConfigurationError);
    }

    SUBCASE("build times")
    {
        const AttributeMatchConfigs guessData{size_rule_for_all_ship_types(), rule("{}", default_guess_data())};
        CHECK_THROWS_AS(VesselInfoGuesser(guessData, {rule(R"({ ship_type = "tug" })", {{"build_time_years", 1.0}})}), ConfigurationError);
        CHECK_THROWS_AS(VesselInfoGuesser(guessData, {rule("{}", {{"build_time_years", text("one")}})}), ConfigurationError);
    }
}

}
