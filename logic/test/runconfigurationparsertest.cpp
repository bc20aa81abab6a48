#include "shipem/exceptions.h"
#include "shipem/runconfigurationparser.h"
#include "infra/exception.h"

#include "testconfig.h"

#include <doctest/doctest.h>

namespace shipem::test {

using namespace inf;
using namespace doctest;
using namespace std::chrono_literals;

static constexpr std::string_view s_validConfig = R"toml(
    [model]
        emission_config = "config.toml"
        max_sog = 30
        max_implied_speed = 40
        max_distance_deviation = 0.2
        max_duration_increase_factor = 9

    [output]
        path = "/temp"

    [[vessel]]
        name = "Northern Star"
        attributes = { ship_type = "container_ship", size = 4000, size_unit = "teu", year_of_build = 2001 }

        [[vessel.track]]
            path = "positions.csv"
            mode = "transit"

        [[vessel.track]]
            path = "/data/harbour.csv"
            mode = "manoeuvring"

        [[vessel.mooring]]
            hours = 20
            mode = "hotelling"

    [[vessel]]
        name = "Unknown"

        [[vessel.mooring]]
            hours = 1.5
            mode = "anchorage"
)toml";

static std::string config_with(std::string_view from, std::string_view to)
{
    std::string result(s_validConfig);
    const auto pos = result.find(from);
    REQUIRE(pos != std::string::npos);
    result.replace(pos, from.size(), to);
    return result;
}

TEST_CASE("Parse run configuration")
{
    const auto basePath = fs::u8path(TEST_DATA_DIR);

    SUBCASE("valid file")
    {
        const auto config = parse_run_configuration(s_validConfig, basePath);

        CHECK(config.emission_configuration_path() == fs::absolute(basePath / "config.toml"));
        CHECK(config.output_path() == fs::absolute("/temp"));
        CHECK(config.emissions_output_path() == fs::absolute("/temp") / "emissions.csv");
        CHECK(config.run_summary_output_path() == fs::absolute("/temp") / "run_summary.xlsx");
        CHECK(config.log_output_path() == fs::absolute("/temp") / "shipem.log");

        CHECK(config.duration_sanitizer().maxDistanceDeviation == 0.2);
        CHECK(config.duration_sanitizer().maxDurationIncreaseFactor == 9.0);

        CHECK(config.sog_plausibility()(29.9));
        CHECK_FALSE(config.sog_plausibility()(30.0));

        const TimedCoordinate from{Timestamp(0s), 4.0, 51.0};
        CHECK(config.distance_plausibility()(from, TimedCoordinate{Timestamp(1h), 4.0, 51.5}));
        CHECK_FALSE(config.distance_plausibility()(from, TimedCoordinate{Timestamp(1h), 4.0, 52.0}));

        CHECK_FALSE(config.max_concurrency().has_value());

        REQUIRE(config.vessels().size() == 2);

        const auto& vessel = config.vessels()[0];
        CHECK(vessel.name == "Northern Star");
        CHECK(vessel.attributes.size() == 4);
        CHECK(vessel.attributes.at("ship_type") == AttributeValue(std::string("container_ship")));
        CHECK(vessel.attributes.at("size") == AttributeValue(4000.0));

        REQUIRE(vessel.tracks.size() == 2);
        CHECK(vessel.tracks[0].path == fs::absolute(basePath / "positions.csv"));
        CHECK(vessel.tracks[0].mode == Mode::Transit);
        CHECK(vessel.tracks[1].path == fs::u8path("/data/harbour.csv"));
        CHECK(vessel.tracks[1].mode == Mode::Maneuvering);

        REQUIRE(vessel.moorings.size() == 1);
        CHECK(vessel.moorings[0].duration == 20h);
        CHECK(vessel.moorings[0].mode == Mode::Hotelling);

        const auto& unknown = config.vessels()[1];
        CHECK(unknown.name == "Unknown");
        CHECK(unknown.attributes.empty());
        CHECK(unknown.tracks.empty());
        REQUIRE(unknown.moorings.size() == 1);
        CHECK(unknown.moorings[0].duration == 90min);
        CHECK(unknown.moorings[0].mode == Mode::Anchorage);
    }

    SUBCASE("optional model settings")
    {
        constexpr std::string_view tomlConfig = R"toml(
            [model]
                emission_config = "config.toml"

            [output]
                path = "out"

            [[vessel]]
                name = "Tug"
                attributes = { ship_type = "tug" }
                mooring = [ { hours = 0, mode = "hotelling" } ]
        )toml";

        const auto config = parse_run_configuration(tomlConfig, basePath);
        CHECK(config.output_path() == fs::absolute(basePath / "out"));
        CHECK(config.duration_sanitizer().maxDistanceDeviation == 0.25);
        CHECK(config.duration_sanitizer().maxDurationIncreaseFactor == 10.0);
        CHECK(config.sog_plausibility()(1000.0));

        const TimedCoordinate from{Timestamp(0s), 4.0, 51.0};
        CHECK(config.distance_plausibility()(from, TimedCoordinate{Timestamp(0s), 100.0, 51.0}));

        REQUIRE(config.vessels().size() == 1);
        CHECK(config.vessels()[0].moorings[0].duration == 0s);
    }

    SUBCASE("max concurrency")
    {
        auto config = parse_run_configuration(s_validConfig, basePath);
        config.set_max_concurrency(4);
        CHECK(config.max_concurrency() == 4);
    }

    SUBCASE("from file")
    {
        const auto config = parse_run_configuration_file(basePath / "runconfig.toml");
        CHECK(config.emission_configuration_path() == fs::absolute(basePath / "config.toml"));
        CHECK(config.vessels().size() == 3);
    }
}

TEST_CASE("Parse invalid run configuration")
{
    const auto basePath = fs::u8path(TEST_DATA_DIR);

    SUBCASE("missing sections")
    {
        CHECK_THROWS_AS(parse_run_configuration(config_with("[model]", "[models]"), basePath), RuntimeError);
        CHECK_THROWS_AS(parse_run_configuration(config_with("[output]", "[outputs]"), basePath), RuntimeError);
        CHECK_THROWS_AS(parse_run_configuration(config_with("emission_config = \"config.toml\"", ""), basePath), RuntimeError);
        CHECK_THROWS_AS(parse_run_configuration(config_with("path = \"/temp\"", ""), basePath), RuntimeError);
    }

    SUBCASE("no vessels")
    {
        constexpr std::string_view tomlConfig = R"toml(
            [model]
                emission_config = "config.toml"

            [output]
                path = "out"
        )toml";

        CHECK_THROWS_AS(parse_run_configuration(tomlConfig, basePath), RuntimeError);
    }

    SUBCASE("vessel without activities")
    {
        CHECK_THROWS_AS(parse_run_configuration(config_with("[[vessel.mooring]]\n            hours = 1.5\n            mode = \"anchorage\"", ""), basePath), RuntimeError);
    }

    SUBCASE("vessel without name")
    {
        CHECK_THROWS_AS(parse_run_configuration(config_with("name = \"Unknown\"", ""), basePath), RuntimeError);
        CHECK_THROWS_AS(parse_run_configuration(config_with("name = \"Unknown\"", "name = 5"), basePath), RuntimeError);
    }

    SUBCASE("duplicate vessel names")
    {
        CHECK_THROWS_AS(parse_run_configuration(config_with("name = \"Unknown\"", "name = \"Northern Star\""), basePath), RuntimeError);
    }

    SUBCASE("invalid attributes")
    {
        CHECK_THROWS_AS(parse_run_configuration(config_with("year_of_build = 2001", "year_of_build = [2001]"), basePath), RuntimeError);
        CHECK_THROWS_AS(parse_run_configuration(config_with("attributes = { ship_type = \"container_ship\", size = 4000, size_unit = \"teu\", year_of_build = 2001 }", "attributes = 5"), basePath), RuntimeError);
    }

    SUBCASE("invalid mode")
    {
        CHECK_THROWS_AS(parse_run_configuration(config_with("mode = \"transit\"", "mode = \"sailing\""), basePath), ValidationError);
        CHECK_THROWS_AS(parse_run_configuration(config_with("mode = \"transit\"", ""), basePath), RuntimeError);
    }

    SUBCASE("invalid mooring duration")
    {
        CHECK_THROWS_AS(parse_run_configuration(config_with("hours = 20", "hours = -1"), basePath), RuntimeError);
        CHECK_THROWS_AS(parse_run_configuration(config_with("hours = 20", "hours = \"20\""), basePath), RuntimeError);
    }

    SUBCASE("invalid model settings")
    {
        CHECK_THROWS_AS(parse_run_configuration(config_with("max_distance_deviation = 0.2", "max_distance_deviation = 1.0"), basePath), RuntimeError);
        CHECK_THROWS_AS(parse_run_configuration(config_with("max_distance_deviation = 0.2", "max_distance_deviation = -0.1"), basePath), RuntimeError);
        CHECK_THROWS_AS(parse_run_configuration(config_with("max_duration_increase_factor = 9", "max_duration_increase_factor = 0.5"), basePath), RuntimeError);
        CHECK_THROWS_AS(parse_run_configuration(config_with("max_sog = 30", "max_sog = \"fast\""), basePath), RuntimeError);
    }

    SUBCASE("toml syntax error")
    {
        CHECK_THROWS_AS(parse_run_configuration(config_with("[output]", "[output"), basePath), RuntimeError);
    }
}

}
