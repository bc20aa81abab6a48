#include "shipem/modelrun.h"
#include "shipem/runconfigurationparser.h"

#include "infra/string.h"
#include "infra/test/tempdir.h"
#include "testconfig.h"

#include <doctest/doctest.h>
#include <map>

namespace shipem::test {

using namespace inf;
using namespace doctest;

// key: vessel;activity;mode;pollutant
static std::map<std::string, double> read_emissions_output(const fs::path& path)
{
    std::map<std::string, double> result;

    const auto contents = file::read_as_text(path);
    auto lines          = str::split_view(contents, '\n');
    REQUIRE(lines.size() > 2);
    CHECK(str::starts_with(lines[0], "# shipem v"));
    CHECK(lines[1] == "vessel;activity;mode;pollutant;emission_g");

    for (auto iter = lines.begin() + 2; iter != lines.end(); ++iter) {
        if (iter->empty()) {
            continue;
        }

        const auto lastSeparator = iter->rfind(';');
        REQUIRE(lastSeparator != std::string_view::npos);

        const auto value = str::to_double(iter->substr(lastSeparator + 1));
        REQUIRE(value.has_value());
        result.emplace(std::string(iter->substr(0, lastSeparator)), *value);
    }

    return result;
}

static ModelProgress::Callback ignore_progress()
{
    return [](const ModelProgress::Status&) { return ProgressStatusResult::Continue; };
}

TEST_CASE("Model run")
{
    TempDir temp("shipem_model_run");
    const auto outputPath = temp.path() / "output";

    constexpr std::string_view configToml = R"toml(
        [model]
            emission_config = "config.toml"
            max_sog = 30
            max_implied_speed = 40

        [output]
            path = "{}"

        [[vessel]]
            name = "Northern Star"
            attributes = {{ ship_type = "container_ship", size = 4000, size_unit = "teu", year_of_build = 2001 }}

            [[vessel.track]]
                path = "positions.csv"
                mode = "transit"

            [[vessel.mooring]]
                hours = 20
                mode = "hotelling"

        [[vessel]]
            name = "Coastal tanker"
            attributes = {{ ship_type = "oil_tanker" }}

            [[vessel.mooring]]
                hours = 2
                mode = "hotelling"

        [[vessel]]
            name = "Unknown"

            [[vessel.mooring]]
                hours = 1
                mode = "anchorage"
    )toml";

    SUBCASE("emissions per vessel activity")
    {
        const auto cfg = parse_run_configuration(fmt::format(configToml, str::from_u8(outputPath.generic_u8string())), fs::u8path(TEST_DATA_DIR));

        CHECK(run_model(cfg, ignore_progress()) == EXIT_SUCCESS);

        REQUIRE(fs::is_regular_file(cfg.emissions_output_path()));
        CHECK(fs::is_regular_file(cfg.run_summary_output_path()));

        const auto emissions = read_emissions_output(cfg.emissions_output_path());

        // the tanker has no size guess for its ship type, the other vessels are still calculated
        CHECK(emissions.size() == 6);

        CHECK(emissions.at("Northern Star;positions.csv;transit;nox") == Approx(746'869.6));
        CHECK(emissions.at("Northern Star;positions.csv;transit;co2") == Approx(26'652'978.408));
        CHECK(emissions.at("Northern Star;mooring;hotelling;nox") == Approx(277'440.0));
        CHECK(emissions.at("Northern Star;mooring;hotelling;co2") == Approx(21'735'397.6));

        // default vessel: 88 kW auxiliary engine, tier 1
        CHECK(emissions.at("Unknown;mooring;anchorage;nox") == Approx(88 * 12.2));
        CHECK(emissions.at("Unknown;mooring;anchorage;co2") == Approx(88 * 217 * 3.206));
    }

    SUBCASE("existing output is replaced")
    {
        fs::create_directories(outputPath / "rasters");
        file::write_as_text(outputPath / "stale.csv", "old");

        const auto cfg = parse_run_configuration(fmt::format(configToml, str::from_u8(outputPath.generic_u8string())), fs::u8path(TEST_DATA_DIR));
        CHECK(run_model(cfg, ignore_progress()) == EXIT_SUCCESS);

        CHECK_FALSE(fs::exists(outputPath / "stale.csv"));
        CHECK_FALSE(fs::exists(outputPath / "rasters"));
        CHECK(fs::is_regular_file(cfg.emissions_output_path()));
    }

    SUBCASE("a vessel with a failing activity has no output")
    {
        constexpr std::string_view partialToml = R"toml(
            [model]
                emission_config = "config.toml"

            [output]
                path = "{}"

            [[vessel]]
                name = "Northern Star"
                attributes = {{ ship_type = "container_ship", size = 4000, size_unit = "teu", year_of_build = 2001 }}

                [[vessel.track]]
                    path = "positions.csv"
                    mode = "transit"

                [[vessel.track]]
                    path = "missing.csv"
                    mode = "transit"

            [[vessel]]
                name = "Unknown"

                [[vessel.mooring]]
                    hours = 1
                    mode = "anchorage"
        )toml";

        const auto cfg = parse_run_configuration(fmt::format(partialToml, str::from_u8(outputPath.generic_u8string())), fs::u8path(TEST_DATA_DIR));
        CHECK(run_model(cfg, ignore_progress()) == EXIT_SUCCESS);

        const auto emissions = read_emissions_output(cfg.emissions_output_path());
        CHECK(emissions.size() == 2);
        CHECK(emissions.count("Northern Star;positions.csv;transit;nox") == 0);
        CHECK(emissions.count("Unknown;mooring;anchorage;nox") == 1);
    }

    SUBCASE("an emission factor that can not be resolved aborts the run")
    {
        // sox applies to every engine group but only has a base value for the auxiliary engines
        const auto emissionConfigPath = temp.path() / "sox_config.toml";
        file::write_as_text(emissionConfigPath, file::read_as_text(fs::u8path(TEST_DATA_DIR) / "config.toml") + R"toml(
[[pollutants.sox]]
match_criteria = {}
base_value_name = "sulphur"

[[base_values.sulphur]]
match_criteria = { engine_group = "auxiliary" }
g_per_kwh = 0.4
)toml");

        const auto soxConfig = str::replace(fmt::format(configToml, str::from_u8(outputPath.generic_u8string())), "\"config.toml\"", fmt::format("\"{}\"", str::from_u8(emissionConfigPath.generic_u8string())));
        const auto cfg       = parse_run_configuration(soxConfig, fs::u8path(TEST_DATA_DIR));

        CHECK(run_model(cfg, ignore_progress()) == EXIT_FAILURE);
        CHECK_FALSE(fs::exists(cfg.emissions_output_path()));
    }

    SUBCASE("invalid emission configuration aborts the run")
    {
        const auto invalidConfig = str::replace(fmt::format(configToml, str::from_u8(outputPath.generic_u8string())), "config.toml", "missing.toml");
        const auto cfg           = parse_run_configuration(invalidConfig, fs::u8path(TEST_DATA_DIR));

        CHECK(run_model(cfg, ignore_progress()) == EXIT_FAILURE);
        CHECK_FALSE(fs::exists(cfg.emissions_output_path()));
    }
}

TEST_CASE("Check configuration")
{
    const auto dataPath = fs::u8path(TEST_DATA_DIR);

    SUBCASE("valid configuration")
    {
        CHECK(check_configuration(dataPath / "runconfig.toml") == EXIT_SUCCESS);
        CHECK_FALSE(fs::exists(dataPath / "output"));
    }

    SUBCASE("vessel that can not be processed")
    {
        constexpr std::string_view configToml = R"toml(
            [model]
                emission_config = "config.toml"

            [output]
                path = "output"

            [[vessel]]
                name = "Coastal tanker"
                attributes = { ship_type = "oil_tanker" }

                [[vessel.mooring]]
                    hours = 2
                    mode = "hotelling"
        )toml";

        CHECK(check_configuration(parse_run_configuration(configToml, dataPath)) == EXIT_FAILURE);
    }

    SUBCASE("missing track file")
    {
        constexpr std::string_view configToml = R"toml(
            [model]
                emission_config = "config.toml"

            [output]
                path = "output"

            [[vessel]]
                name = "Tug"

                [[vessel.track]]
                    path = "tug.csv"
                    mode = "maneuvering"
        )toml";

        CHECK(check_configuration(parse_run_configuration(configToml, dataPath)) == EXIT_FAILURE);
    }

    SUBCASE("missing files")
    {
        CHECK(check_configuration(dataPath / "missing.toml") == EXIT_FAILURE);
    }
}

}
