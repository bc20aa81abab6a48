#include "shipem/runconfigurationparser.h"
#include "shipem/constants.h"
#include "shipem/exceptions.h"

#include "configurationutil.h"
#include "infra/cast.h"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <toml++/toml.h>

namespace shipem {

using namespace inf;

static Mode read_mode(const NamedSection& ns)
{
    return mode_from_string(read_string(ns, "mode"));
}

static Attributes read_attributes(const NamedSection& ns)
{
    Attributes result;

    auto attributes = ns.section["attributes"];
    if (!attributes) {
        return result;
    }

    const auto* table = attributes.as_table();
    if (table == nullptr) {
        throw RuntimeError("'attributes' of '{}' should be a table (e.g. attributes = {{ ship_type = \"tug\" }})", ns.name);
    }

    for (const auto& [key, node] : *table) {
        if (auto number = node_as_number(node); number.has_value()) {
            result.emplace(key.str(), *number);
        } else if (const auto* text = node.as_string(); text != nullptr) {
            result.emplace(key.str(), text->get());
        } else {
            throw RuntimeError("Attribute '{}' of '{}' should be a number or a string", key.str(), ns.name);
        }
    }

    return result;
}

static std::vector<TrackInput> read_tracks(const NamedSection& vessel, const fs::path& basePath)
{
    std::vector<TrackInput> result;

    const auto* tracks = vessel.section["track"].as_array();
    if (tracks == nullptr) {
        return result;
    }

    for (const auto& trackNode : *tracks) {
        NamedSection track(fmt::format("{}.track", vessel.name), toml::node_view<const toml::node>(&trackNode));
        if (!track.section.is_table()) {
            throw RuntimeError("'{}' entries should be tables (e.g. [[vessel.track]])", track.name);
        }

        TrackInput input;
        input.path = read_path(track, "path", basePath);
        input.mode = read_mode(track);
        result.push_back(std::move(input));
    }

    return result;
}

static std::vector<MooringInput> read_moorings(const NamedSection& vessel)
{
    std::vector<MooringInput> result;

    const auto* moorings = vessel.section["mooring"].as_array();
    if (moorings == nullptr) {
        return result;
    }

    for (const auto& mooringNode : *moorings) {
        NamedSection mooring(fmt::format("{}.mooring", vessel.name), toml::node_view<const toml::node>(&mooringNode));
        if (!mooring.section.is_table()) {
            throw RuntimeError("'{}' entries should be tables (e.g. [[vessel.mooring]])", mooring.name);
        }

        const auto hours = read_number(mooring, "hours");
        if (!(hours >= 0.0)) {
            throw RuntimeError("Invalid mooring duration in '{}': {} hours", mooring.name, hours);
        }

        MooringInput input;
        input.duration = std::chrono::seconds(truncate<int64_t>(std::round(hours * constants::secondsPerHour)));
        input.mode     = read_mode(mooring);
        result.push_back(input);
    }

    return result;
}

static std::vector<VesselInput> read_vessels(const toml::table& table, const fs::path& basePath)
{
    std::vector<VesselInput> result;

    const auto* vessels = table["vessel"].as_array();
    if (vessels == nullptr) {
        throw RuntimeError("No vessels present in run configuration (e.g. [[vessel]])");
    }

    for (const auto& vesselNode : *vessels) {
        NamedSection vessel("vessel", toml::node_view<const toml::node>(&vesselNode));
        if (!vessel.section.is_table()) {
            throw RuntimeError("'vessel' entries should be tables (e.g. [[vessel]])");
        }

        VesselInput input;
        input.name  = read_string(vessel, "name");
        vessel.name = fmt::format("vessel '{}'", input.name);

        input.attributes = read_attributes(vessel);
        input.tracks     = read_tracks(vessel, basePath);
        input.moorings   = read_moorings(vessel);

        if (input.tracks.empty() && input.moorings.empty()) {
            throw RuntimeError("No track or mooring present for {}", vessel.name);
        }

        if (std::any_of(result.begin(), result.end(), [&](const VesselInput& other) { return other.name == input.name; })) {
            throw RuntimeError("Duplicate vessel name in run configuration: '{}'", input.name);
        }

        result.push_back(std::move(input));
    }

    return result;
}

static RunConfiguration parse_run_configuration_impl(std::string_view configContents, const fs::path& tomlPath)
{
    const auto basePath     = tomlPath.parent_path();
    const toml::table table = parse_toml(configContents, tomlPath, "run configuration");

    throw_on_missing_section(table, "model");
    throw_on_missing_section(table, "output");

    NamedSection model("model", table["model"]);
    NamedSection output("output", table["output"]);

    RunConfiguration::Model modelConfig;
    modelConfig.emissionConfigPath = read_path(model, "emission_config", basePath);
    modelConfig.maxSog             = read_optional_number(model, "max_sog");
    modelConfig.maxImpliedSpeed    = read_optional_number(model, "max_implied_speed");

    if (auto deviation = read_optional_number(model, "max_distance_deviation"); deviation.has_value()) {
        if (*deviation < 0.0 || *deviation >= 1.0) {
            throw RuntimeError("max_distance_deviation should be in [0, 1) ({})", *deviation);
        }

        modelConfig.durationSanitizer.maxDistanceDeviation = *deviation;
    }

    if (auto factor = read_optional_number(model, "max_duration_increase_factor"); factor.has_value()) {
        if (*factor < 1.0) {
            throw RuntimeError("max_duration_increase_factor should not be smaller than 1 ({})", *factor);
        }

        modelConfig.durationSanitizer.maxDurationIncreaseFactor = *factor;
    }

    RunConfiguration::Output outputConfig;
    outputConfig.path = read_path(output, "path", basePath);

    return RunConfiguration(std::move(modelConfig), std::move(outputConfig), read_vessels(table, basePath));
}

RunConfiguration parse_run_configuration_file(const fs::path& config)
{
    return parse_run_configuration_impl(file::read_as_text(config), config);
}

RunConfiguration parse_run_configuration(std::string_view configContents, const fs::path& basePath)
{
    return parse_run_configuration_impl(configContents, basePath / "dummy.toml");
}

}
