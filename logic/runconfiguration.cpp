#include "shipem/runconfiguration.h"

#include "infra/exception.h"

namespace shipem {

using namespace inf;

RunConfiguration::RunConfiguration(Model model, Output output, std::vector<VesselInput> vessels)
: _model(std::move(model))
, _output(std::move(output))
, _vessels(std::move(vessels))
{
}

const fs::path& RunConfiguration::emission_configuration_path() const noexcept
{
    return _model.emissionConfigPath;
}

SogPlausible RunConfiguration::sog_plausibility() const
{
    if (_model.maxSog.has_value()) {
        return sog_below(*_model.maxSog);
    }

    return always_plausible_sog();
}

DistanceCoveredPlausible RunConfiguration::distance_plausibility() const
{
    if (_model.maxImpliedSpeed.has_value()) {
        return implied_speed_below(*_model.maxImpliedSpeed);
    }

    return always_plausible_distance();
}

const SegmentDurationSanitizer& RunConfiguration::duration_sanitizer() const noexcept
{
    return _model.durationSanitizer;
}

std::span<const VesselInput> RunConfiguration::vessels() const noexcept
{
    return _vessels;
}

void RunConfiguration::set_max_concurrency(std::optional<int32_t> concurrency) noexcept
{
    _concurrency = concurrency;
}

std::optional<int32_t> RunConfiguration::max_concurrency() const noexcept
{
    return _concurrency;
}

const fs::path& RunConfiguration::output_path() const noexcept
{
    return _output.path;
}

fs::path RunConfiguration::emissions_output_path() const
{
    return _output.path / "emissions.csv";
}

fs::path RunConfiguration::run_summary_output_path() const
{
    return _output.path / "run_summary.xlsx";
}

fs::path RunConfiguration::log_output_path() const
{
    return _output.path / "shipem.log";
}

}
