#pragma once

#include "shipem/attributes.h"
#include "shipem/emissioncalculator.h"
#include "shipem/track.h"
#include "shipem/vesselinfo.h"
#include "infra/filesystem.h"
#include "infra/span.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shipem {

struct TrackInput
{
    fs::path path;
    Mode mode = Mode::Transit;
};

struct MooringInput
{
    std::chrono::seconds duration{0};
    Mode mode = Mode::Hotelling;
};

// A vessel with the attributes that are known about it and its activities
struct VesselInput
{
    std::string name;
    Attributes attributes;
    std::vector<TrackInput> tracks;
    std::vector<MooringInput> moorings;
};

class RunConfiguration
{
public:
    struct Model
    {
        fs::path emissionConfigPath;
        std::optional<double> maxSog;          // kts, reported speeds above are repaired
        std::optional<double> maxImpliedSpeed; // kts, positions that would need a higher speed are discarded
        SegmentDurationSanitizer durationSanitizer;
    };

    struct Output
    {
        fs::path path;
    };

    RunConfiguration(Model model, Output output, std::vector<VesselInput> vessels);

    const fs::path& emission_configuration_path() const noexcept;

    SogPlausible sog_plausibility() const;
    DistanceCoveredPlausible distance_plausibility() const;
    const SegmentDurationSanitizer& duration_sanitizer() const noexcept;

    std::span<const VesselInput> vessels() const noexcept;

    void set_max_concurrency(std::optional<int32_t> concurrency) noexcept;
    std::optional<int32_t> max_concurrency() const noexcept;

    const fs::path& output_path() const noexcept;
    fs::path emissions_output_path() const;
    fs::path run_summary_output_path() const;
    fs::path log_output_path() const;

private:
    Model _model;
    Output _output;
    std::vector<VesselInput> _vessels;
    std::optional<int32_t> _concurrency;
};

}
