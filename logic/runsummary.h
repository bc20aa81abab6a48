#pragma once

#include "shipem/attributes.h"
#include "shipem/emissions.h"
#include "shipem/track.h"
#include "shipem/vesselinfo.h"
#include "infra/filesystem.h"
#include "infra/span.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct lxw_workbook;

namespace shipem {

class RunSummary
{
public:
    void add_vessel(std::string_view name, const VesselInfo& vessel, std::vector<std::string> guessedAttributes);
    void add_vessel_failure(std::string_view name, std::string_view error);
    void add_track(std::string_view vessel, const fs::path& path, Mode mode, size_t positionCount, const SanitizationSummary& sanitization, int32_t correctedSegmentDurations);
    void add_emissions(std::string_view vessel, std::string_view activity, Mode mode, const Emissions& emissions);

    size_t failure_count() const;

    // Writes the summary spreadsheet with a sheet for the vessels, the tracks and the emissions
    void write_summary(const fs::path& path) const;

    struct VesselSummaryInfo
    {
        std::string name;
        std::optional<VesselInfo> vessel;
        std::vector<std::string> guessedAttributes;
        std::string error;
    };

    struct TrackSummaryInfo
    {
        std::string vessel;
        fs::path path;
        Mode mode = Mode::Transit;
        size_t positions = 0;
        SanitizationSummary sanitization;
        int32_t correctedSegmentDurations = 0;
    };

    struct EmissionSummaryInfo
    {
        std::string vessel;
        std::string activity;
        Mode mode = Mode::Transit;
        Emissions emissions;
    };

    // Not synchronized, only use these when the processing is finished
    const std::vector<VesselSummaryInfo>& vessels() const noexcept;
    const std::vector<TrackSummaryInfo>& tracks() const noexcept;
    const std::vector<EmissionSummaryInfo>& emissions() const noexcept;

private:
    void vessels_to_spreadsheet(lxw_workbook* wb, const std::string& tabName) const;
    void tracks_to_spreadsheet(lxw_workbook* wb, const std::string& tabName) const;
    void emissions_to_spreadsheet(lxw_workbook* wb, const std::string& tabName) const;

    mutable std::mutex _mutex;
    std::vector<VesselSummaryInfo> _vessels;
    std::vector<TrackSummaryInfo> _tracks;
    std::vector<EmissionSummaryInfo> _emissions;
};

}
