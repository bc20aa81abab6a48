#include "runsummary.h"

#include "infra/cast.h"
#include "infra/exception.h"
#include "infra/log.h"
#include "infra/string.h"

#include <algorithm>
#include <array>
#include <set>
#include <xlsxwriter.h>

namespace shipem {

using namespace inf;

struct ColumnInfo
{
    const char* header = nullptr;
    double width       = 0.0;
};

namespace {

class WorkBook
{
public:
    explicit WorkBook(const fs::path& path)
    : _wb(workbook_new(str::from_u8(path.u8string()).c_str()))
    {
        if (_wb == nullptr) {
            throw RuntimeError("Failed to create excel document: {}", path);
        }
    }

    WorkBook(const WorkBook&)            = delete;
    WorkBook& operator=(const WorkBook&) = delete;

    ~WorkBook() noexcept
    {
        if (_wb != nullptr) {
            if (auto err = workbook_close(_wb); err != LXW_NO_ERROR) {
                Log::error("Failed to write excel document: {}", lxw_strerror(err));
            }
        }
    }

    void close()
    {
        auto err = workbook_close(_wb);
        _wb      = nullptr;
        if (err != LXW_NO_ERROR) {
            throw RuntimeError("Failed to write excel document: {}", lxw_strerror(err));
        }
    }

    operator lxw_workbook*() noexcept
    {
        return _wb;
    }

private:
    lxw_workbook* _wb;
};

}

static lxw_worksheet* add_worksheet_with_headers(lxw_workbook* wb, const std::string& tabName, std::span<const ColumnInfo> headers)
{
    auto* ws = workbook_add_worksheet(wb, tabName.c_str());
    if (!ws) {
        throw RuntimeError("Failed to add sheet to excel document");
    }

    auto* headerFormat = workbook_add_format(wb);
    format_set_bold(headerFormat);
    format_set_bg_color(headerFormat, 0xD5EBFF);

    for (int i = 0; i < truncate<int>(headers.size()); ++i) {
        worksheet_set_column(ws, truncate<lxw_col_t>(i), truncate<lxw_col_t>(i), headers[i].width, nullptr);
        worksheet_write_string(ws, 0, truncate<lxw_col_t>(i), headers[i].header, headerFormat);
    }

    return ws;
}

void RunSummary::add_vessel(std::string_view name, const VesselInfo& vessel, std::vector<std::string> guessedAttributes)
{
    VesselSummaryInfo info;
    info.name              = name;
    info.vessel            = vessel;
    info.guessedAttributes = std::move(guessedAttributes);

    std::scoped_lock lock(_mutex);
    _vessels.push_back(std::move(info));
}

void RunSummary::add_vessel_failure(std::string_view name, std::string_view error)
{
    std::scoped_lock lock(_mutex);

    // The vessel info could already be known when one of the activities failed
    auto iter = std::find_if(_vessels.begin(), _vessels.end(), [name](const VesselSummaryInfo& info) {
        return info.name == name;
    });

    if (iter != _vessels.end()) {
        iter->error = error;
    } else {
        VesselSummaryInfo info;
        info.name  = name;
        info.error = error;
        _vessels.push_back(std::move(info));
    }
}

void RunSummary::add_track(std::string_view vessel, const fs::path& path, Mode mode, size_t positionCount, const SanitizationSummary& sanitization, int32_t correctedSegmentDurations)
{
    TrackSummaryInfo info;
    info.vessel                    = vessel;
    info.path                      = path;
    info.mode                      = mode;
    info.positions                 = positionCount;
    info.sanitization              = sanitization;
    info.correctedSegmentDurations = correctedSegmentDurations;

    std::scoped_lock lock(_mutex);
    _tracks.push_back(std::move(info));
}

void RunSummary::add_emissions(std::string_view vessel, std::string_view activity, Mode mode, const Emissions& emissions)
{
    EmissionSummaryInfo info;
    info.vessel    = vessel;
    info.activity  = activity;
    info.mode      = mode;
    info.emissions = emissions;

    std::scoped_lock lock(_mutex);
    _emissions.push_back(std::move(info));
}

size_t RunSummary::failure_count() const
{
    std::scoped_lock lock(_mutex);
    return static_cast<size_t>(std::count_if(_vessels.begin(), _vessels.end(), [](const VesselSummaryInfo& info) {
        return !info.error.empty();
    }));
}

const std::vector<RunSummary::VesselSummaryInfo>& RunSummary::vessels() const noexcept
{
    return _vessels;
}

const std::vector<RunSummary::TrackSummaryInfo>& RunSummary::tracks() const noexcept
{
    return _tracks;
}

const std::vector<RunSummary::EmissionSummaryInfo>& RunSummary::emissions() const noexcept
{
    return _emissions;
}

void RunSummary::vessels_to_spreadsheet(lxw_workbook* wb, const std::string& tabName) const
{
    const std::array<ColumnInfo, 11> headers = {
        ColumnInfo{"Vessel", 25.0},
        ColumnInfo{"Ship type", 25.0},
        ColumnInfo{"Size", 12.0},
        ColumnInfo{"Size unit", 15.0},
        ColumnInfo{"Max speed (kts)", 15.0},
        ColumnInfo{"Engine power (kW)", 17.0},
        ColumnInfo{"Engine rpm", 12.0},
        ColumnInfo{"Engine category", 15.0},
        ColumnInfo{"NOx tier", 10.0},
        ColumnInfo{"Guessed attributes", 60.0},
        ColumnInfo{"Error", 100.0},
    };

    auto* ws = add_worksheet_with_headers(wb, tabName, headers);

    auto vessels = _vessels;
    std::sort(vessels.begin(), vessels.end(), [](const VesselSummaryInfo& lhs, const VesselSummaryInfo& rhs) {
        return lhs.name < rhs.name;
    });

    lxw_row_t row = 1;
    for (const auto& info : vessels) {
        worksheet_write_string(ws, row, 0, info.name.c_str(), nullptr);
        if (info.vessel.has_value()) {
            const auto& vessel = *info.vessel;
            const std::string category(enum_to_string(vessel.engine_category()));
            worksheet_write_string(ws, row, 1, vessel.ship_type().c_str(), nullptr);
            worksheet_write_number(ws, row, 2, vessel.size(), nullptr);
            worksheet_write_string(ws, row, 3, vessel.size_unit().c_str(), nullptr);
            worksheet_write_number(ws, row, 4, vessel.max_speed(), nullptr);
            worksheet_write_number(ws, row, 5, vessel.engine_kw(), nullptr);
            worksheet_write_number(ws, row, 6, vessel.engine_rpm(), nullptr);
            worksheet_write_string(ws, row, 7, category.c_str(), nullptr);
            worksheet_write_number(ws, row, 8, enum_to_number(vessel.engine_nox_tier()), nullptr);
            worksheet_write_string(ws, row, 9, str::join(info.guessedAttributes, ", ").c_str(), nullptr);
        }

        if (!info.error.empty()) {
            worksheet_write_string(ws, row, 10, info.error.c_str(), nullptr);
        }

        ++row;
    }

    worksheet_autofilter(ws, 0, 0, row, truncate<lxw_col_t>(headers.size() - 1));
}

void RunSummary::tracks_to_spreadsheet(lxw_workbook* wb, const std::string& tabName) const
{
    if (_tracks.empty()) {
        return;
    }

    const std::array<ColumnInfo, 9> headers = {
        ColumnInfo{"Vessel", 25.0},
        ColumnInfo{"Mode", 15.0},
        ColumnInfo{"Positions", 12.0},
        ColumnInfo{"Discarded positions", 20.0},
        ColumnInfo{"Repaired sog", 15.0},
        ColumnInfo{"Repaired cog", 15.0},
        ColumnInfo{"Repaired heading", 17.0},
        ColumnInfo{"Corrected segment durations", 27.0},
        ColumnInfo{"Path", 125.0},
    };

    auto* ws = add_worksheet_with_headers(wb, tabName, headers);

    lxw_row_t row = 1;
    for (const auto& info : _tracks) {
        const std::string mode(enum_to_string(info.mode));

        worksheet_write_string(ws, row, 0, info.vessel.c_str(), nullptr);
        worksheet_write_string(ws, row, 1, mode.c_str(), nullptr);
        worksheet_write_number(ws, row, 2, static_cast<double>(info.positions), nullptr);
        worksheet_write_number(ws, row, 3, info.sanitization.discardedPositions, nullptr);
        worksheet_write_number(ws, row, 4, info.sanitization.repairedSogs, nullptr);
        worksheet_write_number(ws, row, 5, info.sanitization.repairedCogs, nullptr);
        worksheet_write_number(ws, row, 6, info.sanitization.repairedHeadings, nullptr);
        worksheet_write_number(ws, row, 7, info.correctedSegmentDurations, nullptr);
        worksheet_write_string(ws, row, 8, str::from_u8(info.path.generic_u8string()).c_str(), nullptr);
        ++row;
    }

    worksheet_autofilter(ws, 0, 0, row, truncate<lxw_col_t>(headers.size() - 1));
}

void RunSummary::emissions_to_spreadsheet(lxw_workbook* wb, const std::string& tabName) const
{
    if (_emissions.empty()) {
        return;
    }

    std::set<std::string> pollutants;
    for (const auto& info : _emissions) {
        for (const auto& [pollutant, grams] : info.emissions) {
            pollutants.insert(pollutant);
        }
    }

    std::vector<ColumnInfo> headers = {
        ColumnInfo{"Vessel", 25.0},
        ColumnInfo{"Activity", 15.0},
        ColumnInfo{"Mode", 15.0},
    };

    for (const auto& pollutant : pollutants) {
        headers.push_back(ColumnInfo{pollutant.c_str(), 17.0});
    }

    auto* ws = add_worksheet_with_headers(wb, tabName, headers);

    auto* formatNumber = workbook_add_format(wb);
    format_set_num_format(formatNumber, "0.000");

    lxw_row_t row = 1;
    for (const auto& info : _emissions) {
        const std::string mode(enum_to_string(info.mode));

        worksheet_write_string(ws, row, 0, info.vessel.c_str(), nullptr);
        worksheet_write_string(ws, row, 1, info.activity.c_str(), nullptr);
        worksheet_write_string(ws, row, 2, mode.c_str(), nullptr);

        lxw_col_t col = 3;
        for (const auto& pollutant : pollutants) {
            if (auto grams = info.emissions.grams(pollutant); grams.has_value()) {
                worksheet_write_number(ws, row, col, *grams, formatNumber);
            }
            ++col;
        }

        ++row;
    }

    worksheet_autofilter(ws, 0, 0, row, truncate<lxw_col_t>(headers.size() - 1));
}

void RunSummary::write_summary(const fs::path& path) const
{
    std::error_code ec;
    fs::remove(path, ec);

    std::scoped_lock lock(_mutex);

    WorkBook wb(path);
    vessels_to_spreadsheet(wb, "vessels");
    tracks_to_spreadsheet(wb, "tracks");
    emissions_to_spreadsheet(wb, "emissions (g)");
    wb.close();
}

}
