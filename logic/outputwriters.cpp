#include "outputwriters.h"
#include "shipemconfig.h"

#include "infra/exception.h"

#include <fmt/compile.h>
#include <fmt/core.h>

namespace shipem {

using namespace inf;

EmissionsCsvWriter::EmissionsCsvWriter(const fs::path& path)
{
    fs::create_directories(path.parent_path());

    _fp.open(path, "wt");
    if (!_fp.is_open()) {
        throw RuntimeError("Failed to create emissions output file: {}", path);
    }
}

void EmissionsCsvWriter::write_header()
{
    fmt::print(_fp, "# shipem v" SHIPEM_VERSION "\n");
    fmt::print(_fp, "vessel;activity;mode;pollutant;emission_g\n");
}

void EmissionsCsvWriter::append_entries(std::span<const EmissionOutputEntry> entries)
{
    for (const auto& entry : entries) {
        for (const auto& [pollutant, grams] : entry.emissions) {
            fmt::print(_fp, FMT_COMPILE("{};{};{};{};{:.3f}\n"), entry.vessel, entry.activity, enum_to_string(entry.mode), pollutant, grams);
        }
    }
}

void write_emissions_csv(std::span<const EmissionOutputEntry> entries, const fs::path& path)
{
    EmissionsCsvWriter writer(path);
    writer.write_header();
    writer.append_entries(entries);
}

}
