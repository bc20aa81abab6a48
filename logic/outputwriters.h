#pragma once

#include "shipem/emissions.h"
#include "shipem/vesselinfo.h"

#include "infra/filesystem.h"
#include "infra/span.h"

#include <string>

namespace shipem {

struct EmissionOutputEntry
{
    std::string vessel;
    std::string activity; // track file name or "mooring"
    Mode mode = Mode::Transit;
    Emissions emissions;
};

// Writes the emissions as: vessel;activity;mode;pollutant;emission_g
class EmissionsCsvWriter
{
public:
    explicit EmissionsCsvWriter(const fs::path& path);

    void write_header();
    void append_entries(std::span<const EmissionOutputEntry> entries);

private:
    inf::file::Handle _fp;
};

void write_emissions_csv(std::span<const EmissionOutputEntry> entries, const fs::path& path);

}
