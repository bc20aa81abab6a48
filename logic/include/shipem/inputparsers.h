#pragma once

#include "shipem/track.h"
#include "infra/filesystem.h"

#include <string_view>
#include <vector>

namespace shipem {

// Seconds since epoch or an ISO 8601 UTC time (e.g. 2023-05-01T10:00:00Z)
Timestamp parse_timestamp(std::string_view str);

/* Reads the reported positions of a vessel
 * Format: ts;lon;lat;sog;cog;heading[;tide_flow;tide_bearing]
 * Empty sog, cog, heading or tide fields are missing values */
std::vector<RawPosition> parse_positions(const fs::path& positionsCsv);

}
