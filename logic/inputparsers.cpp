#include "shipem/inputparsers.h"

#include "infra/exception.h"
#include "infra/log.h"
#include "infra/string.h"

#include <csv.h>
#include <date/date.h>
#include <sstream>

namespace shipem {

using namespace inf;

Timestamp parse_timestamp(std::string_view str)
{
    const auto trimmed = str::trimmed_view(str);
    if (auto seconds = str::to_int64(trimmed); seconds.has_value()) {
        return Timestamp(std::chrono::seconds(*seconds));
    }

    std::istringstream ss{std::string(trimmed)};
    Timestamp result;
    ss >> date::parse("%Y-%m-%dT%H:%M:%S", result);
    if (ss.fail()) {
        throw RuntimeError("Invalid timestamp: '{}' (expected seconds since epoch or e.g. 2023-05-01T10:00:00Z)", str);
    }

    std::string remainder;
    ss >> remainder;
    if (!remainder.empty() && remainder != "Z") {
        throw RuntimeError("Invalid timestamp: '{}' (only UTC times are supported)", str);
    }

    return result;
}

static std::optional<double> to_optional_double(const char* value, std::string_view column)
{
    if (value == nullptr) {
        return {};
    }

    const auto valueString = str::trimmed_view(value);
    if (valueString.empty()) {
        return {};
    }

    if (auto number = str::to_double(valueString); number.has_value()) {
        return number;
    }

    throw RuntimeError("Invalid {} value: '{}'", column, valueString);
}

static double to_double(const char* value, std::string_view column)
{
    if (auto number = to_optional_double(value, column); number.has_value()) {
        return *number;
    }

    throw RuntimeError("Missing {} value", column);
}

std::vector<RawPosition> parse_positions(const fs::path& positionsCsv)
{
    try {
        Log::debug("Parse positions: {}", positionsCsv);

        using namespace io;
        CSVReader<8, trim_chars<' ', '\t'>, no_quote_escape<';'>, throw_on_overflow, single_line_comment<'#'>> in(str::from_u8(positionsCsv.u8string()));
        in.read_header(ignore_missing_column | ignore_extra_column, "ts", "lon", "lat", "sog", "cog", "heading", "tide_flow", "tide_bearing");

        for (auto column : {"ts", "lon", "lat", "sog", "cog", "heading"}) {
            if (!in.has_column(column)) {
                throw RuntimeError("Missing '{}' column", column);
            }
        }

        std::vector<RawPosition> result;

        char *ts, *lon, *lat, *sog, *cog, *heading;
        char *tideFlow = nullptr, *tideBearing = nullptr;
        while (in.read_row(ts, lon, lat, sog, cog, heading, tideFlow, tideBearing)) {
            try {
                RawPosition pos;
                pos.ts          = parse_timestamp(ts);
                pos.lon         = to_double(lon, "lon");
                pos.lat         = to_double(lat, "lat");
                pos.sog         = to_optional_double(sog, "sog");
                pos.cog         = to_optional_double(cog, "cog");
                pos.heading     = to_optional_double(heading, "heading");
                pos.tideFlow    = to_optional_double(tideFlow, "tide_flow");
                pos.tideBearing = to_optional_double(tideBearing, "tide_bearing");
                result.push_back(pos);
            } catch (const std::exception& e) {
                throw RuntimeError("Line {}: {}", in.get_file_line(), e.what());
            }

            tideFlow    = nullptr;
            tideBearing = nullptr;
        }

        return result;
    } catch (const std::exception& e) {
        throw RuntimeError("Error parsing {} ({})", positionsCsv, e.what());
    }
}

}
