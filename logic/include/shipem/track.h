#pragma once

#include "infra/span.h"

#include <chrono>
#include <cstdint>
#include <date/date.h>
#include <fmt/core.h>
#include <functional>
#include <optional>
#include <vector>

namespace shipem {

using Timestamp = date::sys_seconds;

// A position as reported, kinematic fields may be missing
struct RawPosition
{
    Timestamp ts;
    double lon = 0.0;
    double lat = 0.0;
    std::optional<double> sog;     // kts
    std::optional<double> cog;     // degrees
    std::optional<double> heading; // degrees
    std::optional<double> tideFlow;    // kts
    std::optional<double> tideBearing; // degrees, direction the water flows to
};

// A sanitized position, all speeds in kts, all bearings in degrees
struct Position
{
    Timestamp ts;
    double lon         = 0.0;
    double lat         = 0.0;
    double sog         = 0.0;
    double cog         = 0.0;
    double heading     = 0.0;
    double tideFlow    = 0.0;
    double tideBearing = 0.0;
    double stw         = 0.0; // speed through water

    bool operator==(const Position& other) const noexcept = default;
};

/* Creates a position with the speed through water derived from the tide:
 * the tide drift vector is subtracted from the ground track velocity vector */
Position make_position(Timestamp ts, double lon, double lat, double sog, double cog, double heading, double tideFlow = 0.0, double tideBearing = 0.0);

double speed_through_water(double sog, double cog, double tideFlow, double tideBearing) noexcept;

// Throws a ValidationError when lon is not in [-180, 180) or lat not in [-90, 90]
void validate_coordinate(double lon, double lat);

// Connection between two consecutive positions of a track
class Segment
{
public:
    Segment(const Position& start, const Position& end);

    const Position& start() const noexcept;
    const Position& end() const noexcept;

    double distance_m() const noexcept;
    std::chrono::seconds duration() const noexcept;
    double duration_hours() const noexcept;

private:
    Position _start;
    Position _end;
    double _distance = 0.0;
};

struct TimedCoordinate
{
    Timestamp ts;
    double lon = 0.0;
    double lat = 0.0;
};

using SogPlausible             = std::function<bool(double sog)>;
using DistanceCoveredPlausible = std::function<bool(const TimedCoordinate& from, const TimedCoordinate& to)>;

SogPlausible always_plausible_sog();
DistanceCoveredPlausible always_plausible_distance();

// Reported speeds below the given speed are plausible
SogPlausible sog_below(double maxKnots);
// Travelling between the positions is plausible when the implied speed stays below the given speed
DistanceCoveredPlausible implied_speed_below(double maxKnots);

// What was repaired or discarded while sanitizing the raw positions
struct SanitizationSummary
{
    int32_t discardedPositions = 0;
    int32_t repairedSogs       = 0;
    int32_t repairedCogs       = 0;
    int32_t repairedHeadings   = 0;

    bool empty() const noexcept
    {
        return discardedPositions == 0 && repairedSogs == 0 && repairedCogs == 0 && repairedHeadings == 0;
    }
};

// A time ordered sequence of positions, segments connect each consecutive pair
class Track
{
public:
    Track() = default;
    // The positions have to be sorted on timestamp (ValidationError otherwise)
    explicit Track(std::vector<Position> positions, SanitizationSummary summary = {});

    std::span<const Position> positions() const noexcept;
    std::vector<Segment> segments() const;

    bool empty() const noexcept;
    size_t size() const noexcept;

    double distance_m() const;
    std::chrono::seconds duration() const noexcept;

    // The part of the track with start <= ts <= end (ValidationError if start > end)
    Track partial_track(Timestamp start, Timestamp end) const;

    const SanitizationSummary& sanitization_summary() const noexcept;

private:
    std::vector<Position> _positions;
    SanitizationSummary _summary;
};

/* Creates a track from raw reported positions
 * Positions are sorted on time, a position the vessel could not have plausibly reached from
 * the previous retained position is discarded. Missing or implausible speeds and missing
 * courses are derived from the neighbouring retained positions, a missing heading takes the course.
 * Tide data is only used when the flow is not negative and the bearing is in [0, 360). */
Track sanitize(std::span<const RawPosition> rawPositions,
               const SogPlausible& sogPlausible                   = always_plausible_sog(),
               const DistanceCoveredPlausible& distancePlausible = always_plausible_distance());

}

template <>
struct fmt::formatter<shipem::SanitizationSummary>
{
    FMT_CONSTEXPR20 auto parse(format_parse_context& ctx) -> format_parse_context::iterator
    {
        return ctx.begin();
    }

    auto format(const shipem::SanitizationSummary& val, format_context& ctx) const -> format_context::iterator
    {
        return fmt::format_to(ctx.out(), "{} outliers, {} sogs, {} cogs, {} headings", val.discardedPositions, val.repairedSogs, val.repairedCogs, val.repairedHeadings);
    }
};
