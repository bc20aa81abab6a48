#include "shipem/track.h"
#include "shipem/constants.h"
#include "shipem/exceptions.h"

#include "geometry.h"
#include "infra/log.h"
#include "unitconversion.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace shipem {

using namespace inf;

double speed_through_water(double sog, double cog, double tideFlow, double tideBearing) noexcept
{
    if (tideFlow == 0.0) {
        return sog;
    }

    const auto diffRad = (cog - tideBearing) * std::numbers::pi / 180.0;
    return std::sqrt(std::max(0.0, sog * sog + tideFlow * tideFlow - (2 * sog * tideFlow * std::cos(diffRad))));
}

Position make_position(Timestamp ts, double lon, double lat, double sog, double cog, double heading, double tideFlow, double tideBearing)
{
    validate_coordinate(lon, lat);

    Position pos;
    pos.ts          = ts;
    pos.lon         = lon;
    pos.lat         = lat;
    pos.sog         = sog;
    pos.cog         = cog;
    pos.heading     = heading;
    pos.tideFlow    = tideFlow;
    pos.tideBearing = tideBearing;
    pos.stw         = speed_through_water(sog, cog, tideFlow, tideBearing);
    return pos;
}

void validate_coordinate(double lon, double lat)
{
    if (!(lon >= -180.0 && lon < 180.0)) {
        throw ValidationError("Invalid longitude: {} (must be in [-180, 180))", lon);
    }

    if (!(lat >= -90.0 && lat <= 90.0)) {
        throw ValidationError("Invalid latitude: {} (must be in [-90, 90])", lat);
    }
}

Segment::Segment(const Position& start, const Position& end)
: _start(start)
, _end(end)
, _distance(geom::great_circle_distance(start.lon, start.lat, end.lon, end.lat))
{
    if (start.ts > end.ts) {
        throw ValidationError("Segment start must not be after its end");
    }
}

const Position& Segment::start() const noexcept
{
    return _start;
}

const Position& Segment::end() const noexcept
{
    return _end;
}

double Segment::distance_m() const noexcept
{
    return _distance;
}

std::chrono::seconds Segment::duration() const noexcept
{
    return _end.ts - _start.ts;
}

double Segment::duration_hours() const noexcept
{
    return to_hours(duration());
}

SogPlausible always_plausible_sog()
{
    return [](double) { return true; };
}

DistanceCoveredPlausible always_plausible_distance()
{
    return [](const TimedCoordinate&, const TimedCoordinate&) { return true; };
}

SogPlausible sog_below(double maxKnots)
{
    return [maxKnots](double sog) {
        return sog >= 0.0 && sog < maxKnots;
    };
}

DistanceCoveredPlausible implied_speed_below(double maxKnots)
{
    return [maxKnots](const TimedCoordinate& from, const TimedCoordinate& to) {
        const auto distance = geom::great_circle_distance(from.lon, from.lat, to.lon, to.lat);
        const auto duration = to.ts - from.ts;
        if (duration.count() <= 0) {
            // an instantaneous jump is only plausible when the vessel did not move
            return distance == 0.0;
        }

        return speed_knots(distance, duration) < maxKnots;
    };
}

Track::Track(std::vector<Position> positions, SanitizationSummary summary)
: _positions(std::move(positions))
, _summary(summary)
{
    if (!std::is_sorted(_positions.begin(), _positions.end(), [](const Position& lhs, const Position& rhs) { return lhs.ts < rhs.ts; })) {
        throw ValidationError("Track positions must be sorted on time");
    }
}

std::span<const Position> Track::positions() const noexcept
{
    return _positions;
}

std::vector<Segment> Track::segments() const
{
    std::vector<Segment> result;
    if (_positions.size() < 2) {
        return result;
    }

    result.reserve(_positions.size() - 1);
    for (size_t i = 1; i < _positions.size(); ++i) {
        result.emplace_back(_positions[i - 1], _positions[i]);
    }

    return result;
}

bool Track::empty() const noexcept
{
    return _positions.empty();
}

size_t Track::size() const noexcept
{
    return _positions.size();
}

double Track::distance_m() const
{
    double distance = 0.0;
    for (const auto& segment : segments()) {
        distance += segment.distance_m();
    }

    return distance;
}

std::chrono::seconds Track::duration() const noexcept
{
    if (_positions.size() < 2) {
        return std::chrono::seconds(0);
    }

    return _positions.back().ts - _positions.front().ts;
}

Track Track::partial_track(Timestamp start, Timestamp end) const
{
    if (start > end) {
        throw ValidationError("Partial track start must not be after its end");
    }

    std::vector<Position> positions;
    std::copy_if(_positions.begin(), _positions.end(), std::back_inserter(positions), [start, end](const Position& pos) {
        return pos.ts >= start && pos.ts <= end;
    });

    return Track(std::move(positions));
}

const SanitizationSummary& Track::sanitization_summary() const noexcept
{
    return _summary;
}

static TimedCoordinate timed_coordinate(const RawPosition& pos) noexcept
{
    return TimedCoordinate{pos.ts, pos.lon, pos.lat};
}

static double calculate_sog(const RawPosition* previous, const RawPosition& current, const RawPosition* next)
{
    double speedSum = 0.0;
    int pairCount   = 0;

    auto addPair = [&](const RawPosition& from, const RawPosition& to) {
        // a pair without elapsed time counts, but does not contribute any speed
        speedSum += speed_knots(geom::great_circle_distance(from.lon, from.lat, to.lon, to.lat), to.ts - from.ts);
        ++pairCount;
    };

    if (previous) {
        addPair(*previous, current);
    }

    if (next) {
        addPair(current, *next);
    }

    if (pairCount == 0) {
        return 0.0;
    }

    return std::min(speedSum / pairCount, constants::maxCalculatedSpeed);
}

static double calculate_cog(const RawPosition* previous, const RawPosition& current, const RawPosition* next)
{
    std::optional<double> incoming, outgoing;
    if (previous) {
        incoming = geom::bearing(previous->lon, previous->lat, current.lon, current.lat);
    }

    if (next) {
        outgoing = geom::bearing(current.lon, current.lat, next->lon, next->lat);
    }

    if (incoming.has_value() && outgoing.has_value()) {
        return geom::average_bearing(*incoming, *outgoing);
    }

    return incoming.value_or(outgoing.value_or(0.0));
}

Track sanitize(std::span<const RawPosition> rawPositions, const SogPlausible& sogPlausible, const DistanceCoveredPlausible& distancePlausible)
{
    std::vector<RawPosition> sorted(rawPositions.begin(), rawPositions.end());
    for (const auto& pos : sorted) {
        validate_coordinate(pos.lon, pos.lat);
    }

    std::stable_sort(sorted.begin(), sorted.end(), [](const RawPosition& lhs, const RawPosition& rhs) {
        return lhs.ts < rhs.ts;
    });

    SanitizationSummary summary;

    // Outliers are judged against the last retained position, discarded ones never become a reference
    std::vector<const RawPosition*> retained;
    retained.reserve(sorted.size());
    for (const auto& pos : sorted) {
        if (!retained.empty() && !distancePlausible(timed_coordinate(*retained.back()), timed_coordinate(pos))) {
            ++summary.discardedPositions;
            continue;
        }

        retained.push_back(&pos);
    }

    std::vector<Position> positions;
    positions.reserve(retained.size());
    for (size_t i = 0; i < retained.size(); ++i) {
        const auto& current      = *retained[i];
        const RawPosition* prev = i > 0 ? retained[i - 1] : nullptr;
        const RawPosition* next = i + 1 < retained.size() ? retained[i + 1] : nullptr;

        double tideFlow    = 0.0;
        double tideBearing = 0.0;
        if (current.tideFlow.has_value() && current.tideBearing.has_value() && *current.tideFlow >= 0.0 && geom::is_valid_bearing(*current.tideBearing)) {
            tideFlow    = *current.tideFlow;
            tideBearing = *current.tideBearing;
        }

        // A negative speed is treated as missing
        double sog = 0.0;
        if (current.sog.has_value() && *current.sog >= 0.0 && sogPlausible(*current.sog)) {
            sog = *current.sog;
        } else {
            ++summary.repairedSogs;
            sog = calculate_sog(prev, current, next);
        }

        double cog = 0.0;
        if (current.cog.has_value() && geom::is_valid_bearing(*current.cog)) {
            cog = *current.cog;
        } else {
            ++summary.repairedCogs;
            cog = calculate_cog(prev, current, next);
        }

        double heading = cog;
        if (current.heading.has_value() && geom::is_valid_bearing(*current.heading)) {
            heading = *current.heading;
        } else {
            ++summary.repairedHeadings;
        }

        positions.push_back(make_position(current.ts, current.lon, current.lat, sog, cog, heading, tideFlow, tideBearing));
    }

    if (!summary.empty()) {
        Log::debug("Sanitization during track creation: {}", summary);
    }

    return Track(std::move(positions), summary);
}

}
