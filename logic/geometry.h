#pragma once

namespace shipem::geom {

// Great-circle distance in meters (haversine, average earth radius)
double great_circle_distance(double lon1, double lat1, double lon2, double lat2) noexcept;

/* Bearing from one position to another relative to north in degrees [0, 360)
 * Uses a planar projection: reasonably accurate across short distances,
 * does not work across the poles or the antimeridian */
double bearing(double lon1, double lat1, double lon2, double lat2) noexcept;

// Mean of two bearings, going the short way around
double average_bearing(double b1, double b2) noexcept;

bool is_valid_bearing(double bearing) noexcept;

}
