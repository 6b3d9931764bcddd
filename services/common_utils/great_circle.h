#pragma once

namespace great_circle {

// Mean Earth radius in meters, used when no radius is given
constexpr double MEAN_EARTH_RADIUS = 6371000.0;

// Position on the sphere. Latitude and longitude are in radians, height in meters.
// Height is carried through but never read by the formulas below.
struct GeographicPoint
{
    double latitude = 0.0;
    double longitude = 0.0;
    double height = 0.0;
};

// Great-circle surface distance between two points (Haversine), in the unit of radius.
// Total over finite inputs; identical points give 0, antipodal points give pi * radius.
double GroundDistance(const GeographicPoint &p1, const GeographicPoint &p2,
                      double radius = MEAN_EARTH_RADIUS);

// Initial heading in radians [0, 2pi) from p1 toward p2.
// 0 = north, increasing clockwise (pi/2 = east).
// Coincident points have no meaningful bearing and return 0.
double InitialBearing(const GeographicPoint &p1, const GeographicPoint &p2);

// Point reached after traveling distance along initial_bearing (radians) from p.
// A negative distance travels along initial_bearing + pi.
// The returned longitude is p.longitude + delta and is NOT wrapped into (-pi, pi].
// Height of the result is always 0.
GeographicPoint Destination(const GeographicPoint &p, double distance, double initial_bearing,
                            double radius = MEAN_EARTH_RADIUS);

// Map any finite angle in radians to [0, 2pi)
double ZeroToTwoPi(double angle);

} // namespace great_circle
