#include "great_circle.h"
#include <cmath>

namespace {
    constexpr double TWO_PI = 2.0 * M_PI;
}

namespace great_circle {

double GroundDistance(const GeographicPoint &p1, const GeographicPoint &p2, double radius)
{
    double dLat = p2.latitude - p1.latitude;
    double dLon = p2.longitude - p1.longitude;
    double sinHalfLat = std::sin(dLat / 2);
    double sinHalfLon = std::sin(dLon / 2);
    double a = sinHalfLat * sinHalfLat +
               std::cos(p1.latitude) * std::cos(p2.latitude) * sinHalfLon * sinHalfLon;

    // Rounding can push a just outside [0, 1] for identical or antipodal points
    if (a > 1.0) a = 1.0;
    else if (a < 0.0) a = 0.0;

    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
    return radius * c;
}

double InitialBearing(const GeographicPoint &p1, const GeographicPoint &p2)
{
    double phi1 = p1.latitude;
    double phi2 = p2.latitude;
    double dLon = p2.longitude - p1.longitude;

    double y = std::sin(dLon) * std::cos(phi2);
    double x = std::cos(phi1) * std::sin(phi2) - std::sin(phi1) * std::cos(phi2) * std::cos(dLon);
    return ZeroToTwoPi(std::atan2(y, x));
}

GeographicPoint Destination(const GeographicPoint &p, double distance, double initial_bearing,
                            double radius)
{
    double delta = distance / radius; // angular distance
    double theta = initial_bearing;
    double phi1 = p.latitude;

    double sinPhi2 = std::sin(phi1) * std::cos(delta) +
                     std::cos(phi1) * std::sin(delta) * std::cos(theta);
    // Near the poles sinPhi2 can overshoot [-1, 1] by a rounding epsilon
    if (sinPhi2 > 1.0) sinPhi2 = 1.0;
    else if (sinPhi2 < -1.0) sinPhi2 = -1.0;
    double phi2 = std::asin(sinPhi2);

    double y = std::sin(theta) * std::sin(delta) * std::cos(phi1);
    double x = std::cos(delta) - std::sin(phi1) * sinPhi2;

    GeographicPoint result;
    result.latitude = phi2;
    result.longitude = p.longitude + std::atan2(y, x);
    result.height = 0.0;
    return result;
}

double ZeroToTwoPi(double angle)
{
    double r = std::fmod(angle, TWO_PI);
    if (r < 0)
        r += TWO_PI;
    // -tiny + 2pi rounds to exactly 2pi
    if (r >= TWO_PI)
        r = 0.0;
    return r;
}

} // namespace great_circle
