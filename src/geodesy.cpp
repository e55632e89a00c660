/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/geodesy.hpp>

namespace groundtrack {

// Convert a time_point to Julian Date
double toJulianDate(time_point tp) {
    using namespace std::chrono;

    auto daysSinceEpoch = duration_cast<duration<double, days::period>>(
        tp.time_since_epoch()
    ).count();

    return UNIX_EPOCH_JD + daysSinceEpoch;
}

time_point fromJulianDate(double julianDate) {
    using namespace std::chrono;

    auto sinceEpoch = duration<double, days::period>(julianDate - UNIX_EPOCH_JD);
    return time_point(duration_cast<microseconds>(sinceEpoch));
}

// Greenwich Mean Sidereal Time in radians
double gmst(double julianDate) {
    // Julian centuries since J2000.0
    double T = (julianDate - J2000_JD) / DAYS_PER_JULIAN_CENTURY;

    double gmstInDegrees = GMST_AT_J2000
                    + EARTH_SIDEREAL_RATE * (julianDate - J2000_JD)
                    + GMST_T2_COEFF * T * T
                    - T * T * T / GMST_T3_DIVISOR;

    // Normalize to [0, 360)
    gmstInDegrees = std::fmod(gmstInDegrees, 360.0);
    if (gmstInDegrees < 0) gmstInDegrees += 360.0;

    return gmstInDegrees * DEGREES_TO_RADIANS;
}

// Rotate about the z axis by Greenwich Sidereal Time
Vec3 eciToECEF(const Vec3 &eci, double gst) {
    double cosGST = std::cos(gst);
    double sinGST = std::sin(gst);

    return {
         eci.x * cosGST + eci.y * sinGST,
        -eci.x * sinGST + eci.y * cosGST,
         eci.z
    };
}

Geodetic ecefToGeodetic(const Vec3 &ecef) {
    constexpr int maxIterations = 10;
    constexpr double tolerance = 1e-12;

    double x = ecef.x, y = ecef.y, z = ecef.z;
    double lon = std::atan2(y, x);
    double p = std::sqrt(x*x + y*y);

    double lat = std::atan2(z, p * (1 - WGS84_E2));  // initial guess
    for (int i = 0; i < maxIterations; ++i) {
        double sinLat = std::sin(lat);
        double N = WGS84_A / std::sqrt(1 - WGS84_E2 * sinLat * sinLat);
        double next = std::atan2(z + WGS84_E2 * N * sinLat, p);
        bool converged = std::fabs(next - lat) < tolerance;
        lat = next;
        if (converged) {
            break;
        }
    }

    // h = p cos(lat) + z sin(lat) - a^2 / N, finite at the poles where cos(lat) = 0
    double sinLat = std::sin(lat);
    double cosLat = std::cos(lat);
    double alt = p * cosLat + z * sinLat - WGS84_A * std::sqrt(1 - WGS84_E2 * sinLat * sinLat);

    return {lat, lon, alt};
}

Vec3 Geodetic::toECEF() const {
    double sinLat = std::sin(latInRadians);
    double cosLat = std::cos(latInRadians);
    double sinLon = std::sin(lonInRadians);
    double cosLon = std::cos(lonInRadians);

    // Radius of curvature in the prime vertical
    double N = WGS84_A / std::sqrt(1.0 - WGS84_E2 * sinLat * sinLat);

    return {
        (N + altInKilometers) * cosLat * cosLon,
        (N + altInKilometers) * cosLat * sinLon,
        (N * (1.0 - WGS84_E2) + altInKilometers) * sinLat
    };
}

GeodeticSample toGeodetic(const Vec3 &inertialPosition, time_point at) {
    double gst = gmst(toJulianDate(at));
    Geodetic geo = ecefToGeodetic(eciToECEF(inertialPosition, gst));
    return {
        .time = at,
        .latInDegrees = geo.latInRadians * RADIANS_TO_DEGREES,
        .lonInDegrees = geo.lonInRadians * RADIANS_TO_DEGREES,
        .altInKilometers = geo.altInKilometers
    };
}

// atan2(|a x b|, a . b) keeps precision for small angles where acos does not
double angleBetween(const Vec3 &a, const Vec3 &b) {
    return std::atan2(a.cross(b).magnitude(), a.dot(b));
}

}
