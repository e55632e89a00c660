/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/coverage.hpp>

#include <cmath>
#include <numbers>
#include <stdexcept>

namespace groundtrack {

double coverageRadius(double altitudeInKilometers, double minimumElevationInDegrees) {
    if (!std::isfinite(altitudeInKilometers) || altitudeInKilometers <= 0.0) {
        throw InvalidAltitude(altitudeInKilometers);
    }
    if (!std::isfinite(minimumElevationInDegrees) ||
        minimumElevationInDegrees < 0.0 || minimumElevationInDegrees >= 90.0) {
        throw InvalidElevationAngle(minimumElevationInDegrees);
    }

    constexpr double R = MEAN_EARTH_RADIUS_KM;
    double e = minimumElevationInDegrees * DEGREES_TO_RADIANS;
    double rh = R + altitudeInKilometers;
    double rcos = R * std::cos(e);

    return std::sqrt(rh * rh - rcos * rcos) - R * std::sin(e);
}

CoverageFootprint computeFootprint(int catalogNumber, const GeodeticSample &center,
                                   double minimumElevationInDegrees) {
    return {
        .catalogNumber = catalogNumber,
        .center = center,
        .radiusInKilometers = coverageRadius(center.altInKilometers, minimumElevationInDegrees)
    };
}

std::vector<LatLon> coverageOutline(const CoverageFootprint &footprint, int vertices) {
    if (vertices < 3) {
        throw std::invalid_argument("A coverage outline needs at least 3 vertices");
    }

    double lat1 = footprint.center.latInDegrees * DEGREES_TO_RADIANS;
    double lon1 = footprint.center.lonInDegrees * DEGREES_TO_RADIANS;
    double delta = footprint.radiusInKilometers / MEAN_EARTH_RADIUS_KM;  // angular radius
    double sinLat1 = std::sin(lat1);
    double cosLat1 = std::cos(lat1);
    double sinDelta = std::sin(delta);
    double cosDelta = std::cos(delta);

    std::vector<LatLon> outline;
    outline.reserve(vertices);
    for (int i = 0; i < vertices; ++i) {
        double bearing = 2.0 * std::numbers::pi * i / vertices;
        double lat2 = std::asin(sinLat1 * cosDelta + cosLat1 * sinDelta * std::cos(bearing));
        double lon2 = lon1 + std::atan2(std::sin(bearing) * sinDelta * cosLat1,
                                        cosDelta - sinLat1 * std::sin(lat2));

        double lonInDegrees = std::remainder(lon2 * RADIANS_TO_DEGREES, 360.0);
        outline.push_back({lat2 * RADIANS_TO_DEGREES, lonInDegrees});
    }
    return outline;
}

}
