/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_COVERAGE_HPP
#define __GROUNDTRACK_COVERAGE_HPP

#include <groundtrack/errors.hpp>
#include <groundtrack/geodesy.hpp>

#include <vector>

namespace groundtrack {

constexpr double MEAN_EARTH_RADIUS_KM = 6371.0;     // Spherical Earth used for footprints
constexpr int DEFAULT_OUTLINE_VERTICES = 72;

/**
 * The ground area from which a satellite is seen above a minimum elevation.
 */
struct CoverageFootprint {
    int catalogNumber;
    GeodeticSample center;        ///< Sub-satellite point the footprint is centered on
    double radiusInKilometers;    ///< Ground distance from center to edge

    bool operator==(const CoverageFootprint& other) const = default;
};

/**
 * A point on the ground.
 */
struct LatLon {
    double latInDegrees;
    double lonInDegrees;
};

/**
 * Ground radius of the coverage circle for a satellite at the given altitude
 * seen from the ground at or above the given elevation:
 *
 *   sqrt((R+h)² − (R·cos e)²) − R·sin e, with R = 6371 km
 *
 * @throws InvalidAltitude if the altitude is not positive and finite
 * @throws InvalidElevationAngle if the angle is outside [0, 90)
 */
double coverageRadius(double altitudeInKilometers, double minimumElevationInDegrees);

/**
 * Footprint centered on a sample.
 */
CoverageFootprint computeFootprint(int catalogNumber, const GeodeticSample &center,
                                   double minimumElevationInDegrees);

/**
 * Points on the edge of the footprint, evenly spaced in bearing, with
 * longitudes normalized to [-180, 180].
 *
 * @throws std::invalid_argument if fewer than 3 vertices are requested
 */
std::vector<LatLon> coverageOutline(const CoverageFootprint &footprint,
                                    int vertices = DEFAULT_OUTLINE_VERTICES);

}

#endif
