/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_GEODESY_HPP
#define __GROUNDTRACK_GEODESY_HPP

#include <chrono>
#include <cmath>
#include <numbers>

namespace groundtrack {

using time_point = std::chrono::system_clock::time_point;

// Astronomical constants
constexpr double J2000_JD = 2451545.0;                      // Julian Date of J2000.0 epoch
constexpr double UNIX_EPOCH_JD = 2440587.5;                 // Julian Date of 1970-01-01T00:00:00Z
constexpr double DAYS_PER_JULIAN_CENTURY = 36525.0;         // Days in a Julian century
constexpr double GMST_AT_J2000 = 280.46061837;              // GMST at J2000.0 epoch (degrees)
constexpr double EARTH_SIDEREAL_RATE = 360.98564736629;     // Earth's rotation rate (deg/day)

// IAU polynomial correction coefficients for long-term variations in Earth's rotation
constexpr double GMST_T2_COEFF = 0.000387933;   // Quadratic correction for precession (T² term)
constexpr double GMST_T3_DIVISOR = 38710000.0;  // Cubic correction divisor (T³ term)

// WGS84 ellipsoid
constexpr double WGS84_A = 6378.137;                    // Semi-major axis (km) - equatorial radius
constexpr double WGS84_F = 1.0 / 298.257223563;         // Flattening
constexpr double WGS84_E2 = WGS84_F * (2 - WGS84_F);    // Eccentricity squared ≈ 0.00669437999014

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = std::numbers::pi / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / std::numbers::pi;

// ============================================================================
// Basic Data Types
// ============================================================================

/**
 * 3D vector in Cartesian coordinates.
 */
struct Vec3 {
    double x, y, z;

    Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    bool operator==(const Vec3& other) const = default;

    double magnitude() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    /**
     * Returns a unit vector (magnitude = 1) in the same direction as this vector.
     */
    Vec3 normalize() const {
        double mag = magnitude();
        return {x / mag, y / mag, z / mag};
    }
};

/**
 * Geodetic coordinates representing a position on or above Earth's surface.
 */
struct Geodetic {
    double latInRadians;      ///< Geodetic latitude (-π/2 to +π/2, positive = North)
    double lonInRadians;      ///< Longitude (-π to +π, positive = East)
    double altInKilometers;   ///< Altitude above the WGS84 ellipsoid surface

    Vec3 toECEF() const;
};

/**
 * A single point of a ground track.
 */
struct GeodeticSample {
    time_point time;
    double latInDegrees;      ///< [-90, 90]
    double lonInDegrees;      ///< [-180, 180]
    double altInKilometers;

    bool operator==(const GeodeticSample& other) const = default;
};

// ============================================================================
// Coordinate System Transformations and Time Functions
// ============================================================================

/**
 * Converts a time_point to Julian Date.
 */
double toJulianDate(time_point tp);

/**
 * Converts a Julian Date to a time_point (microsecond precision).
 */
time_point fromJulianDate(double julianDate);

/**
 * Computes Greenwich Mean Sidereal Time (GMST) for a given Julian Date.
 * @return GMST in radians, normalized to [0, 2π)
 */
double gmst(double julianDate);

/**
 * Converts Earth-Centered Inertial (ECI/TEME) to Earth-Centered Earth-Fixed (ECEF).
 */
Vec3 eciToECEF(const Vec3 &eci, double gst);

/**
 * Converts ECEF coordinates to WGS84 geodetic coordinates.
 *
 * Latitude is found by fixed-point iteration on the ellipsoid normal.
 * Altitude uses a form that stays finite at the poles.
 */
Geodetic ecefToGeodetic(const Vec3 &ecef);

/**
 * Converts an inertial (TEME) position at the given instant to a geodetic sample.
 */
GeodeticSample toGeodetic(const Vec3 &inertialPosition, time_point at);

/**
 * Angle in radians between the directions of two vectors.
 * Stable for nearly parallel vectors.
 */
double angleBetween(const Vec3 &a, const Vec3 &b);

}

#endif
