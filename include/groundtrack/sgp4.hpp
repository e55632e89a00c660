/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * SGP4/SDP4 Satellite Propagation Module
 * Based on the Vallado reference implementation from CelesTrak.
 * See: https://celestrak.org/software/vallado-sw.php
 */

#ifndef __GROUNDTRACK_SGP4_HPP
#define __GROUNDTRACK_SGP4_HPP

#include <groundtrack/errors.hpp>

#include <numbers>

namespace groundtrack::sgp4 {

// ============================================================================
// SGP4 Constants
// ============================================================================

// WGS-72 constants, as used by the element sets themselves
constexpr double MU = 398600.8;                    // Earth gravitational parameter (km^3/s^2)
constexpr double RADIUS_EARTH_KM = 6378.135;       // Earth equatorial radius (km)
constexpr double J2 = 0.001082616;                 // Second gravitational zonal harmonic
constexpr double J3 = -0.00000253881;              // Third gravitational zonal harmonic
constexpr double J4 = -0.00000165597;              // Fourth gravitational zonal harmonic
constexpr double J3OJ2 = J3 / J2;
constexpr double XKE = 0.0743669161331734132;      // sqrt(GM) in Earth radii^1.5/min
constexpr double VKMPERSEC = RADIUS_EARTH_KM * XKE / 60.0;  // km/s per velocity unit
constexpr double TWO_PI = 2.0 * std::numbers::pi;
constexpr double X2O3 = 2.0 / 3.0;

constexpr int KEPLER_MAX_ITERATIONS = 50;          // Newton iteration cap for Kepler's equation
constexpr double KEPLER_TOLERANCE = 1.0e-12;

// ============================================================================
// SGP4 Data Structures
// ============================================================================

/**
 * SGP4/SDP4 state variables computed during initialization.
 * This struct holds all the precomputed coefficients needed for propagation
 * and is never modified by propagate().
 */
struct State {
    // Epoch in Julian Date (split for precision)
    double jdsatepoch = 0.0;      // Integer part
    double jdsatepochF = 0.0;     // Fractional part

    // Method flag: 'n' = near-earth (SGP4), 'd' = deep-space (SDP4)
    char method = 'n';

    bool isimp = false;           // Simple drag flag
    int irez = 0;                 // Resonance flag (0=none, 1=1-day, 2=0.5-day)

    // Common orbital parameters
    double a = 0.0;               // Semi-major axis (Earth radii)
    double alta = 0.0;            // Altitude at apogee (Earth radii)
    double altp = 0.0;            // Altitude at perigee (Earth radii)
    double argpo = 0.0;           // Argument of perigee (rad)
    double bstar = 0.0;           // Drag term
    double ecco = 0.0;            // Eccentricity
    double inclo = 0.0;           // Inclination (rad)
    double mo = 0.0;              // Mean anomaly (rad)
    double no_kozai = 0.0;        // Mean motion (Kozai, rad/min)
    double no_unkozai = 0.0;      // Mean motion (un-Kozai'd, rad/min)
    double nodeo = 0.0;           // Right ascension (rad)
    double gsto = 0.0;            // Greenwich sidereal time at epoch

    // Near-earth coefficients
    double aycof = 0.0;
    double con41 = 0.0;
    double cc1 = 0.0, cc4 = 0.0, cc5 = 0.0;
    double d2 = 0.0, d3 = 0.0, d4 = 0.0;
    double delmo = 0.0;
    double eta = 0.0;
    double argpdot = 0.0;
    double omgcof = 0.0;
    double sinmao = 0.0;
    double t2cof = 0.0, t3cof = 0.0, t4cof = 0.0, t5cof = 0.0;
    double x1mth2 = 0.0;
    double x7thm1 = 0.0;
    double mdot = 0.0;
    double nodedot = 0.0;
    double xlcof = 0.0;
    double xmcof = 0.0;
    double nodecf = 0.0;

    // Deep space lunar/solar periodic coefficients
    double e3 = 0.0, ee2 = 0.0;
    double peo = 0.0, pgho = 0.0, pho = 0.0, pinco = 0.0, plo = 0.0;
    double se2 = 0.0, se3 = 0.0, sgh2 = 0.0, sgh3 = 0.0, sgh4 = 0.0;
    double sh2 = 0.0, sh3 = 0.0, si2 = 0.0, si3 = 0.0, sl2 = 0.0;
    double sl3 = 0.0, sl4 = 0.0;
    double xgh2 = 0.0, xgh3 = 0.0, xgh4 = 0.0;
    double xh2 = 0.0, xh3 = 0.0;
    double xi2 = 0.0, xi3 = 0.0;
    double xl2 = 0.0, xl3 = 0.0, xl4 = 0.0;
    double zmol = 0.0, zmos = 0.0;

    // Deep space secular rates and resonance coefficients
    double dedt = 0.0, didt = 0.0, dmdt = 0.0;
    double dnodt = 0.0, domdt = 0.0;
    double d2201 = 0.0, d2211 = 0.0;
    double d3210 = 0.0, d3222 = 0.0;
    double d4410 = 0.0, d4422 = 0.0;
    double d5220 = 0.0, d5232 = 0.0, d5421 = 0.0, d5433 = 0.0;
    double del1 = 0.0, del2 = 0.0, del3 = 0.0;
    double xfact = 0.0;
    double xlamo = 0.0;
};

/**
 * Input elements from TLE data for SGP4 initialization.
 */
struct Elements {
    double epoch_jd;           // Epoch as Julian Date
    double bstar;              // BSTAR drag term
    double inclination;        // Inclination (radians)
    double raan;               // Right ascension of ascending node (radians)
    double eccentricity;       // Eccentricity
    double arg_perigee;        // Argument of perigee (radians)
    double mean_anomaly;       // Mean anomaly (radians)
    double mean_motion;        // Mean motion (rad/min)
};

/**
 * Output from SGP4 propagation.
 */
struct Result {
    double r[3];  // Position (km) in TEME frame
    double v[3];  // Velocity (km/s) in TEME frame
};

// ============================================================================
// SGP4 Public API
// ============================================================================

/**
 * Initialize SGP4 state from orbital elements.
 *
 * @param state Output state structure to initialize
 * @param elements Input orbital elements from TLE
 * @throws DegenerateOrbit if the elements do not describe a bound orbit
 *         above the Earth's surface
 */
void initialize(State& state, const Elements& elements);

/**
 * Solve Kepler's equation for the eccentric longitude by Newton iteration.
 * axnl and aynl are the eccentricity vector components e*cos(w) and e*sin(w).
 *
 * @throws PropagationDiverged if the iteration does not converge within maxIterations
 */
double solveKepler(double u, double axnl, double aynl, int maxIterations = KEPLER_MAX_ITERATIONS);

/**
 * Propagate to time since epoch.
 *
 * The deep-space resonance integrator always restarts from epoch, so the
 * result depends only on the state and tsince.
 *
 * @param state The initialized SGP4 state (from initialize())
 * @param tsince Minutes since epoch
 * @return Result containing position and velocity
 * @throws DegenerateOrbit if the mean elements leave their valid range
 * @throws SatelliteDecayed if the satellite has decayed
 * @throws PropagationDiverged if Kepler's equation does not converge
 */
Result propagate(const State& state, double tsince);

/**
 * Compute Greenwich Sidereal Time at a given Julian Date (IAU-82).
 */
double gstime(double jdut1);

} // namespace groundtrack::sgp4

#endif // __GROUNDTRACK_SGP4_HPP
