/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_ERRORS_HPP
#define __GROUNDTRACK_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace groundtrack {

// ============================================================================
// Ingestion Errors
// ============================================================================

/**
 * Thrown when an element set fails fixed-width field, line number,
 * catalog number or checksum validation. Nothing is stored.
 */
class InvalidElementFormat : public std::runtime_error {
public:
    explicit InvalidElementFormat(const std::string& msg)
        : std::runtime_error("Invalid element set: " + msg) {}
};

/**
 * Thrown when an object has no element records in the store.
 */
class UnknownObject : public std::runtime_error {
public:
    explicit UnknownObject(int catalogNumber)
        : std::runtime_error("Unknown object: " + std::to_string(catalogNumber)),
          catalogNumber(catalogNumber) {}

    const int catalogNumber;
};

// ============================================================================
// Propagation Errors
// ============================================================================

/**
 * Base class for errors that exclude an object from a snapshot cycle.
 */
class PropagationError : public std::runtime_error {
public:
    explicit PropagationError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * The orbit described by the elements cannot be propagated
 * (eccentricity outside [0,1), non-positive mean motion, ...).
 */
class DegenerateOrbit : public PropagationError {
public:
    explicit DegenerateOrbit(const std::string& msg) : PropagationError("Degenerate orbit: " + msg) {}
};

/**
 * The propagated radius fell below the Earth's surface.
 */
class SatelliteDecayed : public DegenerateOrbit {
public:
    SatelliteDecayed() : DegenerateOrbit("satellite has decayed") {}
};

/**
 * An iterative step failed to converge, or an object exceeded its time budget.
 */
class PropagationDiverged : public PropagationError {
public:
    explicit PropagationDiverged(const std::string& msg) : PropagationError("Propagation diverged: " + msg) {}
};

// ============================================================================
// Coverage Errors
// ============================================================================

class CoverageError : public std::runtime_error {
public:
    explicit CoverageError(const std::string& msg) : std::runtime_error(msg) {}
};

class InvalidAltitude : public CoverageError {
public:
    explicit InvalidAltitude(double altitudeInKilometers)
        : CoverageError("Invalid altitude: " + std::to_string(altitudeInKilometers) + " km") {}
};

class InvalidElevationAngle : public CoverageError {
public:
    explicit InvalidElevationAngle(double elevationInDegrees)
        : CoverageError("Invalid minimum elevation angle: " + std::to_string(elevationInDegrees) + " deg") {}
};

}

#endif
