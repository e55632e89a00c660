/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_PROPAGATOR_HPP
#define __GROUNDTRACK_PROPAGATOR_HPP

#include <groundtrack/elements.hpp>
#include <groundtrack/geodesy.hpp>
#include <groundtrack/sgp4.hpp>

namespace groundtrack {

/**
 * Position and velocity in the TEME inertial frame.
 */
struct StateVector {
    Vec3 position;   ///< km
    Vec3 velocity;   ///< km/s
};

/**
 * SGP4/SDP4 propagator for a single element record.
 *
 * The model is initialized once in the constructor. propagate() is const
 * and has no side effects, so one Propagator may be shared between threads.
 *
 * Usage:
 *   Propagator propagator(record);
 *   StateVector state = propagator.propagate(time);
 */
class Propagator {
public:
    /**
     * @throws DegenerateOrbit if the record cannot be propagated at all
     */
    explicit Propagator(const ElementRecord& record);

    /**
     * Propagate to an instant. Times before the epoch are allowed.
     *
     * @throws DegenerateOrbit, SatelliteDecayed or PropagationDiverged
     */
    StateVector propagate(time_point at) const;

    /**
     * Propagate and convert to a geodetic ground-track sample.
     */
    GeodeticSample sample(time_point at) const;

    time_point getEpoch() const;

    /**
     * True when the deep-space (SDP4) branch is in use.
     */
    bool isDeepSpace() const;

private:
    time_point epoch;
    sgp4::State state;
};

/**
 * One-shot propagation of a record to an instant.
 */
StateVector propagate(const ElementRecord& record, time_point at);

}

#endif
