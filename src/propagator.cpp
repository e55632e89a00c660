/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/propagator.hpp>

#include <chrono>

namespace groundtrack {

Propagator::Propagator(const ElementRecord& record) : epoch(record.getEpoch()) {
    sgp4::Elements elements{
        .epoch_jd = toJulianDate(record.getEpoch()),
        .bstar = record.getBstarDragTerm(),
        .inclination = record.getInclination() * DEGREES_TO_RADIANS,
        .raan = record.getRightAscensionOfAscendingNode() * DEGREES_TO_RADIANS,
        .eccentricity = record.getEccentricity(),
        .arg_perigee = record.getArgumentOfPerigee() * DEGREES_TO_RADIANS,
        .mean_anomaly = record.getMeanAnomaly() * DEGREES_TO_RADIANS,
        .mean_motion = record.getMeanMotion() * sgp4::TWO_PI / 1440.0
    };
    sgp4::initialize(state, elements);
}

StateVector Propagator::propagate(time_point at) const {
    using namespace std::chrono;

    // Time since epoch in minutes, taken from the clock difference to keep precision
    double tsince = duration_cast<duration<double, minutes::period>>(at - epoch).count();

    sgp4::Result result = sgp4::propagate(state, tsince);

    return {
        {result.r[0], result.r[1], result.r[2]},
        {result.v[0], result.v[1], result.v[2]}
    };
}

GeodeticSample Propagator::sample(time_point at) const {
    return toGeodetic(propagate(at).position, at);
}

time_point Propagator::getEpoch() const {
    return epoch;
}

bool Propagator::isDeepSpace() const {
    return state.method == 'd';
}

StateVector propagate(const ElementRecord& record, time_point at) {
    return Propagator(record).propagate(at);
}

}
