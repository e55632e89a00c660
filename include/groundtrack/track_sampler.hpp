/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_TRACK_SAMPLER_HPP
#define __GROUNDTRACK_TRACK_SAMPLER_HPP

#include <groundtrack/element_store.hpp>
#include <groundtrack/geodesy.hpp>

#include <chrono>
#include <vector>

namespace groundtrack {

constexpr double DEFAULT_ANGULAR_TOLERANCE_DEGREES = 0.5;
constexpr std::chrono::milliseconds DEFAULT_OBJECT_TIME_BUDGET{2000};

struct SamplerOptions {
    /// Intervals whose endpoints differ by no more than this are not refined
    double angularToleranceInDegrees = DEFAULT_ANGULAR_TOLERANCE_DEGREES;
    /// Wall-clock limit for sampling one object
    std::chrono::milliseconds timeBudget = DEFAULT_OBJECT_TIME_BUDGET;
};

/**
 * Adaptive ground-track sampler.
 *
 * Starts from a uniform grid over the window and bisects the interval with
 * the largest change in Earth-fixed direction until the point budget is used
 * or every interval is within tolerance. Each sample is propagated from the
 * element record that applies at its own time.
 */
class TrackSampler {
public:
    TrackSampler(const ElementStore& store, SamplerOptions options = {});

    /**
     * Sample an object's ground track over [windowStart, windowEnd].
     *
     * Samples that cannot be propagated, or that fall below the surface, are
     * left out. The result has strictly increasing times, at most
     * targetPointCount entries, and at least two.
     *
     * @throws std::invalid_argument if windowEnd <= windowStart or targetPointCount < 2
     * @throws UnknownObject if the store has no records for the object
     * @throws PropagationError if fewer than two samples are valid, or the
     *         time budget is exceeded (PropagationDiverged)
     */
    std::vector<GeodeticSample> sample(int catalogNumber, time_point windowStart,
                                       time_point windowEnd, int targetPointCount) const;

    const SamplerOptions& getOptions() const;

private:
    const ElementStore& store;
    SamplerOptions options;
};

}

#endif
