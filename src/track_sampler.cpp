/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/track_sampler.hpp>
#include <groundtrack/errors.hpp>
#include <groundtrack/propagator.hpp>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace groundtrack {

namespace {

using time_duration = time_point::duration;

struct Point {
    GeodeticSample sample;
    Vec3 direction;     ///< Unit vector toward the sub-satellite point, Earth-fixed
};

struct Interval {
    double angle;
    time_point start;
    time_point end;

    bool operator<(const Interval& other) const {
        return angle < other.angle;
    }
};

/**
 * State of a single call to TrackSampler::sample.
 */
class SamplingRun {
public:
    SamplingRun(const ElementStore& store, int catalogNumber, std::chrono::milliseconds budget)
        : store(store), catalogNumber(catalogNumber), budget(budget),
          deadline(std::chrono::steady_clock::now() + budget) {}

    /**
     * Propagate to one instant, or return nothing if the sample is unusable.
     */
    std::optional<Point> evaluate(time_point at) {
        checkDeadline();
        ++evaluations;

        auto resolution = store.resolve(catalogNumber, at);
        auto it = propagators.find(resolution.record);
        if (it == propagators.end()) {
            std::unique_ptr<Propagator> propagator;
            try {
                propagator = std::make_unique<Propagator>(*resolution.record);
            } catch (const PropagationError &) {
                lastError = std::current_exception();
            }
            it = propagators.emplace(resolution.record, std::move(propagator)).first;
        }
        if (!it->second) {
            return std::nullopt;
        }

        try {
            StateVector state = it->second->propagate(at);
            GeodeticSample sample = toGeodetic(state.position, at);
            if (sample.altInKilometers < 0.0) {
                belowSurface = true;
                return std::nullopt;
            }
            Vec3 ecef = eciToECEF(state.position, gmst(toJulianDate(at)));
            return Point{sample, ecef.normalize()};
        } catch (const PropagationError &) {
            lastError = std::current_exception();
            return std::nullopt;
        }
    }

    int getEvaluations() const {
        return evaluations;
    }

    [[noreturn]] void fail() const {
        if (lastError) {
            std::rethrow_exception(lastError);
        }
        if (belowSurface) {
            throw SatelliteDecayed();
        }
        throw DegenerateOrbit("fewer than two valid samples for object " + std::to_string(catalogNumber));
    }

private:
    void checkDeadline() const {
        if (std::chrono::steady_clock::now() > deadline) {
            throw PropagationDiverged("sampling object " + std::to_string(catalogNumber) +
                                      " exceeded its time budget of " +
                                      std::to_string(budget.count()) + " ms");
        }
    }

    const ElementStore& store;
    const int catalogNumber;
    const std::chrono::milliseconds budget;
    const std::chrono::steady_clock::time_point deadline;

    std::map<ElementRecordPtr, std::unique_ptr<Propagator>> propagators;  // null if initialization failed
    std::exception_ptr lastError;
    bool belowSurface = false;
    int evaluations = 0;
};

time_point midpoint(time_point start, time_point end) {
    return start + (end - start) / 2;
}

}

TrackSampler::TrackSampler(const ElementStore& store, SamplerOptions options)
    : store(store), options(options) {}

const SamplerOptions& TrackSampler::getOptions() const {
    return options;
}

std::vector<GeodeticSample> TrackSampler::sample(int catalogNumber, time_point windowStart,
                                                 time_point windowEnd, int targetPointCount) const {
    if (windowEnd <= windowStart) {
        throw std::invalid_argument("Sampling window end must be after its start");
    }
    if (targetPointCount < 2) {
        throw std::invalid_argument("At least 2 sample points are required");
    }
    if (!store.contains(catalogNumber)) {
        throw UnknownObject(catalogNumber);
    }

    SamplingRun run(store, catalogNumber, options.timeBudget);
    std::map<time_point, std::optional<Point>> points;

    // Uniform grid including both endpoints, no denser than the clock resolution
    std::int64_t distinctInstants = static_cast<std::int64_t>((windowEnd - windowStart).count()) + 1;
    std::int64_t gridSize = std::clamp<std::int64_t>(targetPointCount / 2 + targetPointCount % 2, 2, distinctInstants);
    auto span = std::chrono::duration<double>(windowEnd - windowStart);
    for (std::int64_t i = 0; i < gridSize; ++i) {
        time_point t = (i == gridSize - 1)
            ? windowEnd
            : windowStart + std::chrono::duration_cast<time_duration>(span * (static_cast<double>(i) / (gridSize - 1)));
        if (points.contains(t)) continue;
        points.emplace(t, run.evaluate(t));
    }

    // Refine where the ground track bends fastest
    const double tolerance = options.angularToleranceInDegrees * DEGREES_TO_RADIANS;
    std::priority_queue<Interval> queue;
    auto enqueue = [&](time_point start, time_point end) {
        const auto &a = points.at(start);
        const auto &b = points.at(end);
        if (!a || !b) return;
        if (end - start < time_duration(2)) return;
        queue.push({angleBetween(a->direction, b->direction), start, end});
    };
    for (auto it = points.begin(), next = std::next(it); next != points.end(); ++it, ++next) {
        enqueue(it->first, next->first);
    }

    while (run.getEvaluations() < targetPointCount && !queue.empty() && queue.top().angle > tolerance) {
        Interval interval = queue.top();
        queue.pop();
        time_point mid = midpoint(interval.start, interval.end);
        points.emplace(mid, run.evaluate(mid));
        enqueue(interval.start, mid);
        enqueue(mid, interval.end);
    }

    std::vector<GeodeticSample> samples;
    samples.reserve(points.size());
    for (const auto &[t, point] : points) {
        if (point) {
            samples.push_back(point->sample);
        }
    }

    debug("Sampled object {} with {} points ({} evaluated)", catalogNumber, samples.size(), run.getEvaluations());

    if (samples.size() < 2) {
        run.fail();
    }
    return samples;
}

}
