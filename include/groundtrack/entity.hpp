/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_ENTITY_HPP
#define __GROUNDTRACK_ENTITY_HPP

#include <groundtrack/coverage.hpp>
#include <groundtrack/geodesy.hpp>
#include <groundtrack/ground_station.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace groundtrack {

/**
 * The predicted ground track of one satellite over a prediction window.
 */
struct SatelliteTrack {
    int catalogNumber;
    std::string name;
    std::vector<GeodeticSample> samples;            ///< Strictly increasing in time
    std::optional<CoverageFootprint> coverage;      ///< Footprint at the first sample

    bool operator==(const SatelliteTrack& other) const = default;
};

/**
 * Anything the service can show on a map.
 */
using Entity = std::variant<SatelliteTrack, CoverageFootprint, GroundStation>;

/**
 * An object that could not be tracked during a cycle.
 */
struct Exclusion {
    int catalogNumber;
    std::string reason;
};

/**
 * What happened to one tracked object during a cycle.
 */
using CycleOutcome = std::variant<SatelliteTrack, Exclusion>;

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

}

#endif
