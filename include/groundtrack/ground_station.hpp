/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_GROUND_STATION_HPP
#define __GROUNDTRACK_GROUND_STATION_HPP

#include <string>
#include <string_view>

namespace groundtrack {

/**
 * A fixed reference point on the ground, supplied by configuration.
 */
struct GroundStation {
    std::string name;
    double latInDegrees;    ///< [-90, 90]
    double lonInDegrees;    ///< [-180, 180]

    bool operator==(const GroundStation& other) const = default;
};

/**
* Parse ground station information from a config string
* Format: "<name>:<latitude>:<longitude>"
* Example: "Svalbard:78.2298:15.4078"
*
* The name may itself contain ':'; the last two fields are always the coordinates.
*
* @throws std::invalid_argument if the string is malformed or out of range
*/
GroundStation parseGroundStation(std::string_view infoStr);

}

#endif
