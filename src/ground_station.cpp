/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/ground_station.hpp>

#include <charconv>
#include <cmath>
#include <stdexcept>
#include <string>

namespace groundtrack {

namespace {

double toCoordinate(std::string_view str, const std::string_view &infoStr) {
    while (!str.empty() && str.front() == ' ') str.remove_prefix(1);
    while (!str.empty() && str.back() == ' ') str.remove_suffix(1);
    if (str.starts_with('+')) str.remove_prefix(1);

    double value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (str.empty() || ec != std::errc() || ptr != str.data() + str.size() || !std::isfinite(value)) {
        throw std::invalid_argument("Invalid coordinate '" + std::string(str) +
                                    "' in ground station: " + std::string(infoStr));
    }
    return value;
}

}

GroundStation parseGroundStation(std::string_view infoStr) {
    auto lonSep = infoStr.rfind(':');
    if (lonSep == std::string_view::npos || lonSep == 0) {
        throw std::invalid_argument("Invalid ground station string (expected name:lat:lon): " + std::string(infoStr));
    }
    auto latSep = infoStr.rfind(':', lonSep - 1);
    if (latSep == std::string_view::npos) {
        throw std::invalid_argument("Invalid ground station string (expected name:lat:lon): " + std::string(infoStr));
    }

    GroundStation station;
    station.name = std::string(infoStr.substr(0, latSep));
    if (station.name.empty()) {
        throw std::invalid_argument("Ground station name is empty: " + std::string(infoStr));
    }

    station.latInDegrees = toCoordinate(infoStr.substr(latSep + 1, lonSep - latSep - 1), infoStr);
    station.lonInDegrees = toCoordinate(infoStr.substr(lonSep + 1), infoStr);

    if (station.latInDegrees < -90.0 || station.latInDegrees > 90.0) {
        throw std::invalid_argument("Ground station latitude out of range: " + std::string(infoStr));
    }
    if (station.lonInDegrees < -180.0 || station.lonInDegrees > 180.0) {
        throw std::invalid_argument("Ground station longitude out of range: " + std::string(infoStr));
    }

    return station;
}

}
