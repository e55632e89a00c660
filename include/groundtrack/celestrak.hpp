/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_CELESTRAK_HPP
#define __GROUNDTRACK_CELESTRAK_HPP

#include <groundtrack/element_log.hpp>
#include <groundtrack/element_store.hpp>

#include <string>
#include <vector>

namespace groundtrack::celestrak {

/**
 * A single TLE entry containing the satellite name and two-line elements
 */
struct TLEEntry {
    std::string name;
    std::string line1;
    std::string line2;
};

/**
 * Response containing the TLE entries returned by one query
 */
struct TLEResponse {
    std::string query;
    std::vector<TLEEntry> entries;
};

/**
 * URL of the GP endpoint for a satellite group, in TLE format
 */
std::string groupURL(const std::string& group);

/**
 * URL of the GP endpoint for a single catalog number, in TLE format
 */
std::string catalogNumberURL(int catalogNumber);

/**
 * Split a TLE format response into entries.
 * Accepts both three-line (name, line 1, line 2) and two-line entries.
 */
std::vector<TLEEntry> parseTLEResponse(const std::string& response);

/**
 * Download TLE data for a satellite group from Celestrak
 * @param group The group name (e.g., "active", "stations", "weather", etc.)
 *              Defaults to "active" if empty
 * @return TLE data for all satellites in the group
 * @throws std::runtime_error if the download fails
 */
TLEResponse getTLE(const std::string& group = "active");

/**
 * Download the current TLE for one object from Celestrak
 * @throws std::runtime_error if the download fails or no data is found
 */
TLEResponse getTLEByCatalogNumber(int catalogNumber);

/**
 * Submit every entry of a response to the store. Malformed entries are
 * logged and counted as rejected.
 */
LoadResult submitAll(const TLEResponse& response, ElementStore& store);

} // namespace groundtrack::celestrak

#endif
