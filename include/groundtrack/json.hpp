/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_JSON_HPP
#define __GROUNDTRACK_JSON_HPP

#include <groundtrack/element_store.hpp>
#include <groundtrack/entity.hpp>
#include <groundtrack/snapshot_server.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace groundtrack {

/**
 * Body of an element submission request.
 * Format: {"id": 25544, "name": "ISS (ZARYA)", "epoch": "...", "line1": "...", "line2": "..."}
 */
struct ElementSubmission {
    int catalogNumber;
    std::string name;
    std::optional<time_point> epoch;
    std::string line1;
    std::string line2;
};

/**
 * ISO-8601 UTC with millisecond precision, e.g. 2025-11-29T20:01:44.058Z
 */
std::string formatTimestamp(time_point tp);

/**
 * Parse an ISO-8601 UTC timestamp. Accepts "YYYY-MM-DDTHH:MM:SS[.fff][Z]"
 * and "YYYY-MM-DD HH:MM:SS".
 *
 * @throws std::invalid_argument if the string is not a timestamp
 */
time_point parseTimestamp(const std::string &str);

std::string snapshotToJson(const Snapshot &snapshot, const std::vector<GroundStation> &stations);
std::string deltaToJson(const Delta &delta, std::uint64_t since);
std::string fullSnapshotRequiredToJson(const FullSnapshotRequired &required);
std::string entitiesToJson(const std::vector<Entity> &entities);
std::string stationsToJson(const std::vector<GroundStation> &stations);
std::string objectToJson(int catalogNumber, const std::string &name, const std::vector<ElementRecordPtr> &records);
std::string submissionResultToJson(int catalogNumber, bool stored);
std::string errorToJson(const std::string &error, const std::string &message);

/**
 * @throws std::invalid_argument if the body is not a valid submission
 */
ElementSubmission parseElementSubmission(const std::string &body);

}

#endif
