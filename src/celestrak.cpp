/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/celestrak.hpp>
#include <groundtrack/errors.hpp>

#include <curlpp/cURLpp.hpp>
#include <curlpp/Easy.hpp>
#include <curlpp/Options.hpp>
#include <spdlog/spdlog.h>

#include <sstream>
#include <stdexcept>

using spdlog::debug;
using spdlog::warn;

namespace groundtrack::celestrak {

// Celestrak GP data URL
// Documentation: https://celestrak.org/NORAD/documentation/gp-data-formats.php
#define BASE_URI "https://celestrak.org/NORAD/elements/gp.php"

namespace {

std::string doGet(const std::string& url) {
    // Initialize curlpp
    curlpp::Cleanup cleaner;
    curlpp::Easy request;

    debug("GET {}", url);

    // Set up the request
    request.setOpt(new curlpp::options::Url(url));
    request.setOpt(new curlpp::options::FollowLocation(true));

    // Perform the request and capture response
    std::ostringstream responseStream;
    request.setOpt(new curlpp::options::WriteStream(&responseStream));

    try {
        request.perform();
    } catch (curlpp::RuntimeError& e) {
        throw std::runtime_error(std::string("HTTP request failed: ") + e.what());
    } catch (curlpp::LogicError& e) {
        throw std::runtime_error(std::string("HTTP logic error: ") + e.what());
    }

    std::string response = responseStream.str();
    debug("Response length: {} bytes", response.length());
    return response;
}

// Helper function to trim whitespace from both ends of a string
std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

TLEResponse fetch(const std::string& url, const std::string& query) {
    std::string response = doGet(url);

    // Check for error responses
    if (response.find("No GP data found") != std::string::npos) {
        throw std::runtime_error("Celestrak error: No GP data found for " + query);
    }

    auto entries = parseTLEResponse(response);
    if (entries.empty() && !trim(response).empty()) {
        throw std::runtime_error("Failed to parse TLE data from Celestrak response");
    }

    return TLEResponse{
        .query = query,
        .entries = std::move(entries)
    };
}

}

std::string groupURL(const std::string& group) {
    std::ostringstream urlBuilder;
    urlBuilder << BASE_URI << "?GROUP=" << group << "&FORMAT=tle";
    return urlBuilder.str();
}

std::string catalogNumberURL(int catalogNumber) {
    std::ostringstream urlBuilder;
    urlBuilder << BASE_URI << "?CATNR=" << catalogNumber << "&FORMAT=tle";
    return urlBuilder.str();
}

std::vector<TLEEntry> parseTLEResponse(const std::string& response) {
    std::vector<TLEEntry> entries;
    std::istringstream stream(response);
    std::string line;
    std::string name;
    std::string line1;

    while (std::getline(stream, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty()) {
            continue;
        }
        if (trimmed.starts_with("1 ")) {
            line1 = trimmed;
        } else if (trimmed.starts_with("2 ") && !line1.empty()) {
            entries.push_back({name, line1, trimmed});
            name.clear();
            line1.clear();
        } else {
            // A name line, or the start of a new entry after a broken one
            line1.clear();
            name = trimmed;
        }
    }
    return entries;
}

TLEResponse getTLE(const std::string& group) {
    // Use "active" as default if group is empty
    std::string groupName = group.empty() ? "active" : group;
    return fetch(groupURL(groupName), "group '" + groupName + "'");
}

TLEResponse getTLEByCatalogNumber(int catalogNumber) {
    return fetch(catalogNumberURL(catalogNumber), "catalog number " + std::to_string(catalogNumber));
}

LoadResult submitAll(const TLEResponse& response, ElementStore& store) {
    LoadResult result;
    for (const auto& entry : response.entries) {
        try {
            auto record = ElementRecord::parse(entry.line1, entry.line2);
            if (store.put(record.getCatalogNumber(), record, entry.name)) {
                result.accepted++;
            } else {
                result.duplicates++;
            }
        } catch (const InvalidElementFormat& e) {
            warn("Skipping Celestrak entry '{}': {}", entry.name, e.what());
            result.rejected++;
        }
    }
    debug("Submitted {} element sets from {} ({} duplicates, {} rejected)",
          result.accepted, response.query, result.duplicates, result.rejected);
    return result;
}

} // namespace groundtrack::celestrak
