/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_API_HPP
#define __GROUNDTRACK_API_HPP

#include <groundtrack/element_store.hpp>
#include <groundtrack/snapshot_server.hpp>

#include <map>
#include <string>
#include <string_view>

namespace groundtrack {

struct HttpRequest {
    std::string method;
    std::string target;     ///< Path and query, e.g. /api/v1/snapshot?since=4
    std::string body;
};

struct HttpResponse {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
};

/**
 * Decode %XX escapes and '+' in a URL component.
 */
std::string urlDecode(std::string_view str);

/**
 * Split "a=1&b=2" into decoded key/value pairs.
 */
std::map<std::string, std::string> parseQuery(std::string_view query);

/**
 * Routes JSON API requests to the element store and snapshot server.
 *
 *   GET  /api/v1/snapshot[?since=N]
 *   GET  /api/v1/satellites
 *   GET  /api/v1/tracks?start=ISO&end=ISO[&points=N]
 *   GET  /api/v1/entities
 *   GET  /api/v1/stations
 *   GET  /api/v1/objects/{id}
 *   POST /api/v1/elements
 */
class ApiHandler {
public:
    ApiHandler(ElementStore& store, const SnapshotServer& server);

    /**
     * Never throws; failures become JSON error responses.
     */
    HttpResponse handle(const HttpRequest& request) const;

private:
    HttpResponse getSnapshot(const std::map<std::string, std::string>& query) const;
    HttpResponse getTracks(const std::map<std::string, std::string>& query) const;
    HttpResponse getObject(std::string_view id) const;
    HttpResponse postElements(const std::string& body) const;

    ElementStore& store;
    const SnapshotServer& server;
};

}

#endif
