/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/api.hpp>
#include <groundtrack/errors.hpp>
#include <groundtrack/json.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <curlpp/cURLpp.hpp>
#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::error;

namespace groundtrack {

namespace {

constexpr std::string_view API_PREFIX = "/api/v1/";

HttpResponse jsonResponse(int status, std::string body) {
    return {.status = status, .contentType = "application/json", .body = std::move(body)};
}

HttpResponse errorResponse(int status, const std::string &error, const std::string &message) {
    return jsonResponse(status, errorToJson(error, message));
}

template<typename T>
T parseNumber(std::string_view str, const char *name) {
    T value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (str.empty() || ec != std::errc() || ptr != str.data() + str.size()) {
        throw std::invalid_argument(std::string("Invalid value for ") + name + ": " + std::string(str));
    }
    return value;
}

}

std::string urlDecode(std::string_view str) {
    std::string plusDecoded(str);
    std::replace(plusDecoded.begin(), plusDecoded.end(), '+', ' ');
    return curlpp::unescape(plusDecoded);
}

std::map<std::string, std::string> parseQuery(std::string_view query) {
    std::map<std::string, std::string> params;
    if (query.empty()) {
        return params;
    }

    std::vector<std::string> pairs;
    boost::split(pairs, std::string(query), boost::is_any_of("&"));
    for (const auto &pair : pairs) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            params[urlDecode(pair)] = "";
        } else {
            params[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
        }
    }
    return params;
}

ApiHandler::ApiHandler(ElementStore& store, const SnapshotServer& server)
    : store(store), server(server) {}

HttpResponse ApiHandler::handle(const HttpRequest& request) const {
    std::string_view target = request.target;
    std::string_view path = target.substr(0, target.find('?'));
    std::string_view queryString;
    if (auto q = target.find('?'); q != std::string_view::npos) {
        queryString = target.substr(q + 1);
    }

    debug("{} {}", request.method, request.target);

    try {
        if (!path.starts_with(API_PREFIX)) {
            return errorResponse(404, "NotFound", "No such resource: " + std::string(path));
        }
        std::string_view route = path.substr(API_PREFIX.size());
        bool isGet = request.method == "GET";

        if (route == "elements") {
            if (request.method != "POST") {
                return errorResponse(405, "MethodNotAllowed", "Use POST for " + std::string(path));
            }
            return postElements(request.body);
        }

        if (route == "snapshot" || route == "satellites" || route == "tracks" ||
            route == "entities" || route == "stations" || route.starts_with("objects/")) {
            if (!isGet) {
                return errorResponse(405, "MethodNotAllowed", "Use GET for " + std::string(path));
            }
        }

        auto query = parseQuery(queryString);
        if (route == "snapshot") {
            return getSnapshot(query);
        }
        if (route == "satellites") {
            return jsonResponse(200, snapshotToJson(*server.currentSnapshot(), server.getGroundStations()));
        }
        if (route == "tracks") {
            return getTracks(query);
        }
        if (route == "entities") {
            return jsonResponse(200, entitiesToJson(server.entities()));
        }
        if (route == "stations") {
            return jsonResponse(200, stationsToJson(server.getGroundStations()));
        }
        if (route.starts_with("objects/")) {
            return getObject(route.substr(8));
        }

        return errorResponse(404, "NotFound", "No such resource: " + std::string(path));
    } catch (const InvalidElementFormat &e) {
        return errorResponse(400, "InvalidElementFormat", e.what());
    } catch (const UnknownObject &e) {
        return errorResponse(404, "UnknownObject", e.what());
    } catch (const std::invalid_argument &e) {
        return errorResponse(400, "BadRequest", e.what());
    } catch (const std::exception &e) {
        error("Request {} {} failed: {}", request.method, request.target, e.what());
        return errorResponse(500, "InternalError", e.what());
    }
}

HttpResponse ApiHandler::getSnapshot(const std::map<std::string, std::string>& query) const {
    std::optional<std::uint64_t> since;
    if (auto it = query.find("since"); it != query.end()) {
        since = parseNumber<std::uint64_t>(it->second, "since");
    }

    auto result = server.poll(since);
    return std::visit(overloaded {
        [&](const SnapshotPtr &snapshot) {
            return jsonResponse(200, snapshotToJson(*snapshot, server.getGroundStations()));
        },
        [&](const Delta &delta) {
            return jsonResponse(200, deltaToJson(delta, *since));
        },
        [&](const FullSnapshotRequired &required) {
            return jsonResponse(200, fullSnapshotRequiredToJson(required));
        }
    }, result);
}

HttpResponse ApiHandler::getTracks(const std::map<std::string, std::string>& query) const {
    auto start = query.find("start");
    auto end = query.find("end");
    if (start == query.end() || end == query.end()) {
        throw std::invalid_argument("Both start and end are required");
    }

    int points = server.getOptions().targetPointCount;
    if (auto it = query.find("points"); it != query.end()) {
        points = parseNumber<int>(it->second, "points");
    }

    auto snapshot = server.windowSnapshot(parseTimestamp(start->second), parseTimestamp(end->second), points);
    return jsonResponse(200, snapshotToJson(snapshot, server.getGroundStations()));
}

HttpResponse ApiHandler::getObject(std::string_view id) const {
    int catalogNumber = parseNumber<int>(id, "id");
    auto records = store.records(catalogNumber);
    if (records.empty()) {
        throw UnknownObject(catalogNumber);
    }
    return jsonResponse(200, objectToJson(catalogNumber, store.name(catalogNumber), records));
}

HttpResponse ApiHandler::postElements(const std::string& body) const {
    auto submission = parseElementSubmission(body);
    bool stored = submission.epoch
        ? store.submit(submission.catalogNumber, submission.name, *submission.epoch, submission.line1, submission.line2)
        : store.submit(submission.catalogNumber, submission.name, submission.line1, submission.line2);
    return jsonResponse(stored ? 201 : 200, submissionResultToJson(submission.catalogNumber, stored));
}

}
