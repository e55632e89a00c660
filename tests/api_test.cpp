/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <groundtrack/api.hpp>
#include <groundtrack/json.hpp>

#include <chrono>
#include <string>

#include <rapidjson/document.h>

namespace groundtrack {
namespace {

using namespace std::chrono;

constexpr const char* ISS_LINE1 = "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993";
constexpr const char* ISS_LINE2 = "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";
constexpr const char* ISS_LATER_LINE1 = "1 25544U 98067A   25334.33453771  .00008010  00000+0  15237-3 0  9999";
constexpr const char* NOAA19_LINE1 = "1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999";
constexpr const char* NOAA19_LINE2 = "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318";

std::string submissionBody(int id, const std::string &line1, const std::string &line2,
                           const std::string &epoch = "") {
    std::string body = "{\"id\": " + std::to_string(id) + ", \"name\": \"ISS (ZARYA)\", ";
    if (!epoch.empty()) {
        body += "\"epoch\": \"" + epoch + "\", ";
    }
    body += "\"line1\": \"" + line1 + "\", \"line2\": \"" + line2 + "\"}";
    return body;
}

class ApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.submit(25544, "ISS (ZARYA)", ISS_LINE1, ISS_LINE2);
        store.submit(33591, "NOAA 19", NOAA19_LINE1, NOAA19_LINE2);
        server.runCycle(now);
    }

    HttpResponse get(const std::string &target) {
        return handler.handle({.method = "GET", .target = target, .body = ""});
    }

    HttpResponse post(const std::string &target, const std::string &body) {
        return handler.handle({.method = "POST", .target = target, .body = body});
    }

    static rapidjson::Document parse(const HttpResponse &response) {
        rapidjson::Document doc;
        doc.Parse(response.body.c_str());
        EXPECT_FALSE(doc.HasParseError()) << response.body;
        EXPECT_EQ(response.contentType, "application/json");
        return doc;
    }

    static std::string errorOf(const HttpResponse &response) {
        auto doc = parse(response);
        return doc["error"].GetString();
    }

    ElementStore store;
    time_point now = ElementRecord::parse(ISS_LINE1, ISS_LINE2).getEpoch();
    SnapshotServer server{store, ServerOptions{.targetPointCount = 12, .workerThreads = 2},
                          {{"Svalbard", 78.2298, 15.4078}}};
    ApiHandler handler{store, server};
};

// ============================================================================
// Query Strings
// ============================================================================

TEST(UrlDecodeTest, EscapesAndPlus) {
    EXPECT_EQ(urlDecode("2025-11-29T20%3A01%3A44Z"), "2025-11-29T20:01:44Z");
    EXPECT_EQ(urlDecode("ISS+%28ZARYA%29"), "ISS (ZARYA)");
    EXPECT_EQ(urlDecode("plain"), "plain");
}

TEST(UrlDecodeTest, MalformedEscapesAreKept) {
    EXPECT_EQ(urlDecode("100%"), "100%");
    EXPECT_EQ(urlDecode("%zz"), "%zz");
    EXPECT_EQ(urlDecode("%4"), "%4");
}

TEST(ParseQueryTest, Pairs) {
    auto query = parseQuery("since=4&points=10&flag&&name=a%20b");
    EXPECT_EQ(query.size(), 4);
    EXPECT_EQ(query["since"], "4");
    EXPECT_EQ(query["points"], "10");
    EXPECT_EQ(query["flag"], "");
    EXPECT_EQ(query["name"], "a b");
}

TEST(ParseQueryTest, Empty) {
    EXPECT_TRUE(parseQuery("").empty());
}

// ============================================================================
// Snapshots
// ============================================================================

TEST_F(ApiTest, Snapshot) {
    auto response = get("/api/v1/snapshot");
    ASSERT_EQ(response.status, 200);
    auto doc = parse(response);
    EXPECT_STREQ(doc["type"].GetString(), "snapshot");
    EXPECT_EQ(doc["sequence"].GetUint64(), 1);
    EXPECT_EQ(doc["objects"].Size(), 2);
    EXPECT_EQ(doc["stations"].Size(), 1);
}

TEST_F(ApiTest, SnapshotSinceReturnsDelta) {
    auto doc = parse(get("/api/v1/snapshot?since=0"));
    EXPECT_STREQ(doc["type"].GetString(), "delta");
    EXPECT_EQ(doc["since"].GetUint64(), 0);
    EXPECT_EQ(doc["sequence"].GetUint64(), 1);
    EXPECT_EQ(doc["adds"].Size(), 2);

    auto latest = parse(get("/api/v1/snapshot?since=1"));
    EXPECT_STREQ(latest["type"].GetString(), "delta");
    EXPECT_EQ(latest["adds"].Size(), 0);
}

TEST_F(ApiTest, SnapshotSinceFutureRequiresFullSnapshot) {
    auto response = get("/api/v1/snapshot?since=42");
    EXPECT_EQ(response.status, 200);
    auto doc = parse(response);
    EXPECT_STREQ(doc["type"].GetString(), "full_snapshot_required");
    EXPECT_EQ(doc["sequence"].GetUint64(), 1);
}

TEST_F(ApiTest, SnapshotSinceInvalid) {
    auto response = get("/api/v1/snapshot?since=abc");
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(errorOf(response), "BadRequest");
    EXPECT_EQ(get("/api/v1/snapshot?since=-1").status, 400);
}

TEST_F(ApiTest, Satellites) {
    auto doc = parse(get("/api/v1/satellites"));
    EXPECT_STREQ(doc["type"].GetString(), "snapshot");
    EXPECT_EQ(doc["objects"][0]["id"].GetInt(), 25544);
    EXPECT_EQ(doc["objects"][1]["id"].GetInt(), 33591);
}

TEST_F(ApiTest, Entities) {
    auto response = get("/api/v1/entities");
    ASSERT_EQ(response.status, 200);
    auto doc = parse(response);
    EXPECT_EQ(doc["entities"].Size(), 5);
}

TEST_F(ApiTest, Stations) {
    auto doc = parse(get("/api/v1/stations"));
    ASSERT_EQ(doc["stations"].Size(), 1);
    EXPECT_STREQ(doc["stations"][0]["name"].GetString(), "Svalbard");
}

// ============================================================================
// Explicit Windows
// ============================================================================

TEST_F(ApiTest, TracksOverWindow) {
    auto start = formatTimestamp(now + hours(1));
    auto end = formatTimestamp(now + hours(2));
    auto response = get("/api/v1/tracks?start=" + start + "&end=" + end + "&points=8");
    ASSERT_EQ(response.status, 200);

    auto doc = parse(response);
    EXPECT_STREQ(doc["window"]["start"].GetString(), start.c_str());
    EXPECT_STREQ(doc["window"]["end"].GetString(), end.c_str());
    ASSERT_EQ(doc["objects"].Size(), 2);
    EXPECT_LE(doc["objects"][0]["samples"].Size(), 8);
    EXPECT_STREQ(doc["objects"][0]["samples"][0]["t"].GetString(), start.c_str());
}

TEST_F(ApiTest, TracksWithEncodedTimestamps) {
    auto response = get("/api/v1/tracks?start=2025-11-29T21%3A00%3A00Z&end=2025-11-29T22%3A00%3A00Z");
    EXPECT_EQ(response.status, 200);
}

TEST_F(ApiTest, TracksInvalidWindow) {
    EXPECT_EQ(get("/api/v1/tracks?start=2025-11-29T21:00:00Z").status, 400);
    EXPECT_EQ(get("/api/v1/tracks?start=later&end=2025-11-29T22:00:00Z").status, 400);
    EXPECT_EQ(get("/api/v1/tracks?start=2025-11-29T22:00:00Z&end=2025-11-29T21:00:00Z").status, 400);
    EXPECT_EQ(get("/api/v1/tracks?start=2025-11-29T21:00:00Z&end=2025-11-29T22:00:00Z&points=1").status, 400);
}

TEST_F(ApiTest, TracksOutOfRange) {
    auto response = get("/api/v1/tracks?start=2025-11-29T21:00:00Z&end=2025-11-29T22:00:00Z&points=2147483647");
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(errorOf(response), "BadRequest");
    EXPECT_EQ(get("/api/v1/tracks?start=2025-11-29T21:00:00Z&end=2025-11-29T22:00:00Z&points=99999999999").status, 400);
    EXPECT_EQ(get("/api/v1/tracks?start=2025-11-29T21:00:00Z&end=2025-12-07T21:00:00Z").status, 400);
}

// ============================================================================
// Objects and Elements
// ============================================================================

TEST_F(ApiTest, Object) {
    auto response = get("/api/v1/objects/25544");
    ASSERT_EQ(response.status, 200);
    auto doc = parse(response);
    EXPECT_EQ(doc["id"].GetInt(), 25544);
    EXPECT_STREQ(doc["name"].GetString(), "ISS (ZARYA)");
    EXPECT_EQ(doc["records"].Size(), 1);
}

TEST_F(ApiTest, UnknownObject) {
    auto response = get("/api/v1/objects/12345");
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(errorOf(response), "UnknownObject");
}

TEST_F(ApiTest, InvalidObjectId) {
    EXPECT_EQ(get("/api/v1/objects/iss").status, 400);
    EXPECT_EQ(get("/api/v1/objects/").status, 400);
}

TEST_F(ApiTest, PostNewElementsIsCreated) {
    auto response = post("/api/v1/elements", submissionBody(25544, ISS_LATER_LINE1, ISS_LINE2));
    EXPECT_EQ(response.status, 201);
    auto doc = parse(response);
    EXPECT_EQ(doc["id"].GetInt(), 25544);
    EXPECT_TRUE(doc["stored"].GetBool());
    EXPECT_EQ(store.recordCount(25544), 2);
}

TEST_F(ApiTest, PostDuplicateElementsIsOk) {
    auto response = post("/api/v1/elements", submissionBody(25544, ISS_LINE1, ISS_LINE2));
    EXPECT_EQ(response.status, 200);
    EXPECT_FALSE(parse(response)["stored"].GetBool());
    EXPECT_EQ(store.recordCount(25544), 1);
}

TEST_F(ApiTest, PostWithMatchingEpoch) {
    auto response = post("/api/v1/elements",
                         submissionBody(25544, ISS_LATER_LINE1, ISS_LINE2, "2025-11-30T08:01:44.058Z"));
    EXPECT_EQ(response.status, 201);
}

TEST_F(ApiTest, PostWithMismatchedEpoch) {
    auto response = post("/api/v1/elements",
                         submissionBody(25544, ISS_LATER_LINE1, ISS_LINE2, "2025-11-30T09:00:00Z"));
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(errorOf(response), "InvalidElementFormat");
    EXPECT_EQ(store.recordCount(25544), 1);
}

TEST_F(ApiTest, PostBadChecksum) {
    std::string line1 = ISS_LATER_LINE1;
    line1.back() = '0';
    auto response = post("/api/v1/elements", submissionBody(25544, line1, ISS_LINE2));
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(errorOf(response), "InvalidElementFormat");
    EXPECT_EQ(store.recordCount(25544), 1);
    EXPECT_EQ(store.records(25544).front()->getLine1(), ISS_LINE1);
}

TEST_F(ApiTest, PostWrongCatalogNumber) {
    auto response = post("/api/v1/elements", submissionBody(33591, ISS_LATER_LINE1, ISS_LINE2));
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(store.recordCount(33591), 1);
}

TEST_F(ApiTest, PostMalformedBody) {
    auto response = post("/api/v1/elements", "{not json");
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(errorOf(response), "BadRequest");
}

// ============================================================================
// Routing
// ============================================================================

TEST_F(ApiTest, WrongMethod) {
    auto response = get("/api/v1/elements");
    EXPECT_EQ(response.status, 405);
    EXPECT_EQ(errorOf(response), "MethodNotAllowed");
    EXPECT_EQ(post("/api/v1/snapshot", "").status, 405);
}

TEST_F(ApiTest, NotFound) {
    EXPECT_EQ(get("/").status, 404);
    EXPECT_EQ(get("/api/v2/snapshot").status, 404);
    auto response = get("/api/v1/nothing");
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(errorOf(response), "NotFound");
}

} // namespace
} // namespace groundtrack
