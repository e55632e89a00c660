/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <groundtrack/snapshot_server.hpp>

#include <chrono>
#include <limits>
#include <stdexcept>
#include <variant>

namespace groundtrack {
namespace {

using namespace std::chrono;

constexpr const char* ISS_LINE1 = "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993";
constexpr const char* ISS_LINE2 = "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";
constexpr const char* NOAA19_LINE1 = "1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999";
constexpr const char* NOAA19_LINE2 = "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318";
constexpr const char* DECAYED_LINE1 = "1 99999U 25001A   25333.50000000  .00000000  00000+0  00000-0 0  9993";
constexpr const char* DECAYED_LINE2 = "2 99999  51.6000 100.0000 0001000   0.0000   0.0000 17.50000000    15";

ServerOptions testOptions(std::size_t historySize = DEFAULT_DELTA_HISTORY_SIZE) {
    return ServerOptions{
        .cycleInterval = seconds(10),
        .predictionWindow = minutes(90),
        .targetPointCount = 20,
        .sampler = {},
        .minimumElevationInDegrees = 10.0,
        .deltaHistorySize = historySize,
        .workerThreads = 2,
    };
}

class SnapshotServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.submit(25544, "ISS (ZARYA)", ISS_LINE1, ISS_LINE2);
        store.submit(33591, "NOAA 19", NOAA19_LINE1, NOAA19_LINE2);
        store.submit(99999, "DECAYED", DECAYED_LINE1, DECAYED_LINE2);
    }

    static std::vector<int> catalogNumbersOf(const Snapshot &snapshot) {
        std::vector<int> result;
        for (const auto &track : snapshot.objects) {
            result.push_back(track.catalogNumber);
        }
        return result;
    }

    ElementStore store;
    time_point now = ElementRecord::parse(ISS_LINE1, ISS_LINE2).getEpoch();
};

// ============================================================================
// Cycles and Sequence Numbers
// ============================================================================

TEST_F(SnapshotServerTest, InitialSnapshotIsEmpty) {
    SnapshotServer server(store, testOptions());
    auto snapshot = server.currentSnapshot();
    ASSERT_TRUE(snapshot);
    EXPECT_EQ(snapshot->sequence, 0);
    EXPECT_TRUE(snapshot->objects.empty());
}

TEST_F(SnapshotServerTest, FirstCycleAddsTrackableObjects) {
    SnapshotServer server(store, testOptions());
    auto snapshot = server.runCycle(now);

    EXPECT_EQ(snapshot->sequence, 1);
    EXPECT_EQ(snapshot->windowStart, now);
    EXPECT_EQ(snapshot->windowEnd, now + minutes(90));
    EXPECT_EQ(catalogNumbersOf(*snapshot), (std::vector<int>{25544, 33591}));
    EXPECT_EQ(server.currentSnapshot(), snapshot);

    const auto &iss = snapshot->objects[0];
    EXPECT_EQ(iss.name, "ISS (ZARYA)");
    EXPECT_GE(iss.samples.size(), 2);
    EXPECT_LE(iss.samples.size(), 20);
    EXPECT_EQ(iss.samples.front().time, now);
    ASSERT_TRUE(iss.coverage.has_value());
    EXPECT_EQ(iss.coverage->center, iss.samples.front());
}

TEST_F(SnapshotServerTest, SequenceIncreasesEveryCycle) {
    SnapshotServer server(store, testOptions());
    EXPECT_EQ(server.runCycle(now)->sequence, 1);
    EXPECT_EQ(server.runCycle(now)->sequence, 2);
    EXPECT_EQ(server.runCycle(now + minutes(1))->sequence, 3);
}

TEST_F(SnapshotServerTest, UnknownTrackedObjectIsExcluded) {
    SnapshotServer server(store, testOptions());
    server.track(25544);
    server.track(12345);
    auto snapshot = server.runCycle(now);
    EXPECT_EQ(catalogNumbersOf(*snapshot), (std::vector<int>{25544}));
}

// ============================================================================
// Deltas
// ============================================================================

TEST_F(SnapshotServerTest, DeltaFromEmptySnapshotAddsEverything) {
    SnapshotServer server(store, testOptions());
    server.runCycle(now);

    auto result = server.deltaSince(0);
    ASSERT_TRUE(std::holds_alternative<Delta>(result));
    const auto &delta = std::get<Delta>(result);
    EXPECT_EQ(delta.sequence, 1);
    EXPECT_EQ(delta.adds.size(), 2);
    EXPECT_TRUE(delta.updates.empty());
    EXPECT_TRUE(delta.removes.empty());
}

TEST_F(SnapshotServerTest, RepeatedInstantProducesEmptyDelta) {
    SnapshotServer server(store, testOptions());
    server.runCycle(now);
    server.runCycle(now);

    auto result = server.deltaSince(1);
    ASSERT_TRUE(std::holds_alternative<Delta>(result));
    EXPECT_TRUE(std::get<Delta>(result).empty());
    EXPECT_EQ(std::get<Delta>(result).sequence, 2);
}

TEST_F(SnapshotServerTest, LaterCycleUpdatesTracks) {
    SnapshotServer server(store, testOptions());
    server.runCycle(now);
    server.runCycle(now + minutes(5));

    auto delta = std::get<Delta>(server.deltaSince(1));
    EXPECT_TRUE(delta.adds.empty());
    ASSERT_EQ(delta.updates.size(), 2);
    EXPECT_EQ(delta.updates[0].catalogNumber, 25544);
    EXPECT_EQ(delta.updates[1].catalogNumber, 33591);
}

TEST_F(SnapshotServerTest, DeltasAreMergedAcrossCycles) {
    SnapshotServer server(store, testOptions());
    server.runCycle(now);
    server.runCycle(now + minutes(5));
    server.runCycle(now + minutes(10));

    auto delta = std::get<Delta>(server.deltaSince(0));
    EXPECT_EQ(delta.sequence, 3);
    ASSERT_EQ(delta.adds.size(), 2);
    EXPECT_TRUE(delta.updates.empty());
    EXPECT_EQ(delta.adds[0], server.currentSnapshot()->objects[0]);
}

TEST_F(SnapshotServerTest, DeltaSinceLatestIsEmpty) {
    SnapshotServer server(store, testOptions());
    auto initial = server.deltaSince(0);
    ASSERT_TRUE(std::holds_alternative<Delta>(initial));
    EXPECT_TRUE(std::get<Delta>(initial).empty());

    server.runCycle(now);
    auto result = server.deltaSince(1);
    ASSERT_TRUE(std::holds_alternative<Delta>(result));
    EXPECT_TRUE(std::get<Delta>(result).empty());
}

TEST_F(SnapshotServerTest, FutureSequenceRequiresFullSnapshot) {
    SnapshotServer server(store, testOptions());
    server.runCycle(now);
    auto result = server.deltaSince(7);
    ASSERT_TRUE(std::holds_alternative<FullSnapshotRequired>(result));
    EXPECT_EQ(std::get<FullSnapshotRequired>(result).sequence, 1);
}

TEST_F(SnapshotServerTest, ExpiredHistoryRequiresFullSnapshot) {
    SnapshotServer server(store, testOptions(1));
    server.runCycle(now);
    server.runCycle(now + minutes(5));

    EXPECT_TRUE(std::holds_alternative<FullSnapshotRequired>(server.deltaSince(0)));
    EXPECT_TRUE(std::holds_alternative<Delta>(server.deltaSince(1)));
    EXPECT_TRUE(std::holds_alternative<Delta>(server.deltaSince(2)));
}

TEST_F(SnapshotServerTest, UntrackedObjectIsRemoved) {
    SnapshotServer server(store, testOptions());
    server.runCycle(now);

    server.track(25544);
    EXPECT_EQ(server.trackedObjects(), (std::vector<int>{25544}));
    server.runCycle(now);

    auto delta = std::get<Delta>(server.deltaSince(1));
    ASSERT_EQ(delta.removes.size(), 1);
    EXPECT_EQ(delta.removes[0].catalogNumber, 33591);
    EXPECT_EQ(delta.removes[0].reason, "no longer tracked");

    server.untrack(25544);
    EXPECT_EQ(server.trackedObjects(), (std::vector<int>{25544, 33591, 99999}));
}

// ============================================================================
// Polling
// ============================================================================

TEST_F(SnapshotServerTest, PollWithoutSequenceReturnsSnapshot) {
    SnapshotServer server(store, testOptions());
    server.runCycle(now);
    auto result = server.poll(std::nullopt);
    ASSERT_TRUE(std::holds_alternative<SnapshotPtr>(result));
    EXPECT_EQ(std::get<SnapshotPtr>(result)->sequence, 1);
}

TEST_F(SnapshotServerTest, PollWithSequenceReturnsDelta) {
    SnapshotServer server(store, testOptions());
    server.runCycle(now);
    EXPECT_TRUE(std::holds_alternative<Delta>(server.poll(0)));
    EXPECT_TRUE(std::holds_alternative<FullSnapshotRequired>(server.poll(5)));
}

// ============================================================================
// Window Snapshots and Entities
// ============================================================================

TEST_F(SnapshotServerTest, WindowSnapshotDoesNotPublish) {
    SnapshotServer server(store, testOptions());
    server.runCycle(now);

    auto window = server.windowSnapshot(now + hours(1), now + hours(2), 10);
    EXPECT_EQ(window.sequence, 1);
    EXPECT_EQ(window.windowStart, now + hours(1));
    EXPECT_EQ(window.windowEnd, now + hours(2));
    EXPECT_EQ(catalogNumbersOf(window), (std::vector<int>{25544, 33591}));
    for (const auto &track : window.objects) {
        EXPECT_LE(track.samples.size(), 10);
        EXPECT_EQ(track.samples.front().time, now + hours(1));
        EXPECT_EQ(track.samples.back().time, now + hours(2));
    }

    EXPECT_EQ(server.currentSnapshot()->sequence, 1);
    EXPECT_EQ(server.currentSnapshot()->windowStart, now);
}

TEST_F(SnapshotServerTest, WindowSnapshotInvalidArguments_Throws) {
    SnapshotServer server(store, testOptions());
    EXPECT_THROW(server.windowSnapshot(now, now, 10), std::invalid_argument);
    EXPECT_THROW(server.windowSnapshot(now, now + hours(1), 1), std::invalid_argument);
}

TEST_F(SnapshotServerTest, WindowSnapshotLimits_Throws) {
    SnapshotServer server(store, testOptions());
    EXPECT_THROW(server.windowSnapshot(now, now + hours(1), std::numeric_limits<int>::max()), std::invalid_argument);
    EXPECT_THROW(server.windowSnapshot(now, now + hours(1), DEFAULT_MAX_WINDOW_POINT_COUNT + 1), std::invalid_argument);
    EXPECT_THROW(server.windowSnapshot(now, now + DEFAULT_MAX_WINDOW_DURATION + seconds(1), 10), std::invalid_argument);

    auto window = server.windowSnapshot(now, now + DEFAULT_MAX_WINDOW_DURATION, 10);
    EXPECT_EQ(window.objects.size(), 2);
}

TEST_F(SnapshotServerTest, EntitiesIncludeTracksFootprintsAndStations) {
    SnapshotServer server(store, testOptions(), {{"Svalbard", 78.2298, 15.4078}});
    server.runCycle(now);

    auto entities = server.entities();
    int tracks = 0, footprints = 0, stations = 0;
    for (const auto &entity : entities) {
        std::visit(overloaded {
            [&](const SatelliteTrack &) { ++tracks; },
            [&](const CoverageFootprint &) { ++footprints; },
            [&](const GroundStation &) { ++stations; }
        }, entity);
    }
    EXPECT_EQ(tracks, 2);
    EXPECT_EQ(footprints, 2);
    EXPECT_EQ(stations, 1);

    ASSERT_TRUE(std::holds_alternative<SatelliteTrack>(entities.front()));
    ASSERT_TRUE(std::holds_alternative<GroundStation>(entities.back()));
    EXPECT_EQ(std::get<GroundStation>(entities.back()).name, "Svalbard");
    EXPECT_EQ(server.getGroundStations().size(), 1);
}

TEST_F(SnapshotServerTest, Options) {
    SnapshotServer server(store, testOptions(8));
    EXPECT_EQ(server.getOptions().deltaHistorySize, 8);
    EXPECT_EQ(server.getOptions().targetPointCount, 20);
}

} // namespace
} // namespace groundtrack
