/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_SNAPSHOT_SERVER_HPP
#define __GROUNDTRACK_SNAPSHOT_SERVER_HPP

#include <groundtrack/element_store.hpp>
#include <groundtrack/entity.hpp>
#include <groundtrack/reconciler.hpp>
#include <groundtrack/track_sampler.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <variant>
#include <vector>

#include <asio.hpp>

namespace groundtrack {

constexpr std::chrono::seconds DEFAULT_CYCLE_INTERVAL{10};
constexpr std::chrono::minutes DEFAULT_PREDICTION_WINDOW{90};
constexpr int DEFAULT_TARGET_POINT_COUNT = 180;
constexpr double DEFAULT_MINIMUM_ELEVATION_DEGREES = 10.0;
constexpr std::size_t DEFAULT_DELTA_HISTORY_SIZE = 64;
constexpr int DEFAULT_MAX_WINDOW_POINT_COUNT = 2000;
constexpr std::chrono::hours DEFAULT_MAX_WINDOW_DURATION{7 * 24};
constexpr unsigned int DEFAULT_WINDOW_WORKER_THREADS = 2;

struct ServerOptions {
    std::chrono::seconds cycleInterval = DEFAULT_CYCLE_INTERVAL;
    std::chrono::minutes predictionWindow = DEFAULT_PREDICTION_WINDOW;
    int targetPointCount = DEFAULT_TARGET_POINT_COUNT;
    SamplerOptions sampler;
    double minimumElevationInDegrees = DEFAULT_MINIMUM_ELEVATION_DEGREES;
    std::size_t deltaHistorySize = DEFAULT_DELTA_HISTORY_SIZE;
    unsigned int workerThreads = 0;     ///< 0 uses the hardware concurrency
    int maxWindowPointCount = DEFAULT_MAX_WINDOW_POINT_COUNT;
    std::chrono::hours maxWindowDuration = DEFAULT_MAX_WINDOW_DURATION;
    unsigned int windowWorkerThreads = DEFAULT_WINDOW_WORKER_THREADS;  ///< Kept apart from the cycle workers
};

/**
 * The tracks of every Present object at one point in time.
 */
struct Snapshot {
    std::uint64_t sequence = 0;
    time_point windowStart{};
    time_point windowEnd{};
    std::vector<SatelliteTrack> objects;    ///< Ordered by catalog number
};

/**
 * The client's sequence number cannot be served as a delta.
 */
struct FullSnapshotRequired {
    std::uint64_t sequence;     ///< Latest published sequence number
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;
using DeltaResult = std::variant<Delta, FullSnapshotRequired>;
using PollResult = std::variant<SnapshotPtr, Delta, FullSnapshotRequired>;

/**
 * Periodically re-samples every tracked object and publishes numbered
 * snapshots along with a bounded history of deltas.
 *
 * runCycle() may be called from one thread at a time (further calls wait).
 * Every read method returns the last published state without waiting for
 * a running cycle.
 */
class SnapshotServer {
public:
    SnapshotServer(ElementStore& store, ServerOptions options, std::vector<GroundStation> stations = {});
    ~SnapshotServer();

    SnapshotServer(const SnapshotServer&) = delete;
    SnapshotServer& operator=(const SnapshotServer&) = delete;

    /**
     * Track an object explicitly. While no object is tracked explicitly,
     * every object in the store is tracked.
     */
    void track(int catalogNumber);
    void untrack(int catalogNumber);

    /**
     * The objects the next cycle will sample.
     */
    std::vector<int> trackedObjects() const;

    /**
     * Sample every tracked object over [now, now + prediction window],
     * reconcile against the previous cycle and publish the result.
     */
    SnapshotPtr runCycle(time_point now);

    /**
     * The latest published snapshot. Sequence 0 is the empty snapshot
     * before the first cycle.
     */
    SnapshotPtr currentSnapshot() const;

    /**
     * Every change published after the given sequence number, merged.
     * Returns FullSnapshotRequired if those deltas are no longer retained
     * or the sequence number has not been published yet.
     */
    DeltaResult deltaSince(std::uint64_t sequence) const;

    /**
     * The full snapshot if no sequence is given, otherwise deltaSince().
     */
    PollResult poll(std::optional<std::uint64_t> since) const;

    /**
     * Sample the tracked objects over an explicit window without publishing.
     * Runs on its own worker pool, so it never delays a cycle.
     *
     * @throws std::invalid_argument if the window is empty or longer than
     *         maxWindowDuration, or the point count is outside [2, maxWindowPointCount]
     */
    Snapshot windowSnapshot(time_point start, time_point end, int targetPointCount) const;

    /**
     * The current snapshot as map entities: tracks, footprints, ground stations.
     */
    std::vector<Entity> entities() const;

    const std::vector<GroundStation>& getGroundStations() const;
    const ServerOptions& getOptions() const;

private:
    std::vector<CycleOutcome> sampleObjects(asio::thread_pool& workers, const std::vector<int>& catalogNumbers,
                                            time_point start, time_point end, int targetPointCount) const;
    CycleOutcome sampleObject(int catalogNumber, time_point start, time_point end, int targetPointCount) const;

    ElementStore& store;
    const ServerOptions options;
    const std::vector<GroundStation> stations;
    TrackSampler sampler;
    mutable asio::thread_pool pool;
    mutable asio::thread_pool windowPool;

    mutable std::mutex trackingMutex;
    std::set<int> tracked;

    std::mutex cycleMutex;
    SnapshotReconciler reconciler;

    mutable std::mutex publishMutex;
    SnapshotPtr published;
    std::deque<std::shared_ptr<const Delta>> history;
};

}

#endif
