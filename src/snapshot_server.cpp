/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/snapshot_server.hpp>
#include <groundtrack/coverage.hpp>
#include <groundtrack/errors.hpp>

#include <algorithm>
#include <latch>
#include <stdexcept>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace groundtrack {

namespace {

std::size_t poolSize(unsigned int workerThreads) {
    if (workerThreads > 0) {
        return workerThreads;
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

}

SnapshotServer::SnapshotServer(ElementStore& store, ServerOptions options, std::vector<GroundStation> stations)
    : store(store),
      options(options),
      stations(std::move(stations)),
      sampler(store, options.sampler),
      pool(poolSize(options.workerThreads)),
      windowPool(poolSize(options.windowWorkerThreads)),
      published(std::make_shared<const Snapshot>()) {}

SnapshotServer::~SnapshotServer() {
    windowPool.join();
    pool.join();
}

void SnapshotServer::track(int catalogNumber) {
    std::scoped_lock lock(trackingMutex);
    tracked.insert(catalogNumber);
}

void SnapshotServer::untrack(int catalogNumber) {
    std::scoped_lock lock(trackingMutex);
    tracked.erase(catalogNumber);
}

std::vector<int> SnapshotServer::trackedObjects() const {
    {
        std::scoped_lock lock(trackingMutex);
        if (!tracked.empty()) {
            return {tracked.begin(), tracked.end()};
        }
    }
    return store.catalogNumbers();
}

CycleOutcome SnapshotServer::sampleObject(int catalogNumber, time_point start, time_point end,
                                          int targetPointCount) const {
    try {
        SatelliteTrack track{
            .catalogNumber = catalogNumber,
            .name = store.name(catalogNumber),
            .samples = sampler.sample(catalogNumber, start, end, targetPointCount),
            .coverage = std::nullopt
        };
        try {
            track.coverage = computeFootprint(catalogNumber, track.samples.front(),
                                              options.minimumElevationInDegrees);
        } catch (const CoverageError &e) {
            debug("Omitting coverage for object {}: {}", catalogNumber, e.what());
        }
        return track;
    } catch (const std::exception &e) {
        return Exclusion{catalogNumber, e.what()};
    }
}

std::vector<CycleOutcome> SnapshotServer::sampleObjects(asio::thread_pool& workers,
                                                        const std::vector<int>& catalogNumbers,
                                                        time_point start, time_point end,
                                                        int targetPointCount) const {
    std::vector<CycleOutcome> outcomes(catalogNumbers.size());
    std::latch done(static_cast<std::ptrdiff_t>(catalogNumbers.size()));

    for (std::size_t i = 0; i < catalogNumbers.size(); ++i) {
        asio::post(workers, [&, i]() {
            outcomes[i] = sampleObject(catalogNumbers[i], start, end, targetPointCount);
            done.count_down();
        });
    }

    done.wait();
    return outcomes;
}

SnapshotPtr SnapshotServer::runCycle(time_point now) {
    std::scoped_lock cycleLock(cycleMutex);

    auto catalogNumbers = trackedObjects();
    time_point end = now + options.predictionWindow;
    auto outcomes = sampleObjects(pool, catalogNumbers, now, end, options.targetPointCount);

    for (const auto &outcome : outcomes) {
        if (const auto *exclusion = std::get_if<Exclusion>(&outcome)) {
            warn("Excluding object {} from this cycle: {}", exclusion->catalogNumber, exclusion->reason);
        }
    }

    Delta delta = reconciler.reconcile(outcomes);

    auto snapshot = std::make_shared<Snapshot>();
    snapshot->windowStart = now;
    snapshot->windowEnd = end;
    snapshot->objects.reserve(reconciler.current().size());
    for (const auto &[catalogNumber, track] : reconciler.current()) {
        snapshot->objects.push_back(track);
    }

    std::size_t historySize = std::max<std::size_t>(1, options.deltaHistorySize);
    std::size_t adds = delta.adds.size(), updates = delta.updates.size(), removes = delta.removes.size();
    {
        std::scoped_lock lock(publishMutex);
        std::uint64_t sequence = published->sequence + 1;
        snapshot->sequence = sequence;
        delta.sequence = sequence;
        history.push_back(std::make_shared<const Delta>(std::move(delta)));
        while (history.size() > historySize) {
            history.pop_front();
        }
        published = snapshot;
    }

    info("Cycle {}: {} objects ({} added, {} updated, {} removed)",
         snapshot->sequence, snapshot->objects.size(), adds, updates, removes);
    return snapshot;
}

SnapshotPtr SnapshotServer::currentSnapshot() const {
    std::scoped_lock lock(publishMutex);
    return published;
}

DeltaResult SnapshotServer::deltaSince(std::uint64_t sequence) const {
    std::uint64_t latest;
    std::vector<std::shared_ptr<const Delta>> deltas;
    {
        std::scoped_lock lock(publishMutex);
        latest = published->sequence;
        if (sequence > latest) {
            return FullSnapshotRequired{latest};
        }
        if (sequence < latest && (history.empty() || history.front()->sequence > sequence + 1)) {
            return FullSnapshotRequired{latest};
        }
        for (const auto &delta : history) {
            if (delta->sequence > sequence) {
                deltas.push_back(delta);
            }
        }
    }

    Delta merged;
    merged.sequence = latest;
    for (const auto &delta : deltas) {
        mergeDelta(merged, *delta);
    }
    return merged;
}

PollResult SnapshotServer::poll(std::optional<std::uint64_t> since) const {
    if (!since) {
        return currentSnapshot();
    }
    return std::visit([](auto &&result) -> PollResult { return std::move(result); }, deltaSince(*since));
}

Snapshot SnapshotServer::windowSnapshot(time_point start, time_point end, int targetPointCount) const {
    if (end <= start) {
        throw std::invalid_argument("Window end must be after its start");
    }
    if (end - start > options.maxWindowDuration) {
        throw std::invalid_argument("Window may not be longer than " +
                                    std::to_string(options.maxWindowDuration.count()) + " hours");
    }
    if (targetPointCount < 2 || targetPointCount > options.maxWindowPointCount) {
        throw std::invalid_argument("Sample point count must be between 2 and " +
                                    std::to_string(options.maxWindowPointCount));
    }

    Snapshot snapshot;
    snapshot.sequence = currentSnapshot()->sequence;
    snapshot.windowStart = start;
    snapshot.windowEnd = end;

    auto catalogNumbers = trackedObjects();
    for (auto &outcome : sampleObjects(windowPool, catalogNumbers, start, end, targetPointCount)) {
        std::visit(overloaded {
            [&](SatelliteTrack &track) {
                snapshot.objects.push_back(std::move(track));
            },
            [&](Exclusion &exclusion) {
                debug("Object {} left out of window: {}", exclusion.catalogNumber, exclusion.reason);
            }
        }, outcome);
    }
    return snapshot;
}

std::vector<Entity> SnapshotServer::entities() const {
    auto snapshot = currentSnapshot();
    std::vector<Entity> result;
    for (const auto &track : snapshot->objects) {
        result.emplace_back(track);
        if (track.coverage) {
            result.emplace_back(*track.coverage);
        }
    }
    for (const auto &station : stations) {
        result.emplace_back(station);
    }
    return result;
}

const std::vector<GroundStation>& SnapshotServer::getGroundStations() const {
    return stations;
}

const ServerOptions& SnapshotServer::getOptions() const {
    return options;
}

}
