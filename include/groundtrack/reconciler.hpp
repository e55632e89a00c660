/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_RECONCILER_HPP
#define __GROUNDTRACK_RECONCILER_HPP

#include <groundtrack/entity.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace groundtrack {

/**
 * An object that left the snapshot.
 */
struct Removal {
    int catalogNumber;
    std::string reason;

    bool operator==(const Removal& other) const = default;
};

/**
 * Changes between two consecutive snapshots. Each list is ordered by
 * catalog number and an object appears in at most one list.
 */
struct Delta {
    std::uint64_t sequence = 0;     ///< Sequence number of the snapshot this delta produces
    std::vector<SatelliteTrack> adds;
    std::vector<SatelliteTrack> updates;
    std::vector<Removal> removes;

    bool empty() const {
        return adds.empty() && updates.empty() && removes.empty();
    }
};

enum class ObjectState {
    Absent,
    Present
};

/**
 * Keeps the last known track of every object and turns each cycle's
 * outcomes into an add/update/remove delta.
 *
 * Not thread safe; the snapshot server calls it from one cycle at a time.
 */
class SnapshotReconciler {
public:
    /**
     * Apply one cycle's outcomes.
     *
     * A successful outcome adds an Absent object, or updates a Present one
     * whose track changed. A failed outcome removes a Present object.
     * Present objects with no outcome at all are removed.
     *
     * The returned delta has sequence 0; the caller numbers it.
     */
    Delta reconcile(const std::vector<CycleOutcome> &outcomes);

    ObjectState state(int catalogNumber) const;

    /**
     * Tracks of every Present object, by catalog number.
     */
    const std::map<int, SatelliteTrack>& current() const;

private:
    std::map<int, SatelliteTrack> present;
};

/**
 * Fold a later delta into an accumulated one so that applying the result
 * is equivalent to applying both in order.
 *
 *   add + update     → add (latest track)
 *   add + remove     → nothing
 *   update + update  → update (latest track)
 *   update + remove  → remove
 *   remove + add     → update
 */
void mergeDelta(Delta &accumulated, const Delta &later);

}

#endif
