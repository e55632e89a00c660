/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/reconciler.hpp>

#include <algorithm>
#include <set>

namespace groundtrack {

namespace {

const std::string NO_LONGER_TRACKED = "no longer tracked";

template<typename T>
void sortByCatalogNumber(std::vector<T> &items) {
    std::sort(items.begin(), items.end(), [](const T &a, const T &b) {
        return a.catalogNumber < b.catalogNumber;
    });
}

enum class ChangeKind { Add, Update, Remove };

struct Change {
    ChangeKind kind;
    SatelliteTrack track;
    std::string reason;
};

}

Delta SnapshotReconciler::reconcile(const std::vector<CycleOutcome> &outcomes) {
    Delta delta;
    std::set<int> seen;

    for (const auto &outcome : outcomes) {
        std::visit(overloaded {
            [&](const SatelliteTrack &track) {
                seen.insert(track.catalogNumber);
                auto it = present.find(track.catalogNumber);
                if (it == present.end()) {
                    present.emplace(track.catalogNumber, track);
                    delta.adds.push_back(track);
                } else if (it->second != track) {
                    it->second = track;
                    delta.updates.push_back(track);
                }
            },
            [&](const Exclusion &exclusion) {
                seen.insert(exclusion.catalogNumber);
                if (present.erase(exclusion.catalogNumber) > 0) {
                    delta.removes.push_back({exclusion.catalogNumber, exclusion.reason});
                }
            }
        }, outcome);
    }

    for (auto it = present.begin(); it != present.end();) {
        if (!seen.contains(it->first)) {
            delta.removes.push_back({it->first, NO_LONGER_TRACKED});
            it = present.erase(it);
        } else {
            ++it;
        }
    }

    sortByCatalogNumber(delta.adds);
    sortByCatalogNumber(delta.updates);
    sortByCatalogNumber(delta.removes);
    return delta;
}

ObjectState SnapshotReconciler::state(int catalogNumber) const {
    return present.contains(catalogNumber) ? ObjectState::Present : ObjectState::Absent;
}

const std::map<int, SatelliteTrack>& SnapshotReconciler::current() const {
    return present;
}

void mergeDelta(Delta &accumulated, const Delta &later) {
    std::map<int, Change> changes;
    for (const auto &track : accumulated.adds) {
        changes[track.catalogNumber] = {ChangeKind::Add, track, {}};
    }
    for (const auto &track : accumulated.updates) {
        changes[track.catalogNumber] = {ChangeKind::Update, track, {}};
    }
    for (const auto &removal : accumulated.removes) {
        changes[removal.catalogNumber] = {ChangeKind::Remove, {}, removal.reason};
    }

    for (const auto &track : later.adds) {
        auto it = changes.find(track.catalogNumber);
        if (it != changes.end() && it->second.kind == ChangeKind::Remove) {
            // The client still holds the object from before the removal
            it->second = {ChangeKind::Update, track, {}};
        } else {
            changes[track.catalogNumber] = {ChangeKind::Add, track, {}};
        }
    }
    for (const auto &track : later.updates) {
        auto it = changes.find(track.catalogNumber);
        if (it != changes.end() && it->second.kind == ChangeKind::Add) {
            it->second.track = track;
        } else {
            changes[track.catalogNumber] = {ChangeKind::Update, track, {}};
        }
    }
    for (const auto &removal : later.removes) {
        auto it = changes.find(removal.catalogNumber);
        if (it != changes.end() && it->second.kind == ChangeKind::Add) {
            // Added and removed since the client last looked
            changes.erase(it);
        } else {
            changes[removal.catalogNumber] = {ChangeKind::Remove, {}, removal.reason};
        }
    }

    accumulated.adds.clear();
    accumulated.updates.clear();
    accumulated.removes.clear();
    for (auto &[catalogNumber, change] : changes) {
        switch (change.kind) {
            case ChangeKind::Add:
                accumulated.adds.push_back(std::move(change.track));
                break;
            case ChangeKind::Update:
                accumulated.updates.push_back(std::move(change.track));
                break;
            case ChangeKind::Remove:
                accumulated.removes.push_back({catalogNumber, std::move(change.reason)});
                break;
        }
    }
    accumulated.sequence = std::max(accumulated.sequence, later.sequence);
}

}
