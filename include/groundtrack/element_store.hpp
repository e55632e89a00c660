/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_ELEMENT_STORE_HPP
#define __GROUNDTRACK_ELEMENT_STORE_HPP

#include <groundtrack/elements.hpp>

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace groundtrack {

using ElementRecordPtr = std::shared_ptr<const ElementRecord>;

/**
 * Result of selecting the element record that applies at a given time.
 */
struct Resolution {
    ElementRecordPtr record;
    bool extrapolatedBackward;   ///< Every stored epoch is after the requested time
};

/**
 * Versioned, append-only store of element records keyed by catalog number.
 *
 * Records are never modified or removed. Readers and writers may run on
 * different threads; a reader sees a record either fully present or absent.
 */
class ElementStore {
public:
    /**
     * Called after a record has been appended, outside the store lock.
     */
    using AppendListener = std::function<void(int catalogNumber, const std::string& name, const ElementRecord& record)>;

    ElementStore() = default;
    ~ElementStore() = default;

    ElementStore(const ElementStore&) = delete;
    ElementStore& operator=(const ElementStore&) = delete;

    /**
     * Append a record for an object, optionally updating its display name.
     *
     * @return false if an identical record was already stored
     * @throws InvalidElementFormat if the record belongs to another catalog number
     */
    bool put(int catalogNumber, const ElementRecord& record, const std::string& name = "");

    /**
     * Ingestion entry point: validate raw lines and append them.
     *
     * @param epoch Must match the epoch encoded in lineA to within a millisecond
     * @return false if an identical record was already stored
     * @throws InvalidElementFormat if the lines are malformed or disagree with
     *         catalogNumber or epoch
     */
    bool submit(int catalogNumber, const std::string& name, time_point epoch,
                std::string_view lineA, std::string_view lineB);

    /**
     * Ingestion entry point using the epoch encoded in the lines.
     */
    bool submit(int catalogNumber, const std::string& name,
                std::string_view lineA, std::string_view lineB);

    /**
     * Select the record with the latest epoch at or before the given time,
     * or the earliest record (flagged as extrapolated) if all are later.
     *
     * @throws UnknownObject if the object has no records
     */
    Resolution resolve(int catalogNumber, time_point at) const;

    bool contains(int catalogNumber) const;
    std::size_t recordCount(int catalogNumber) const;

    /**
     * All records of an object in epoch order.
     */
    std::vector<ElementRecordPtr> records(int catalogNumber) const;

    /**
     * Display name of an object, or an empty string.
     */
    std::string name(int catalogNumber) const;

    std::vector<int> catalogNumbers() const;

    void setAppendListener(AppendListener listener);

private:
    struct TrackedObject {
        std::string name;
        std::vector<ElementRecordPtr> records;  ///< Sorted by epochOrderLess
    };

    mutable std::shared_mutex mutex;
    std::map<int, TrackedObject> objects;
    AppendListener listener;
};

}

#endif
