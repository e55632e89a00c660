/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_ELEMENT_LOG_HPP
#define __GROUNDTRACK_ELEMENT_LOG_HPP

#include <groundtrack/element_store.hpp>

#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace groundtrack {

/**
 * Counts from loading a stream of element sets into a store.
 */
struct LoadResult {
    std::size_t accepted = 0;     ///< Newly appended records
    std::size_t duplicates = 0;   ///< Records that were already stored
    std::size_t rejected = 0;     ///< Entries that failed validation
};

/**
 * Load element sets in the standard 3-line TLE format (name, line 1, line 2)
 * from a stream into the store. A missing name line is allowed. Invalid
 * entries are logged and skipped.
 */
LoadResult loadElements(std::istream &s, ElementStore &store);

/**
 * Write one element set in the standard 3-line TLE format.
 */
void writeElement(std::ostream &s, const std::string &name, const ElementRecord &record);

/**
 * Append-only on-disk log of accepted element records.
 *
 * Entries are only ever appended; the file is never rewritten.
 */
class ElementLog {
public:
    explicit ElementLog(std::string path);
    ~ElementLog() = default;

    /**
     * Append one record and flush it to disk.
     * @throws std::runtime_error if the file cannot be written
     */
    void append(const std::string &name, const ElementRecord &record);

    /**
     * Load every entry of the log into the store, in file order.
     * A missing file is treated as an empty log.
     */
    LoadResult replay(ElementStore &store) const;

    const std::string& getPath() const;

private:
    std::string path;
    std::mutex mutex;
    std::ofstream out;
};

}

#endif
