/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/element_store.hpp>

#include <algorithm>
#include <chrono>
#include <mutex>

#include <date/date.h>

namespace groundtrack {

namespace {

bool recordLess(const ElementRecordPtr& a, const ElementRecordPtr& b) {
    return epochOrderLess(*a, *b);
}

}

bool ElementStore::submit(int catalogNumber, const std::string& name, time_point epoch,
                          std::string_view lineA, std::string_view lineB) {
    using namespace std::chrono;

    auto record = ElementRecord::parse(lineA, lineB);

    auto difference = record.getEpoch() - epoch;
    if (difference > milliseconds(1) || difference < -milliseconds(1)) {
        throw InvalidElementFormat("submitted epoch " +
                                   date::format("%FT%TZ", floor<milliseconds>(epoch)) +
                                   " does not match encoded epoch " +
                                   date::format("%FT%TZ", floor<milliseconds>(record.getEpoch())));
    }

    return put(catalogNumber, record, name);
}

bool ElementStore::submit(int catalogNumber, const std::string& name,
                          std::string_view lineA, std::string_view lineB) {
    auto record = ElementRecord::parse(lineA, lineB);
    return put(catalogNumber, record, name);
}

bool ElementStore::put(int catalogNumber, const ElementRecord& record, const std::string& name) {
    if (record.getCatalogNumber() != catalogNumber) {
        throw InvalidElementFormat("record is for catalog number " +
                                   std::to_string(record.getCatalogNumber()) +
                                   ", not " + std::to_string(catalogNumber));
    }

    auto ptr = std::make_shared<const ElementRecord>(record);
    std::string objectName;
    AppendListener notify;
    {
        std::unique_lock lock(mutex);
        auto &object = objects[catalogNumber];
        if (!name.empty()) {
            object.name = name;
        }
        objectName = object.name;

        auto &records = object.records;
        auto pos = std::lower_bound(records.begin(), records.end(), ptr, recordLess);
        if (pos != records.end() && **pos == record) {
            return false;
        }
        records.insert(pos, ptr);
        notify = listener;
    }

    if (notify) {
        notify(catalogNumber, objectName, record);
    }
    return true;
}

Resolution ElementStore::resolve(int catalogNumber, time_point at) const {
    std::shared_lock lock(mutex);

    auto it = objects.find(catalogNumber);
    if (it == objects.end() || it->second.records.empty()) {
        throw UnknownObject(catalogNumber);
    }

    const auto &records = it->second.records;

    // First record with an epoch after the requested time
    auto after = std::upper_bound(records.begin(), records.end(), at,
        [](const time_point &t, const ElementRecordPtr &r) {
            return t < r->getEpoch();
        });

    if (after == records.begin()) {
        return {records.front(), true};
    }
    return {*std::prev(after), false};
}

bool ElementStore::contains(int catalogNumber) const {
    std::shared_lock lock(mutex);
    auto it = objects.find(catalogNumber);
    return it != objects.end() && !it->second.records.empty();
}

std::size_t ElementStore::recordCount(int catalogNumber) const {
    std::shared_lock lock(mutex);
    auto it = objects.find(catalogNumber);
    return it == objects.end() ? 0 : it->second.records.size();
}

std::vector<ElementRecordPtr> ElementStore::records(int catalogNumber) const {
    std::shared_lock lock(mutex);
    auto it = objects.find(catalogNumber);
    if (it == objects.end()) {
        return {};
    }
    return it->second.records;
}

std::string ElementStore::name(int catalogNumber) const {
    std::shared_lock lock(mutex);
    auto it = objects.find(catalogNumber);
    return it == objects.end() ? "" : it->second.name;
}

std::vector<int> ElementStore::catalogNumbers() const {
    std::shared_lock lock(mutex);
    std::vector<int> ids;
    ids.reserve(objects.size());
    for (const auto &[id, object] : objects) {
        if (!object.records.empty()) {
            ids.push_back(id);
        }
    }
    return ids;
}

void ElementStore::setAppendListener(AppendListener l) {
    std::unique_lock lock(mutex);
    listener = std::move(l);
}

}
