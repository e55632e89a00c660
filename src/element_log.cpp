/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/element_log.hpp>

#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace groundtrack {

namespace {

std::string trimName(std::string line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    // Some sources prefix the name line with "0 "
    if (line.starts_with("0 ")) {
        line.erase(0, 2);
    }
    return line;
}

}

LoadResult loadElements(std::istream &s, ElementStore &store) {
    LoadResult result;
    bool haveFirstLine = false;
    std::string line, line1, nameLine;
    int lineNumber = 0;

    while (std::getline(s, line)) {
        ++lineNumber;
        if (line.empty() || line == "\r") continue;

        if (line.starts_with("1 ")) {
            line1 = line;
            haveFirstLine = true;
        } else if (line.starts_with("2 ") && haveFirstLine) {
            try {
                auto record = ElementRecord::parse(line1, line);
                if (store.put(record.getCatalogNumber(), record, trimName(nameLine))) {
                    result.accepted++;
                } else {
                    result.duplicates++;
                }
            } catch (const InvalidElementFormat &e) {
                warn("Skipping element set ending on line {}: {}", lineNumber, e.what());
                result.rejected++;
            }
            haveFirstLine = false;
            line1.clear();
            nameLine.clear();
        } else {
            if (haveFirstLine) {
                warn("Skipping line 1 without a matching line 2 before line {}", lineNumber);
                result.rejected++;
                haveFirstLine = false;
                line1.clear();
            }
            nameLine = line;
        }
    }

    debug("Loaded {} element sets ({} duplicates, {} rejected)",
          result.accepted, result.duplicates, result.rejected);
    return result;
}

void writeElement(std::ostream &s, const std::string &name, const ElementRecord &record) {
    if (!name.empty()) {
        s << name << '\n';
    }
    s << record.getLine1() << '\n' << record.getLine2() << '\n';
}

ElementLog::ElementLog(std::string path) : path(std::move(path)) {}

void ElementLog::append(const std::string &name, const ElementRecord &record) {
    std::scoped_lock lock(mutex);
    if (!out.is_open()) {
        out.open(path, std::ios::app);
        if (!out.is_open()) {
            throw std::runtime_error("Failed to open element log for writing: " + path);
        }
    }
    writeElement(out, name, record);
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write to element log: " + path);
    }
}

LoadResult ElementLog::replay(ElementStore &store) const {
    info("Loading element log from file: {}", path);
    if (!std::filesystem::exists(path)) {
        info("Element log does not exist yet: {}", path);
        return {};
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open element log: " + path);
    }
    auto result = loadElements(file, store);
    info("Loaded {} element sets from {}.", result.accepted, path);
    return result;
}

const std::string& ElementLog::getPath() const {
    return path;
}

}
