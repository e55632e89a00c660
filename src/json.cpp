/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/json.hpp>

#include <array>
#include <sstream>
#include <stdexcept>

#include <date/date.h>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace groundtrack {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void writeString(JsonWriter &writer, const std::string &str) {
    writer.String(str.c_str(), static_cast<rapidjson::SizeType>(str.size()));
}

void writeTimestamp(JsonWriter &writer, time_point tp) {
    writeString(writer, formatTimestamp(tp));
}

void writeSample(JsonWriter &writer, const GeodeticSample &sample) {
    writer.StartObject();
    writer.Key("t");
    writeTimestamp(writer, sample.time);
    writer.Key("lat");
    writer.Double(sample.latInDegrees);
    writer.Key("lon");
    writer.Double(sample.lonInDegrees);
    writer.Key("alt_km");
    writer.Double(sample.altInKilometers);
    writer.EndObject();
}

void writeFootprintFields(JsonWriter &writer, const CoverageFootprint &footprint, bool withOutline) {
    writer.Key("center");
    writer.StartObject();
    writer.Key("lat");
    writer.Double(footprint.center.latInDegrees);
    writer.Key("lon");
    writer.Double(footprint.center.lonInDegrees);
    writer.EndObject();
    writer.Key("radius_km");
    writer.Double(footprint.radiusInKilometers);

    if (withOutline) {
        writer.Key("outline");
        writer.StartArray();
        for (const auto &vertex : coverageOutline(footprint)) {
            writer.StartArray();
            writer.Double(vertex.latInDegrees);
            writer.Double(vertex.lonInDegrees);
            writer.EndArray();
        }
        writer.EndArray();
    }
}

void writeTrackFields(JsonWriter &writer, const SatelliteTrack &track) {
    writer.Key("id");
    writer.Int(track.catalogNumber);
    writer.Key("name");
    writeString(writer, track.name);
    writer.Key("samples");
    writer.StartArray();
    for (const auto &sample : track.samples) {
        writeSample(writer, sample);
    }
    writer.EndArray();
    writer.Key("coverage");
    if (track.coverage) {
        writer.StartObject();
        writeFootprintFields(writer, *track.coverage, false);
        writer.EndObject();
    } else {
        writer.Null();
    }
}

void writeTrack(JsonWriter &writer, const SatelliteTrack &track) {
    writer.StartObject();
    writeTrackFields(writer, track);
    writer.EndObject();
}

void writeStationFields(JsonWriter &writer, const GroundStation &station) {
    writer.Key("name");
    writeString(writer, station.name);
    writer.Key("lat");
    writer.Double(station.latInDegrees);
    writer.Key("lon");
    writer.Double(station.lonInDegrees);
}

void writeStations(JsonWriter &writer, const std::vector<GroundStation> &stations) {
    writer.StartArray();
    for (const auto &station : stations) {
        writer.StartObject();
        writeStationFields(writer, station);
        writer.EndObject();
    }
    writer.EndArray();
}

void writeEntity(JsonWriter &writer, const Entity &entity) {
    writer.StartObject();
    std::visit(overloaded {
        [&](const SatelliteTrack &track) {
            writer.Key("kind");
            writer.String("satellite_track");
            writeTrackFields(writer, track);
        },
        [&](const CoverageFootprint &footprint) {
            writer.Key("kind");
            writer.String("coverage_footprint");
            writer.Key("id");
            writer.Int(footprint.catalogNumber);
            writeFootprintFields(writer, footprint, true);
        },
        [&](const GroundStation &station) {
            writer.Key("kind");
            writer.String("ground_station");
            writeStationFields(writer, station);
        }
    }, entity);
    writer.EndObject();
}

const rapidjson::Value& requireMember(const rapidjson::Document &doc, const char *name) {
    auto it = doc.FindMember(name);
    if (it == doc.MemberEnd()) {
        throw std::invalid_argument(std::string("Missing field: ") + name);
    }
    return it->value;
}

std::string requireString(const rapidjson::Document &doc, const char *name) {
    const auto &value = requireMember(doc, name);
    if (!value.IsString()) {
        throw std::invalid_argument(std::string("Field must be a string: ") + name);
    }
    return {value.GetString(), value.GetStringLength()};
}

}

std::string formatTimestamp(time_point tp) {
    return date::format("%FT%TZ", std::chrono::floor<std::chrono::milliseconds>(tp));
}

time_point parseTimestamp(const std::string &str) {
    static const std::array<const char*, 3> formats = {"%FT%TZ", "%FT%T", "%F %T"};
    for (const auto *format : formats) {
        std::istringstream in(str);
        date::sys_time<std::chrono::milliseconds> tp;
        in >> date::parse(format, tp);
        if (!in.fail() && in.peek() == std::char_traits<char>::eof()) {
            return time_point(tp);
        }
    }
    throw std::invalid_argument("Invalid timestamp: " + str);
}

std::string snapshotToJson(const Snapshot &snapshot, const std::vector<GroundStation> &stations) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("type");
    writer.String("snapshot");
    writer.Key("sequence");
    writer.Uint64(snapshot.sequence);
    writer.Key("window");
    writer.StartObject();
    writer.Key("start");
    writeTimestamp(writer, snapshot.windowStart);
    writer.Key("end");
    writeTimestamp(writer, snapshot.windowEnd);
    writer.EndObject();
    writer.Key("objects");
    writer.StartArray();
    for (const auto &track : snapshot.objects) {
        writeTrack(writer, track);
    }
    writer.EndArray();
    writer.Key("stations");
    writeStations(writer, stations);
    writer.EndObject();

    return buffer.GetString();
}

std::string deltaToJson(const Delta &delta, std::uint64_t since) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("type");
    writer.String("delta");
    writer.Key("since");
    writer.Uint64(since);
    writer.Key("sequence");
    writer.Uint64(delta.sequence);
    writer.Key("adds");
    writer.StartArray();
    for (const auto &track : delta.adds) {
        writeTrack(writer, track);
    }
    writer.EndArray();
    writer.Key("updates");
    writer.StartArray();
    for (const auto &track : delta.updates) {
        writeTrack(writer, track);
    }
    writer.EndArray();
    writer.Key("removes");
    writer.StartArray();
    for (const auto &removal : delta.removes) {
        writer.StartObject();
        writer.Key("id");
        writer.Int(removal.catalogNumber);
        writer.Key("reason");
        writeString(writer, removal.reason);
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();

    return buffer.GetString();
}

std::string fullSnapshotRequiredToJson(const FullSnapshotRequired &required) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("type");
    writer.String("full_snapshot_required");
    writer.Key("sequence");
    writer.Uint64(required.sequence);
    writer.EndObject();

    return buffer.GetString();
}

std::string entitiesToJson(const std::vector<Entity> &entities) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("entities");
    writer.StartArray();
    for (const auto &entity : entities) {
        writeEntity(writer, entity);
    }
    writer.EndArray();
    writer.EndObject();

    return buffer.GetString();
}

std::string stationsToJson(const std::vector<GroundStation> &stations) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("stations");
    writeStations(writer, stations);
    writer.EndObject();

    return buffer.GetString();
}

std::string objectToJson(int catalogNumber, const std::string &name, const std::vector<ElementRecordPtr> &records) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("id");
    writer.Int(catalogNumber);
    writer.Key("name");
    writeString(writer, name);
    writer.Key("records");
    writer.StartArray();
    for (const auto &record : records) {
        writer.StartObject();
        writer.Key("epoch");
        writeTimestamp(writer, record->getEpoch());
        writer.Key("element_set_number");
        writer.Int(record->getElementSetNumber());
        writer.Key("line1");
        writeString(writer, record->getLine1());
        writer.Key("line2");
        writeString(writer, record->getLine2());
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();

    return buffer.GetString();
}

std::string submissionResultToJson(int catalogNumber, bool stored) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("id");
    writer.Int(catalogNumber);
    writer.Key("stored");
    writer.Bool(stored);
    writer.EndObject();

    return buffer.GetString();
}

std::string errorToJson(const std::string &error, const std::string &message) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("error");
    writeString(writer, error);
    writer.Key("message");
    writeString(writer, message);
    writer.EndObject();

    return buffer.GetString();
}

ElementSubmission parseElementSubmission(const std::string &body) {
    rapidjson::Document doc;
    doc.Parse(body.c_str(), body.size());

    if (doc.HasParseError() || !doc.IsObject()) {
        throw std::invalid_argument("Request body is not a JSON object");
    }

    const auto &id = requireMember(doc, "id");
    if (!id.IsInt()) {
        throw std::invalid_argument("Field must be an integer: id");
    }

    ElementSubmission submission{
        .catalogNumber = id.GetInt(),
        .name = doc.HasMember("name") ? requireString(doc, "name") : std::string(),
        .epoch = std::nullopt,
        .line1 = requireString(doc, "line1"),
        .line2 = requireString(doc, "line2")
    };
    if (doc.HasMember("epoch") && !doc["epoch"].IsNull()) {
        submission.epoch = parseTimestamp(requireString(doc, "epoch"));
    }
    return submission;
}

}
