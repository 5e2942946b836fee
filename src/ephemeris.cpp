/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlekit/ephemeris.hpp>

#include <date/date.h>
#include <rapidjson/document.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace tlekit {

namespace {

Vec3 readVector(const rapidjson::Value &value, const char *name) {
    if (!value.HasMember(name) || !value[name].IsArray() || value[name].Size() != 3) {
        throw std::runtime_error(std::string("Ephemeris sample needs a 3 element \"") + name + "\" array");
    }
    const auto &array = value[name];
    for (const auto &component : array.GetArray()) {
        if (!component.IsNumber()) {
            throw std::runtime_error(std::string("Ephemeris \"") + name + "\" component is not a number");
        }
    }
    return {array[0].GetDouble(), array[1].GetDouble(), array[2].GetDouble()};
}

template <typename Writer>
void writeVector(Writer &writer, const char *name, const Vec3 &v) {
    writer.Key(name);
    writer.StartArray();
    writer.Double(v.x);
    writer.Double(v.y);
    writer.Double(v.z);
    writer.EndArray();
}

} // namespace

std::string formatTime(const time_point time) {
    return date::format("%F %T", std::chrono::floor<std::chrono::microseconds>(time));
}

time_point parseTime(const std::string &text) {
    std::istringstream in(text);
    date::sys_time<std::chrono::microseconds> tp;
    in >> date::parse("%Y-%m-%d %H:%M:%S", tp);
    if (in.fail()) {
        throw std::runtime_error("Invalid time \"" + text + "\", expected YYYY-MM-DD HH:MM:SS");
    }
    return std::chrono::time_point_cast<time_point::duration>(tp);
}

std::vector<EphemerisSample> sampleEphemeris(const Propagator &propagator, const double stepSeconds,
                                             const double spanSeconds) {
    if (!(stepSeconds > 0.0)) {
        throw std::invalid_argument("Ephemeris step must be positive");
    }
    std::vector<EphemerisSample> samples;
    const time_point epoch = propagator.getTle().getEpoch();
    for (double t = 0.0; t <= spanSeconds; t += stepSeconds) {
        const auto offset = std::chrono::duration_cast<time_point::duration>(std::chrono::duration<double>(t));
        samples.push_back({epoch + offset, propagator.propagate(t)});
    }
    return samples;
}

std::vector<EphemerisSample> readEphemeris(std::istream &s) {
    rapidjson::IStreamWrapper wrapper(s);
    rapidjson::Document doc;
    doc.ParseStream(wrapper);

    if (doc.HasParseError()) {
        throw std::runtime_error("Failed to parse JSON ephemeris");
    }
    if (!doc.IsObject() || !doc.HasMember("samples") || !doc["samples"].IsArray()) {
        throw std::runtime_error("Ephemeris does not contain a samples array");
    }

    std::vector<EphemerisSample> samples;
    for (const auto &sample : doc["samples"].GetArray()) {
        if (!sample.IsObject() || !sample.HasMember("time") || !sample["time"].IsString()) {
            throw std::runtime_error("Ephemeris sample without a time");
        }
        samples.push_back({
            parseTime(sample["time"].GetString()),
            {readVector(sample, "position"), readVector(sample, "velocity")}
        });
    }
    debug("Read {} ephemeris samples", samples.size());
    return samples;
}

std::vector<EphemerisSample> readEphemeris(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open ephemeris file: " + filepath);
    }
    return readEphemeris(file);
}

void writeEphemeris(std::ostream &s, const int satelliteNumber, const std::vector<EphemerisSample> &samples) {
    rapidjson::OStreamWrapper wrapper(s);
    rapidjson::PrettyWriter<rapidjson::OStreamWrapper> writer(wrapper);
    writer.SetMaxDecimalPlaces(9);

    writer.StartObject();
    writer.Key("satellite");
    writer.Int(satelliteNumber);
    writer.Key("frame");
    writer.String("TEME");
    writer.Key("samples");
    writer.StartArray();
    for (const auto &sample : samples) {
        writer.StartObject();
        writer.Key("time");
        writer.String(formatTime(sample.date).c_str());
        writeVector(writer, "position", sample.pv.position);
        writeVector(writer, "velocity", sample.pv.velocity);
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();
    s << std::endl;
}

} // namespace tlekit
