/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */

#include "fanout/result.hpp"
#include "fanout/registry.hpp"
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace fanout {

namespace {

using json = nlohmann::ordered_json;

constexpr int kFractionDigits = 9;

int daysInMonth(int year, int month) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return (month == 2 && leap) ? 29 : kDays[month - 1];
}

json toJson(const Result& result) {
    json root;
    root["metadata"]["started"] = formatTimestamp(result.metadata.started);
    root["metadata"]["ended"] = formatTimestamp(result.metadata.ended);
    root["tasks"] = json::object();
    for (const auto& [id, task] : result.tasks) {
        root["tasks"][std::to_string(id)]["stdout"] = task.stdoutContent;
    }
    return root;
}

Timestamp requireTimestamp(const json& metadata, const char* key) {
    if (!metadata.contains(key) || !metadata[key].is_string()) {
        throw ResultFormatError(std::string("metadata.") + key + " missing");
    }
    auto parsed = parseTimestamp(metadata[key].get<std::string>());
    if (!parsed) {
        throw ResultFormatError(std::string("metadata.") + key + " is not an RFC 3339 timestamp");
    }
    return *parsed;
}

TaskId parseTaskKey(const std::string& key) {
    // Canonical decimal only, so two keys never name the same task
    bool canonical = !key.empty() && key.size() <= 19 && (key == "0" || key[0] != '0');
    for (char c : key) {
        if (!std::isdigit(static_cast<unsigned char>(c))) canonical = false;
    }
    if (!canonical) {
        throw ResultFormatError("invalid task id: '" + key + "'");
    }
    TaskId id = 0;
    for (char c : key) {
        id = id * 10 + static_cast<TaskId>(c - '0');
    }
    return id;
}

Result fromJson(const json& root) {
    if (!root.is_object() || !root.contains("metadata") || !root["metadata"].is_object()) {
        throw ResultFormatError("metadata object missing");
    }
    if (!root.contains("tasks") || !root["tasks"].is_object()) {
        throw ResultFormatError("tasks object missing");
    }

    Result result;
    result.metadata.started = requireTimestamp(root["metadata"], "started");
    result.metadata.ended = requireTimestamp(root["metadata"], "ended");

    for (const auto& [key, value] : root["tasks"].items()) {
        if (!value.is_object() || !value.contains("stdout") || !value["stdout"].is_string()) {
            throw ResultFormatError("tasks." + key + ".stdout missing");
        }
        TaskId id = parseTaskKey(key);
        if (result.tasks.count(id) != 0) {
            throw ResultFormatError("duplicate task id: '" + key + "'");
        }
        result.tasks[id].stdoutContent = value["stdout"].get<std::string>();
    }
    return result;
}

std::string toYaml(const Result& result) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "metadata" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "started" << YAML::Value << formatTimestamp(result.metadata.started);
    out << YAML::Key << "ended" << YAML::Value << formatTimestamp(result.metadata.ended);
    out << YAML::EndMap;
    out << YAML::Key << "tasks" << YAML::Value << YAML::BeginMap;
    for (const auto& [id, task] : result.tasks) {
        out << YAML::Key << std::to_string(id) << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "stdout" << YAML::Value << YAML::DoubleQuoted << task.stdoutContent;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;
    if (!out.good()) {
        throw ResultFormatError("YAML emitter: " + out.GetLastError());
    }
    return out.c_str();
}

Timestamp requireTimestamp(const YAML::Node& metadata, const char* key) {
    const YAML::Node value = metadata[key];
    if (!value || !value.IsScalar()) {
        throw ResultFormatError(std::string("metadata.") + key + " missing");
    }
    auto parsed = parseTimestamp(value.as<std::string>());
    if (!parsed) {
        throw ResultFormatError(std::string("metadata.") + key + " is not an RFC 3339 timestamp");
    }
    return *parsed;
}

Result fromYaml(const YAML::Node& root) {
    if (!root.IsMap() || !root["metadata"] || !root["metadata"].IsMap()) {
        throw ResultFormatError("metadata map missing");
    }
    if (!root["tasks"] || !root["tasks"].IsMap()) {
        throw ResultFormatError("tasks map missing");
    }

    Result result;
    result.metadata.started = requireTimestamp(root["metadata"], "started");
    result.metadata.ended = requireTimestamp(root["metadata"], "ended");

    for (const auto& entry : root["tasks"]) {
        const std::string key = entry.first.as<std::string>();
        const YAML::Node value = entry.second;
        if (!value.IsMap() || !value["stdout"] || !value["stdout"].IsScalar()) {
            throw ResultFormatError("tasks." + key + ".stdout missing");
        }
        TaskId id = parseTaskKey(key);
        if (result.tasks.count(id) != 0) {
            throw ResultFormatError("duplicate task id: '" + key + "'");
        }
        result.tasks[id].stdoutContent = value["stdout"].as<std::string>();
    }
    return result;
}

}

Result assembleResult(const Registry& registry, Timestamp started, Timestamp ended) {
    Result result;
    result.metadata.started = started;
    result.metadata.ended = ended;
    for (const auto& task : registry.tasks()) {
        result.tasks[task.id].stdoutContent = task.stdoutContent;
    }
    return result;
}

std::optional<OutputFormat> parseOutputFormat(const std::string& name) noexcept {
    if (name == "json") return OutputFormat::Json;
    if (name == "yaml") return OutputFormat::Yaml;
    return std::nullopt;
}

const char* toString(OutputFormat format) noexcept {
    switch (format) {
        case OutputFormat::Json: return "json";
        case OutputFormat::Yaml: return "yaml";
        default: return "unknown";
    }
}

std::string serializeResult(const Result& result, OutputFormat format) {
    switch (format) {
        case OutputFormat::Json:
            // Invalid UTF-8 in captured output is replaced instead of throwing
            return toJson(result).dump(2, ' ', false, json::error_handler_t::replace);
        case OutputFormat::Yaml:
            return toYaml(result);
    }
    throw ResultFormatError("unsupported output format");
}

Result parseResult(const std::string& text, OutputFormat format) {
    if (format == OutputFormat::Json) {
        try {
            return fromJson(json::parse(text));
        } catch (const json::exception& e) {
            throw ResultFormatError(std::string("invalid JSON result: ") + e.what());
        }
    }
    if (format == OutputFormat::Yaml) {
        try {
            return fromYaml(YAML::Load(text));
        } catch (const YAML::Exception& e) {
            throw ResultFormatError(std::string("invalid YAML result: ") + e.what());
        }
    }
    throw ResultFormatError("unsupported output format");
}

std::string formatTimestamp(Timestamp timestamp) {
    using namespace std::chrono;
    auto seconds = time_point_cast<std::chrono::seconds>(timestamp);
    if (seconds > timestamp) {
        seconds -= std::chrono::seconds(1);
    }
    auto fraction = duration_cast<nanoseconds>(timestamp - seconds).count();

    std::time_t tt = system_clock::to_time_t(seconds);
    std::tm utc{};
    gmtime_r(&tt, &utc);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
    char frac[16];
    std::snprintf(frac, sizeof(frac), ".%0*lld", kFractionDigits, static_cast<long long>(fraction));
    return std::string(date) + frac + "Z";
}

std::optional<Timestamp> parseTimestamp(const std::string& text) noexcept {
    // YYYY-MM-DDTHH:MM:SS, digits and separators at fixed positions
    constexpr std::size_t kDateTimeLength = 19;
    constexpr const char* kLayout = "dddd-dd-ddTdd:dd:dd";
    if (text.size() < kDateTimeLength) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < kDateTimeLength; ++i) {
        bool ok = kLayout[i] == 'd' ? std::isdigit(static_cast<unsigned char>(text[i])) != 0
                                    : text[i] == kLayout[i];
        if (!ok) return std::nullopt;
    }
    auto field = [&text](std::size_t pos, std::size_t width) {
        int value = 0;
        for (std::size_t i = pos; i < pos + width; ++i) {
            value = value * 10 + (text[i] - '0');
        }
        return value;
    };
    int year = field(0, 4);
    int month = field(5, 2);
    int day = field(8, 2);
    int hour = field(11, 2);
    int minute = field(14, 2);
    int second = field(17, 2);

    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    std::size_t pos = kDateTimeLength;
    long long nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits == kFractionDigits) return std::nullopt;
            nanos = nanos * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < kFractionDigits; ++digits) nanos *= 10;
    }

    const char* zone = text.c_str() + pos;
    if (std::strcmp(zone, "Z") != 0 && std::strcmp(zone, "+00:00") != 0) {
        return std::nullopt;
    }

    std::tm utc{};
    utc.tm_year = year - 1900;
    utc.tm_mon = month - 1;
    utc.tm_mday = day;
    utc.tm_hour = hour;
    utc.tm_min = minute;
    utc.tm_sec = second;
    std::time_t tt = timegm(&utc);

    auto timestamp = std::chrono::system_clock::from_time_t(tt);
    return timestamp + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                           std::chrono::nanoseconds(nanos));
}

}
