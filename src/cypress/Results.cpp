#include "cypress/Results.hpp"

#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <fmt/core.h>

using json = nlohmann::json;

namespace tr::cypress {

namespace {

uint32_t toU32(const json& v, const char* key) {
    if (!v.is_number_unsigned() || v.get<uint64_t>() > std::numeric_limits<uint32_t>::max())
        throw std::invalid_argument(fmt::format("field '{}' must be an unsigned 32-bit integer, got {}", key, v.dump()));
    return v.get<uint32_t>();
}

uint32_t requireU32(const json& j, const char* key) { return toU32(j.at(key), key); }

std::string requireString(const json& j, const char* key) {
    const auto& v = j.at(key);
    if (!v.is_string()) throw std::invalid_argument(fmt::format("field '{}' must be a string, got {}", key, v.dump()));
    return v.get<std::string>();
}

const json* optionalField(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    return &*it;
}

std::vector<TestRecord> requireRecords(const json& j, const char* key) {
    const auto& v = j.at(key);
    if (!v.is_array()) throw std::invalid_argument(fmt::format("field '{}' must be an array", key));
    return v.get<std::vector<TestRecord>>();
}

template <typename T>
json nullable(const std::optional<T>& v) {
    if (v) return json(*v);
    return nullptr;
}

}

void to_json(json& j, const Stats& s) {
    j = {
        {"suites", s.suites},
        {"tests", s.tests},
        {"passes", s.passes},
        {"pending", s.pending},
        {"failures", s.failures},
        {"start", s.start},
        {"end", s.end},
        {"duration", s.duration}
    };
}

void from_json(const json& j, Stats& s) {
    s.suites = requireU32(j, "suites");
    s.tests = requireU32(j, "tests");
    s.passes = requireU32(j, "passes");
    s.pending = requireU32(j, "pending");
    s.failures = requireU32(j, "failures");
    s.start = requireString(j, "start");
    s.end = requireString(j, "end");
    s.duration = requireU32(j, "duration");
}

void to_json(json& j, const CodeFrame& f) {
    j = {
        {"line", f.line},
        {"column", f.column},
        {"originalFile", f.original_file},
        {"relativeFile", f.relative_file},
        {"absoluteFile", f.absolute_file},
        {"frame", f.frame},
        {"language", f.language}
    };
}

void from_json(const json& j, CodeFrame& f) {
    f.line = requireU32(j, "line");
    f.column = requireU32(j, "column");
    f.original_file = requireString(j, "originalFile");
    f.relative_file = requireString(j, "relativeFile");
    f.absolute_file = requireString(j, "absoluteFile");
    f.frame = requireString(j, "frame");
    f.language = requireString(j, "language");
}

void to_json(json& j, const TestError& e) {
    j = {
        {"message", e.message},
        {"name", e.name},
        {"codeFrame", nullable(e.code_frame)}
    };
}

void from_json(const json& j, TestError& e) {
    e.message = requireString(j, "message");
    e.name = requireString(j, "name");
    if (const auto* frame = optionalField(j, "codeFrame")) e.code_frame = frame->get<CodeFrame>();
    else e.code_frame = std::nullopt;
}

void to_json(json& j, const TestRecord& t) {
    j = {
        {"title", t.title},
        {"fullTitle", t.full_title},
        {"file", nullable(t.file)},
        {"duration", nullable(t.duration)},
        {"currentRetry", t.current_retry},
        {"err", nullable(t.err)}
    };
}

void from_json(const json& j, TestRecord& t) {
    t.title = requireString(j, "title");
    t.full_title = requireString(j, "fullTitle");
    t.current_retry = requireU32(j, "currentRetry");

    if (const auto* file = optionalField(j, "file")) {
        if (!file->is_string()) throw std::invalid_argument("field 'file' must be a string or null");
        t.file = file->get<std::string>();
    } else t.file = std::nullopt;

    if (const auto* duration = optionalField(j, "duration")) t.duration = toU32(*duration, "duration");
    else t.duration = std::nullopt;

    if (const auto* err = optionalField(j, "err")) t.err = err->get<TestError>();
    else t.err = std::nullopt;
}

void to_json(json& j, const Results& r) {
    j = {
        {"stats", r.stats},
        {"tests", r.tests},
        {"pending", r.pending},
        {"failures", r.failures},
        {"passes", r.passes}
    };
}

void from_json(const json& j, Results& r) {
    if (!j.is_object()) throw std::invalid_argument("report must be a JSON object");
    r.stats = j.at("stats").get<Stats>();
    r.tests = requireRecords(j, "tests");
    r.pending = requireRecords(j, "pending");
    r.failures = requireRecords(j, "failures");
    r.passes = requireRecords(j, "passes");
}

}
