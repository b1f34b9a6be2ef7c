#include "cypress/Pipeline.hpp"
#include "logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>
#include <fmt/core.h>

using json = nlohmann::json;
using namespace tr::logging;

namespace tr::cypress {

namespace {

TestRecord filterRecord(TestRecord test) {
    TestRecord out;
    out.title = std::move(test.title);
    out.full_title = std::move(test.full_title);
    out.file = std::move(test.file);
    out.duration = test.duration;
    out.current_retry = test.current_retry;
    if (test.err) {
        TestError err;
        err.message = std::move(test.err->message);
        err.name = std::move(test.err->name);
        err.code_frame = std::move(test.err->code_frame);
        out.err = std::move(err);
    }
    return out;
}

std::vector<TestRecord> filterRecords(std::vector<TestRecord> records) {
    std::vector<TestRecord> out;
    out.reserve(records.size());
    for (auto& r : records) out.push_back(filterRecord(std::move(r)));
    return out;
}

}

StageResult<std::string> extractJson(const std::string_view output) {
    const auto start = output.find('{');
    if (start == std::string_view::npos) return StageError{Stage::Extract, std::string{NO_JSON_FOUND}};
    return std::string{output.substr(start)};
}

StageResult<Results> parseResults(const std::string& text) {
    try {
        return json::parse(text).get<Results>();
    } catch (const std::exception& e) {
        return StageError{Stage::Parse, fmt::format("Failed to parse Cypress JSON: {}", e.what())};
    }
}

Results filterResults(Results results) {
    Results out;
    out.stats = std::move(results.stats);
    out.tests = filterRecords(std::move(results.tests));
    out.pending = filterRecords(std::move(results.pending));
    out.failures = filterRecords(std::move(results.failures));
    out.passes = filterRecords(std::move(results.passes));
    return out;
}

StageResult<std::string> serializeResults(const Results& results) {
    try {
        return json(results).dump(2);
    } catch (const json::exception& e) {
        return StageError{Stage::Serialize, fmt::format("Failed to serialize filtered results: {}", e.what())};
    }
}

StageResult<std::string> processOutput(const std::string_view stdoutText) {
    auto extracted = extractJson(stdoutText);
    if (const auto* err = std::get_if<StageError>(&extracted)) {
        LogRegistry::cypress()->warn("[Pipeline] {}", err->message);
        return *err;
    }

    auto parsed = parseResults(std::get<std::string>(extracted));
    if (const auto* err = std::get_if<StageError>(&parsed)) {
        LogRegistry::cypress()->warn("[Pipeline] {}", err->message);
        return *err;
    }

    const auto filtered = filterResults(std::move(std::get<Results>(parsed)));
    LogRegistry::cypress()->debug("[Pipeline] Parsed report: {} tests, {} failures",
                                  filtered.stats.tests, filtered.stats.failures);

    auto serialized = serializeResults(filtered);
    if (const auto* err = std::get_if<StageError>(&serialized))
        LogRegistry::cypress()->warn("[Pipeline] {}", err->message);
    return serialized;
}

std::string_view describe(const Stage stage) {
    switch (stage) {
    case Stage::Extract: return "Failed to extract JSON from Cypress output";
    case Stage::Parse: return "Failed to parse Cypress results";
    case Stage::Serialize: return "Failed to serialize Cypress results";
    }
    return "Failed to process Cypress output";
}

}
