#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace tr::cypress {

// Field names and shapes mirror the report printed by `cypress run --reporter json`.

struct Stats {
    uint32_t suites{}, tests{}, passes{}, pending{}, failures{};
    std::string start, end;
    uint32_t duration{};
};

struct CodeFrame {
    uint32_t line{}, column{};
    std::string original_file, relative_file, absolute_file;
    std::string frame, language;
};

struct TestError {
    std::string message, name;
    std::optional<CodeFrame> code_frame{std::nullopt};
};

struct TestRecord {
    std::string title, full_title;
    std::optional<std::string> file{std::nullopt};
    std::optional<uint32_t> duration{std::nullopt};
    uint32_t current_retry{};
    std::optional<TestError> err{std::nullopt};
};

struct Results {
    Stats stats;
    std::vector<TestRecord> tests, pending, failures, passes;
};

void to_json(nlohmann::json& j, const Stats& s);
void from_json(const nlohmann::json& j, Stats& s);
void to_json(nlohmann::json& j, const CodeFrame& f);
void from_json(const nlohmann::json& j, CodeFrame& f);
void to_json(nlohmann::json& j, const TestError& e);
void from_json(const nlohmann::json& j, TestError& e);
void to_json(nlohmann::json& j, const TestRecord& t);
void from_json(const nlohmann::json& j, TestRecord& t);
void to_json(nlohmann::json& j, const Results& r);
void from_json(const nlohmann::json& j, Results& r);

}
