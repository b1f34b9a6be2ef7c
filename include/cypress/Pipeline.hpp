#pragma once

#include "cypress/Results.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace tr::cypress {

enum class Stage { Extract, Parse, Serialize };

struct StageError {
    Stage stage;
    std::string message;
};

template <typename T> using StageResult = std::variant<T, StageError>;

inline constexpr std::string_view NO_JSON_FOUND = "No JSON found in Cypress output";

// Everything from the first '{' onwards; Electron and dbus warnings usually precede the report
[[nodiscard]] StageResult<std::string> extractJson(std::string_view output);

[[nodiscard]] StageResult<Results> parseResults(const std::string& json);

// Same-shape projection of every test record. Currently keeps the full field set.
[[nodiscard]] Results filterResults(Results results);

[[nodiscard]] StageResult<std::string> serializeResults(const Results& results);

// Runs all four stages over captured stdout; yields pretty-printed JSON or the first failing stage
[[nodiscard]] StageResult<std::string> processOutput(std::string_view stdoutText);

[[nodiscard]] std::string_view describe(Stage stage);

}
