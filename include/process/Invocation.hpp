#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tr::process {

struct Invocation {
    std::string program;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> working_dir{std::nullopt};

    [[nodiscard]] std::vector<std::string> argv() const;

    // Display form of argv; tokens with whitespace or quotes are double-quoted
    [[nodiscard]] std::string commandLine() const;
};

struct ExecutionResult {
    std::optional<int> exit_code{std::nullopt};   // unset when the child was killed by a signal
    std::optional<int> term_signal{std::nullopt};
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] bool succeeded() const { return exit_code && *exit_code == 0; }
    [[nodiscard]] std::string exitCodeString() const;
};

}
