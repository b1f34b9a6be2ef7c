#pragma once

#include "process/Invocation.hpp"
#include "validation/FileTarget.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tr::process {

inline constexpr std::string_view SHELL_PATH = "/bin/sh";
inline constexpr std::string_view SHELL_ARGV0 = "testrunner";

// Trusted, pre-split command prefix taken from configuration. The first token is the program.
class CommandTemplate {
public:
    explicit CommandTemplate(std::vector<std::string> tokens);

    [[nodiscard]] const std::string& program() const { return tokens_.front(); }
    [[nodiscard]] std::vector<std::string> leadingArgs() const;
    [[nodiscard]] const std::vector<std::string>& tokens() const { return tokens_; }

private:
    std::vector<std::string> tokens_;
};

// "spec/a_spec.rb" or "spec/a_spec.rb:37:87", line numbers in caller order
[[nodiscard]] std::string formatTargetArgument(const validation::ValidatedFileTarget& target);

[[nodiscard]] Invocation buildTargetInvocation(const CommandTemplate& command,
                                               const std::vector<std::string>& defaultArgs,
                                               const validation::ValidatedFileTarget& target);

// Tokens must already have passed validation::validateArguments
[[nodiscard]] Invocation buildArgumentInvocation(const CommandTemplate& command,
                                                 const std::vector<std::string>& tokens);

/**
 * For commands that are genuinely a multi-stage pipeline ("cd e2e && npx cypress run --spec").
 * Produces `/bin/sh -c '<pipeline> "$1"' testrunner <path>`: the path reaches the shell as a
 * positional parameter and is never spliced into the script text.
 */
[[nodiscard]] Invocation buildShellInvocation(const std::string& pipeline, const std::string& path);

}
