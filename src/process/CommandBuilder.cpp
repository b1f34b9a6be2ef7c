#include "process/CommandBuilder.hpp"

#include <stdexcept>
#include <fmt/core.h>

using namespace tr::validation;

namespace tr::process {

CommandTemplate::CommandTemplate(std::vector<std::string> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty()) throw std::invalid_argument("CommandTemplate: command must contain at least a program");
    if (tokens_.front().empty()) throw std::invalid_argument("CommandTemplate: program name must not be empty");
}

std::vector<std::string> CommandTemplate::leadingArgs() const {
    return {tokens_.begin() + 1, tokens_.end()};
}

std::string formatTargetArgument(const ValidatedFileTarget& target) {
    std::string out = target.path();
    for (const auto line : target.lineNumbers()) out += fmt::format(":{}", line);
    return out;
}

Invocation buildTargetInvocation(const CommandTemplate& command,
                                 const std::vector<std::string>& defaultArgs,
                                 const ValidatedFileTarget& target) {
    Invocation inv{command.program(), command.leadingArgs()};
    inv.args.insert(inv.args.end(), defaultArgs.begin(), defaultArgs.end());
    inv.args.push_back(formatTargetArgument(target));
    return inv;
}

Invocation buildArgumentInvocation(const CommandTemplate& command, const std::vector<std::string>& tokens) {
    Invocation inv{command.program(), command.leadingArgs()};
    inv.args.insert(inv.args.end(), tokens.begin(), tokens.end());
    return inv;
}

Invocation buildShellInvocation(const std::string& pipeline, const std::string& path) {
    if (pipeline.empty()) throw std::invalid_argument("buildShellInvocation: pipeline must not be empty");
    return {
        std::string{SHELL_PATH},
        {"-c", pipeline + " \"$1\"", std::string{SHELL_ARGV0}, path}
    };
}

}
