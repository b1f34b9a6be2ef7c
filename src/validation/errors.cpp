#include "validation/errors.hpp"
#include "util/Overloaded.hpp"

#include <fmt/core.h>

using namespace tr::util;

namespace tr::validation {

namespace {

std::string expectedSuffixes(const FileKind kind) {
    std::string out;
    for (const auto& suffix : suffixesFor(kind)) {
        if (!out.empty()) out += "' or '";
        out += suffix;
    }
    return "'" + out + "'";
}

}

std::string describe(const PathError& e) {
    return std::visit(Overloaded{
        [](const path_error::InvalidCharacters& err) -> std::string {
            return fmt::format("Invalid file path '{}': contains invalid characters (NUL or newline)", err.path);
        },
        [](const path_error::Traversal& err) -> std::string {
            return fmt::format("Invalid file path '{}': path traversal ('../') is not allowed", err.path);
        },
        [](const path_error::WrongKind& err) -> std::string {
            return fmt::format("Invalid file path '{}': {} test files must end with {}",
                               err.path, to_string(err.expected), expectedSuffixes(err.expected));
        },
        [](const path_error::Malformed& err) -> std::string {
            return fmt::format("Invalid file path '{}': file name is missing before the suffix", err.path);
        }
    }, e);
}

std::string describe(const LineNumberError& e) {
    return fmt::format("Invalid line number {} at position {}: line numbers must be positive integers",
                       e.value, e.index);
}

std::string describe(const ArgumentError& e) {
    return std::visit(Overloaded{
        [](const argument_error::TooManyArguments& err) -> std::string {
            return fmt::format("Too many arguments: {} given, at most 50 allowed", err.count);
        },
        [](const argument_error::ArgumentTooLong& err) -> std::string {
            return fmt::format("Argument {} is too long: {} characters, at most 1000 allowed", err.index, err.length);
        },
        [](const argument_error::DangerousCharacter& err) -> std::string {
            return fmt::format("Argument '{}' contains dangerous character '{}'", err.token, err.character);
        },
        [](const argument_error::DisallowedFlag& err) -> std::string {
            return fmt::format("Flag '{}' is not allowed", err.flag);
        },
        [](const argument_error::MissingValue& err) -> std::string {
            return fmt::format("Flag '{}' requires a value", err.flag);
        },
        [](const argument_error::InvalidValue& err) -> std::string {
            return fmt::format("Invalid value '{}' for flag '{}': {}", err.value, err.flag, err.reason);
        },
        [](const argument_error::InvalidPath& err) -> std::string {
            return describe(err.error);
        }
    }, e);
}

std::string describe(const TargetError& e) {
    return std::visit([](const auto& err) { return describe(err); }, e);
}

}
