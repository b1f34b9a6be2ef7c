#pragma once

#include "validation/FileKind.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace tr::validation {

namespace path_error {

struct InvalidCharacters { std::string path; };
struct Traversal { std::string path; };
struct WrongKind { std::string path; FileKind expected; };
struct Malformed { std::string path; };

}

using PathError = std::variant<
    path_error::InvalidCharacters,
    path_error::Traversal,
    path_error::WrongKind,
    path_error::Malformed
>;

struct LineNumberError {
    int64_t value{};
    std::size_t index{};
};

namespace argument_error {

struct TooManyArguments { std::size_t count; };
struct ArgumentTooLong { std::size_t index; std::size_t length; };
struct DangerousCharacter { std::string token; char character; };
struct DisallowedFlag { std::string flag; };
struct MissingValue { std::string flag; };
struct InvalidValue { std::string flag; std::string value; std::string reason; };
struct InvalidPath { PathError error; };

}

using ArgumentError = std::variant<
    argument_error::TooManyArguments,
    argument_error::ArgumentTooLong,
    argument_error::DangerousCharacter,
    argument_error::DisallowedFlag,
    argument_error::MissingValue,
    argument_error::InvalidValue,
    argument_error::InvalidPath
>;

using TargetError = std::variant<PathError, LineNumberError>;

[[nodiscard]] std::string describe(const PathError& e);
[[nodiscard]] std::string describe(const LineNumberError& e);
[[nodiscard]] std::string describe(const ArgumentError& e);
[[nodiscard]] std::string describe(const TargetError& e);

}
