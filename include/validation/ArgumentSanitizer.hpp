#pragma once

#include "validation/Check.hpp"
#include "validation/errors.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tr::validation {

inline constexpr std::size_t MAX_ARGUMENTS = 50;
inline constexpr std::size_t MAX_ARGUMENT_LENGTH = 1000;
inline constexpr std::string_view DANGEROUS_CHARACTERS = ";&|$`()<>\"'";

// Shape of the value a flag takes
enum class FlagValue {
    None,        // --dry-run
    Optional,    // --profile [N]
    OutputPath,  // --out tmp/results.txt
    RequirePath, // --require support/helper.rb
    Seed,        // --seed 1234
    Free         // --format, --tag, --example, ... (sanitized only)
};

struct FlagRule {
    std::string_view name;
    FlagValue value;
};

[[nodiscard]] const std::vector<FlagRule>& flagAllowlist();
[[nodiscard]] const std::vector<std::string_view>& allowedOutputDirectories();

// Character and length check applied to every token, flag or value
[[nodiscard]] Check<ArgumentError> sanitizeToken(std::string_view token, std::size_t index);

/**
 * Validates a flat RSpec argument list. All-or-nothing: any bad token rejects the whole list.
 * Flags are default-deny against flagAllowlist(); tokens that are not flags must be RSpec
 * spec file paths.
 */
[[nodiscard]] Check<ArgumentError> validateArguments(const std::vector<std::string>& tokens);

}
